/*
 * synext - Syntax extension expansion core
 *
 * expand/expander.hpp
 * - Fixed-point macro expansion of an AST fragment
 */
#pragma once

#include <ast/fragment.hpp>
#include "ext_ctxt.hpp"

/// Expands every macro in a fragment
///
/// Call sites are replaced by placeholders and queued. Queued invocations are
/// resolved and run in passes until none remain (an unresolvable macro is
/// retried until the resolver is forced to decide). Outputs are collected in
/// turn and finally spliced in where the placeholders were.
class MacroExpander
{
    ExtCtxt&    m_cx;
    /// Set for the top-level expansion (and unset for eager expansion)
    bool    m_monotonic;
public:
    MacroExpander(ExtCtxt& cx, bool monotonic):
        m_cx(cx),
        m_monotonic(monotonic)
    {}

    AST::AstFragment fully_expand_fragment(AST::AstFragment input);

    /// Parse macro output as the given kind, reporting (and replacing with a dummy) on error
    AST::AstFragment parse_ast_fragment(const TokenTree& toks, AST::AstFragmentKind kind, const AST::Path& path, const Span& sp);

private:
    struct Collected;
    Collected collect_invocations(AST::AstFragment fragment, const ExpansionData& parent_data);

    /// Run one invocation (the expansion frame has been entered)
    AST::AstFragment expand_invoc(Invocation invoc, const ::std::shared_ptr<SyntaxExtension>& ext);
    AST::AstFragment expand_derives(Invocation invoc, const ::std::vector< ::std::shared_ptr<SyntaxExtension> >& exts);
    /// Report a macro used as the wrong kind (the invocation's output becomes a dummy)
    AST::AstFragment kind_mismatch(Invocation& invoc, const SyntaxExtension& ext);
};

/// Tokens for an annotatable item (as passed to token-based attribute and derive macros)
extern TokenTree Expand_AnnotatableToTokens(const AST::Annotatable& item);

