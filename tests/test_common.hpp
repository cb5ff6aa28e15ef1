/*
 * synext - Syntax extension expansion core
 *
 * tests/test_common.hpp
 * - Shared fixtures for the unit tests (resolver, emitter, parse helpers)
 */
#pragma once

#include <gtest/gtest.h>
#include <functional>
#include <map>
#include <common.hpp>
#include <parse_sess.hpp>
#include <synext.hpp>
#include <synext_macro.hpp>
#include <synext_decorator.hpp>
#include <expand/ext_ctxt.hpp>
#include <expand/expander.hpp>
#include <expand/mac_result.hpp>
#include <expand/resolver.hpp>
#include <parse/lex.hpp>
#include <parse/ttstream.hpp>
#include <parse/common.hpp>
#include <ast/expr.hpp>

/// Records every diagnostic instead of printing it
class CapturingEmitter:
    public Diagnostics::Emitter
{
public:
    ::std::vector<Diagnostics::Diagnostic>  diags;

    void emit(const Diagnostics::Diagnostic& d) override {
        diags.push_back(d);
    }

    /// Number of diagnostics at the given level whose message contains `text`
    size_t count(Diagnostics::Level level, const ::std::string& text) const;
    bool has_error(const ::std::string& text) const { return count(Diagnostics::Level::Error, text) > 0; }
    bool has_warning(const ::std::string& text) const { return count(Diagnostics::Level::Warning, text) > 0; }
    size_t error_count() const;
};

/// Name-table resolver with scripted indeterminate answers
class TestResolver:
    public Resolver
{
    AST::NodeId m_next_id = 0;
public:
    ::std::map< ::std::string, ::std::shared_ptr<SyntaxExtension> >    macros;
    /// Number of unforced resolutions of a name to answer with `Indeterminate`
    ::std::map< ::std::string, unsigned int>    indeterminate_passes;
    /// `(name, force)` for each resolution request, in order
    ::std::vector< ::std::pair< ::std::string, bool> >  resolve_log;
    ::std::map<ExpnId, SpecialDerives>  special_derives;
    unsigned int    unused_checks = 0;
    /// Expansion owning each module (unlisted modules belong to the root)
    ::std::map<AST::NodeId, ExpnId> module_scopes;
    /// Fragments reported through `visit_ast_fragment_with_placeholders`
    unsigned int    fragments_visited = 0;

    AST::NodeId next_node_id() override { return m_next_id ++; }
    ExpnId get_module_scope(AST::NodeId module_id) override;
    void register_builtin_macro(Ident name, ::std::shared_ptr<SyntaxExtension> ext) override;
    ResolveResult resolve_macro_invocation(const Invocation& invoc, ExpnId eager_expansion_root, bool force) override;
    void visit_ast_fragment_with_placeholders(ExpnId expansion, const AST::AstFragment& fragment) override;
    void check_unused_macros() override { unused_checks ++; }
    bool has_derives(ExpnId expn_id, SpecialDerives derives) const override;
    void add_derives(ExpnId expn_id, SpecialDerives derives) override;

    void add(const char* name, SyntaxExtension ext) {
        macros[name] = ::std::make_shared<SyntaxExtension>(mv$(ext));
    }
};

// --- Extensions built from callbacks ---
typedef ::std::function<TokenTree(ExtCtxt&, const Span&, const TokenTree&)>  BangFcn;
typedef ::std::function< ::std::unique_ptr<MacResult>(ExtCtxt&, const Span&, const TokenTree&)>   LegacyBangFcn;
typedef ::std::function<TokenTree(ExtCtxt&, const Span&, const TokenTree&, const TokenTree&)>  AttrFcn;
typedef ::std::function< ::std::vector<AST::Annotatable>(ExtCtxt&, const Span&, const AST::Attribute&, AST::Annotatable)>  LegacyAttrFcn;
typedef ::std::function<TokenTree(ExtCtxt&, const Span&, const TokenTree&)>  DeriveFcn;
typedef ::std::function< ::std::vector<AST::Annotatable>(ExtCtxt&, const Span&, const AST::Path&, const AST::Annotatable&)>  LegacyDeriveFcn;

extern SyntaxExtension make_bang(BangFcn f);
extern SyntaxExtension make_legacy_bang(LegacyBangFcn f);
extern SyntaxExtension make_attr(AttrFcn f);
extern SyntaxExtension make_legacy_attr(LegacyAttrFcn f);
extern SyntaxExtension make_derive(DeriveFcn f, ::std::vector<RcString> helper_attrs={});
extern SyntaxExtension make_legacy_derive(LegacyDeriveFcn f);

// --- Source helpers ---
/// A span in `test.rs`
extern Span test_span(unsigned int line, unsigned int ofs);
extern TokenTree lex(const ::std::string& source);
extern AST::AstFragment parse_fragment(const ::std::string& source, AST::AstFragmentKind kind);
extern ::std::vector<AST::Item> parse_items(const ::std::string& source);
extern AST::ExprNodeP parse_expr(const ::std::string& source);

/// Session, resolver and context for expansion tests
class ExpandTest:
    public ::testing::Test
{
protected:
    CapturingEmitter*   emitter;
    ParseSess   sess;
    TestResolver    resolver;
    ExtCtxt cx;

    ExpandTest();

    /// Fully expand the source as a fragment of the given kind
    AST::AstFragment expand(const ::std::string& source, AST::AstFragmentKind kind);
    ::std::vector<AST::Item> expand_items(const ::std::string& source);
    AST::ExprNodeP expand_expr(const ::std::string& source);
    /// Register the built-in extensions
    void add_builtins();
};

/// Printed form of a node (for comparisons)
template<typename T>
::std::string to_str(const T& v) { return FMT(v); }
