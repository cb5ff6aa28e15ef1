/*
 * synext - Syntax extension expansion core
 *
 * expand/mac_result.hpp
 * - Results of structured (legacy) function-like macros
 */
#pragma once

#include <memory>
#include <vector>
#include <rustic.hpp>
#include <ast/fragment.hpp>

/// Output of an `ExpandLegacyMacro`
///
/// The expander asks for the fragment kind of the call site, a `None` return
/// means the macro cannot be used in that position. Each result is used once.
class MacResult
{
public:
    virtual ~MacResult();

    virtual rust::option<AST::ExprNodeP> make_expr();
    virtual rust::option<AST::Pattern> make_pat();
    virtual rust::option<TypeRef> make_ty();
    virtual rust::option< ::std::vector<AST::Item> > make_items();
    virtual rust::option< ::std::vector<AST::ImplItem> > make_impl_items();
    virtual rust::option< ::std::vector<AST::TraitItem> > make_trait_items();
    virtual rust::option< ::std::vector<AST::ForeignItem> > make_foreign_items();
    /// Default: a single statement holding the result of `make_expr`
    virtual rust::option< ::std::vector<AST::Stmt> > make_stmts();
};

/// Convert a result to a fragment of the requested kind (none if the result declines)
extern rust::option<AST::AstFragment> MacResult_make(::std::unique_ptr<MacResult> result, AST::AstFragmentKind kind);

/// A result with one (or more) of the slots filled ahead of time
class MacEager:
    public MacResult
{
public:
    rust::option<AST::ExprNodeP>    expr;
    rust::option<AST::Pattern>  pat;
    rust::option<TypeRef>   ty;
    rust::option< ::std::vector<AST::Item> >  items;
    rust::option< ::std::vector<AST::ImplItem> >  impl_items;
    rust::option< ::std::vector<AST::TraitItem> > trait_items;
    rust::option< ::std::vector<AST::ForeignItem> >   foreign_items;
    rust::option< ::std::vector<AST::Stmt> >  stmts;

    static ::std::unique_ptr<MacResult> new_expr(AST::ExprNodeP v);
    static ::std::unique_ptr<MacResult> new_pat(AST::Pattern v);
    static ::std::unique_ptr<MacResult> new_ty(TypeRef v);
    static ::std::unique_ptr<MacResult> new_items(::std::vector<AST::Item> v);
    static ::std::unique_ptr<MacResult> new_impl_items(::std::vector<AST::ImplItem> v);
    static ::std::unique_ptr<MacResult> new_trait_items(::std::vector<AST::TraitItem> v);
    static ::std::unique_ptr<MacResult> new_foreign_items(::std::vector<AST::ForeignItem> v);
    static ::std::unique_ptr<MacResult> new_stmts(::std::vector<AST::Stmt> v);

    rust::option<AST::ExprNodeP> make_expr() override;
    /// The pattern slot, or a literal expression used as a pattern
    rust::option<AST::Pattern> make_pat() override;
    rust::option<TypeRef> make_ty() override;
    rust::option< ::std::vector<AST::Item> > make_items() override;
    rust::option< ::std::vector<AST::ImplItem> > make_impl_items() override;
    rust::option< ::std::vector<AST::TraitItem> > make_trait_items() override;
    rust::option< ::std::vector<AST::ForeignItem> > make_foreign_items() override;
    rust::option< ::std::vector<AST::Stmt> > make_stmts() override;
};

/// Placeholder result used after an error (or by macros that expand to nothing)
///
/// Usable in any position: expressions and types become error markers (or `()`
/// when `is_error` is false), patterns become `_`, and item lists are empty.
class DummyResult:
    public MacResult
{
    bool    m_is_error;
    Span    m_span;
public:
    DummyResult(bool is_error, Span sp):
        m_is_error(is_error),
        m_span(mv$(sp))
    {}

    /// Result for an expansion that already reported an error
    static ::std::unique_ptr<MacResult> any(Span sp);
    /// Result for a macro that expands to nothing (no error)
    static ::std::unique_ptr<MacResult> any_valid(Span sp);

    static AST::ExprNodeP raw_expr(Span sp, bool is_error);
    static AST::Pattern raw_pat(Span sp);
    static TypeRef raw_ty(Span sp, bool is_error);

    /// An error placeholder fragment of the given kind
    static AST::AstFragment make_fragment(Span sp, AST::AstFragmentKind kind);

    rust::option<AST::ExprNodeP> make_expr() override;
    rust::option<AST::Pattern> make_pat() override;
    rust::option<TypeRef> make_ty() override;
    rust::option< ::std::vector<AST::Item> > make_items() override;
    rust::option< ::std::vector<AST::ImplItem> > make_impl_items() override;
    rust::option< ::std::vector<AST::TraitItem> > make_trait_items() override;
    rust::option< ::std::vector<AST::ForeignItem> > make_foreign_items() override;
    rust::option< ::std::vector<AST::Stmt> > make_stmts() override;
};

