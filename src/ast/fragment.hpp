/*
 * synext - Syntax extension expansion core
 *
 * ast/fragment.hpp
 * - Macro output fragments, and the inputs to attribute/derive macros
 */
#pragma once

#include "ast.hpp"

namespace AST {

/// Syntactic category of a macro call site (and so of its output)
enum class AstFragmentKind
{
    Expr,
    Pat,
    Ty,
    Stmts,
    Items,
    TraitItems,
    ImplItems,
    ForeignItems,
};
extern const char* AstFragmentKind_name(AstFragmentKind k);
extern ::std::ostream& operator<<(::std::ostream& os, const AstFragmentKind& x);

TAGGED_UNION_EX(AstFragment, (), Expr, (
    (Expr, ExprNodeP),
    (Pat, Pattern),
    (Ty, TypeRef),
    (Stmts, ::std::vector<Stmt>),
    (Items, ::std::vector<::AST::Item>),
    (TraitItems, ::std::vector<TraitItem>),
    (ImplItems, ::std::vector<ImplItem>),
    (ForeignItems, ::std::vector<ForeignItem>)
    ), (
    AstFragmentKind kind() const;
    AstFragment clone() const;
    ));
extern ::std::ostream& operator<<(::std::ostream& os, const AstFragment& x);

/// Target of an attribute or derive macro
TAGGED_UNION_EX(Annotatable, (), Item, (
    (Item, ::std::unique_ptr<::AST::Item>),
    (TraitItem, ::std::unique_ptr<::AST::TraitItem>),
    (ImplItem, ::std::unique_ptr<::AST::ImplItem>),
    (ForeignItem, ::std::unique_ptr<::AST::ForeignItem>),
    (Stmt, ::std::unique_ptr<::AST::Stmt>),
    (Expr, ExprNodeP)
    ), (
    static Annotatable from_item(::AST::Item i) { return Annotatable(box$(i)); }

    const Span& span() const;
    const AttributeList& attrs() const;
    AttributeList& attrs();
    /// Only structs, enums and unions can be derived on
    bool derive_allowed() const;

    ::AST::Item expect_item();
    ::AST::TraitItem expect_trait_item();
    ::AST::ImplItem expect_impl_item();
    ::AST::ForeignItem expect_foreign_item();
    ::AST::Stmt expect_stmt();
    ExprNodeP expect_expr();

    Annotatable clone() const;
    ));
extern ::std::ostream& operator<<(::std::ostream& os, const Annotatable& x);

/// Convert the output of an attribute macro back into a fragment of the given kind
extern AstFragment expect_from_annotatables(const Span& sp, AstFragmentKind kind, ::std::vector<Annotatable> items);

}   // namespace AST
