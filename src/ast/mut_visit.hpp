/*
 * synext - Syntax extension expansion core
 *
 * ast/mut_visit.hpp
 * - Mutating walk over AST fragments
 *
 * The default methods visit every child. Overrides replace nodes in place
 * (via the reference) and call the default to continue the walk.
 */
#pragma once

#include "fragment.hpp"

namespace AST {

class MutVisitor
{
public:
    virtual ~MutVisitor();

    virtual void visit_fragment(AstFragment& frag);

    virtual void visit_items(::std::vector<Item>& items);
    virtual void visit_item(Item& i);
    virtual void visit_impl_items(::std::vector<ImplItem>& items);
    virtual void visit_trait_items(::std::vector<TraitItem>& items);
    virtual void visit_foreign_items(::std::vector<ForeignItem>& items);
    virtual void visit_assoc_item(AssocItem& i);
    virtual void visit_stmts(::std::vector<Stmt>& stmts);
    virtual void visit_stmt(Stmt& s);
    virtual void visit_expr(ExprNodeP& e);
    virtual void visit_pat(Pattern& p);
    virtual void visit_ty(TypeRef& t);
};

}   // namespace AST

