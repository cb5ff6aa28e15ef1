/*
 * synext - Syntax extension expansion core
 *
 * ast/mut_visit.cpp
 * - Mutating walk over AST fragments
 */
#include "mut_visit.hpp"

namespace AST {

namespace {
    /// Forwards each child expression of a node back to the owning visitor
    class ExprChildVisitor:
        public NodeVisitorDef
    {
        MutVisitor& m_owner;
    public:
        ExprChildVisitor(MutVisitor& owner):
            m_owner(owner)
        {}
        using NodeVisitorDef::visit;
        void visit(ExprNodeP& cnode) override {
            m_owner.visit_expr(cnode);
        }
    };
}

MutVisitor::~MutVisitor()
{
}

void MutVisitor::visit_fragment(AstFragment& frag)
{
    TU_MATCH_HDRA( (frag), {)
    TU_ARMA(Expr, e)    visit_expr(e);
    TU_ARMA(Pat, e)     visit_pat(e);
    TU_ARMA(Ty, e)      visit_ty(e);
    TU_ARMA(Stmts, e)   visit_stmts(e);
    TU_ARMA(Items, e)   visit_items(e);
    TU_ARMA(TraitItems, e)  visit_trait_items(e);
    TU_ARMA(ImplItems, e)   visit_impl_items(e);
    TU_ARMA(ForeignItems, e)    visit_foreign_items(e);
    }
}

void MutVisitor::visit_items(::std::vector<Item>& items)
{
    for(auto& i : items)
        visit_item(i);
}
void MutVisitor::visit_item(Item& i)
{
    TU_MATCH_HDRA( (i.data), {)
    TU_ARMA(None, e) (void)e;
    TU_ARMA(MacroInv, e) (void)e;
    TU_ARMA(Struct, e) {
        for(auto& f : e.fields)
            visit_ty(f.ty);
        }
    TU_ARMA(Enum, e) {
        for(auto& v : e.variants)
            for(auto& f : v.fields)
                visit_ty(f.ty);
        }
    TU_ARMA(Union, e) {
        for(auto& f : e.fields)
            visit_ty(f.ty);
        }
    TU_ARMA(Static, e) {
        visit_ty(e.type);
        visit_expr(e.value);
        }
    TU_ARMA(Impl, e) {
        visit_ty(e.self_ty);
        visit_impl_items(e.items);
        }
    TU_ARMA(Trait, e)       visit_trait_items(e.items);
    TU_ARMA(Mod, e)         visit_items(e.items);
    TU_ARMA(ForeignMod, e)  visit_foreign_items(e.items);
    }
}
void MutVisitor::visit_impl_items(::std::vector<ImplItem>& items)
{
    for(auto& i : items)
        visit_assoc_item(i);
}
void MutVisitor::visit_trait_items(::std::vector<TraitItem>& items)
{
    for(auto& i : items)
        visit_assoc_item(i);
}
void MutVisitor::visit_foreign_items(::std::vector<ForeignItem>& items)
{
    for(auto& i : items)
        visit_assoc_item(i);
}
void MutVisitor::visit_assoc_item(AssocItem& i)
{
    TU_MATCH_HDRA( (i.data), {)
    TU_ARMA(None, e) (void)e;
    TU_ARMA(Macro, e) (void)e;
    TU_ARMA(Const, e) {
        visit_ty(e.type);
        visit_expr(e.value);
        }
    TU_ARMA(Static, e)
        visit_ty(e.type);
    TU_ARMA(Type, e) {
        if( e.type )
            visit_ty(*e.type);
        }
    }
}
void MutVisitor::visit_stmts(::std::vector<Stmt>& stmts)
{
    for(auto& s : stmts)
        visit_stmt(s);
}
void MutVisitor::visit_stmt(Stmt& s)
{
    TU_MATCH_HDRA( (s.data), {)
    TU_ARMA(Empty, e) (void)e;
    TU_ARMA(Macro, e) (void)e;
    TU_ARMA(Expr, e)    visit_expr(e);
    TU_ARMA(Semi, e)    visit_expr(e.expr);
    TU_ARMA(Item, e)    visit_item(*e);
    TU_ARMA(Local, e) {
        visit_pat(e.pat);
        if( e.ty )
            visit_ty(*e.ty);
        visit_expr(e.init);
        }
    }
}
void MutVisitor::visit_expr(ExprNodeP& e)
{
    if( e )
    {
        ExprChildVisitor    v(*this);
        e->visit(v);
    }
}
void MutVisitor::visit_pat(Pattern& p)
{
    TU_MATCH_HDRA( (p.data()), {)
    TU_ARMA(Any, e) (void)e;
    TU_ARMA(MaybeBind, e) (void)e;
    TU_ARMA(Macro, e) (void)e;
    TU_ARMA(Value, e)
        visit_expr(e.val);
    TU_ARMA(Tuple, e) {
        for(auto& sp : e)
            visit_pat(sp);
        }
    }
}
void MutVisitor::visit_ty(TypeRef& t)
{
    TU_MATCH_HDRA( (t.m_data), {)
    TU_ARMA(Err, e) (void)e;
    TU_ARMA(Infer, e) (void)e;
    TU_ARMA(Path, e) (void)e;
    TU_ARMA(Macro, e) (void)e;
    TU_ARMA(Tuple, e) {
        for(auto& st : e)
            visit_ty(st);
        }
    TU_ARMA(Borrow, e)
        visit_ty(*e.inner);
    TU_ARMA(Array, e) {
        visit_ty(*e.inner);
        visit_expr(e.size);
        }
    }
}

}   // namespace AST
