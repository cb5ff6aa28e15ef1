/*
 * synext - Syntax extension expansion core
 *
 * ast/fragment.cpp
 * - Macro output fragments
 */
#include "fragment.hpp"

namespace AST {

namespace {
    template<typename T>
    ::std::vector<T> clone_list(const ::std::vector<T>& items)
    {
        ::std::vector<T>    rv;
        rv.reserve(items.size());
        for(const auto& i : items)
            rv.push_back( i.clone() );
        return rv;
    }
    template<typename T>
    void print_list(::std::ostream& os, const ::std::vector<T>& items)
    {
        for(const auto& i : items)
            os << i << "\n";
    }
}

const char* AstFragmentKind_name(AstFragmentKind k)
{
    switch(k)
    {
    case AstFragmentKind::Expr:     return "expression";
    case AstFragmentKind::Pat:      return "pattern";
    case AstFragmentKind::Ty:       return "type";
    case AstFragmentKind::Stmts:    return "statement";
    case AstFragmentKind::Items:    return "item";
    case AstFragmentKind::TraitItems:   return "trait item";
    case AstFragmentKind::ImplItems:    return "impl item";
    case AstFragmentKind::ForeignItems: return "foreign item";
    }
    return "";
}
::std::ostream& operator<<(::std::ostream& os, const AstFragmentKind& x)
{
    return os << AstFragmentKind_name(x);
}

AstFragmentKind AstFragment::kind() const
{
    switch(this->tag())
    {
    case TAGDEAD:   break;
    case TAG_Expr:  return AstFragmentKind::Expr;
    case TAG_Pat:   return AstFragmentKind::Pat;
    case TAG_Ty:    return AstFragmentKind::Ty;
    case TAG_Stmts: return AstFragmentKind::Stmts;
    case TAG_Items: return AstFragmentKind::Items;
    case TAG_TraitItems:    return AstFragmentKind::TraitItems;
    case TAG_ImplItems:     return AstFragmentKind::ImplItems;
    case TAG_ForeignItems:  return AstFragmentKind::ForeignItems;
    }
    BUG(Span(), "Destructed AstFragment used");
}
AstFragment AstFragment::clone() const
{
    TU_MATCH_HDRA( (*this), {)
    TU_ARMA(Expr, e)    return AstFragment::make_Expr( e ? e->clone() : ExprNodeP() );
    TU_ARMA(Pat, e)     return AstFragment::make_Pat( e.clone() );
    TU_ARMA(Ty, e)      return AstFragment::make_Ty( e.clone() );
    TU_ARMA(Stmts, e)   return AstFragment::make_Stmts( clone_list(e) );
    TU_ARMA(Items, e)   return AstFragment::make_Items( clone_list(e) );
    TU_ARMA(TraitItems, e)  return AstFragment::make_TraitItems( clone_list(e) );
    TU_ARMA(ImplItems, e)   return AstFragment::make_ImplItems( clone_list(e) );
    TU_ARMA(ForeignItems, e)    return AstFragment::make_ForeignItems( clone_list(e) );
    }
    BUG(Span(), "Bad AstFragment tag");
}
::std::ostream& operator<<(::std::ostream& os, const AstFragment& x)
{
    TU_MATCH_HDRA( (x), {)
    TU_ARMA(Expr, e) {
        if( e )
            os << *e;
        else
            os << "/* no expr */";
        }
    TU_ARMA(Pat, e)     os << e;
    TU_ARMA(Ty, e)      os << e;
    TU_ARMA(Stmts, e)   print_list(os, e);
    TU_ARMA(Items, e)   print_list(os, e);
    TU_ARMA(TraitItems, e)  print_list(os, e);
    TU_ARMA(ImplItems, e)   print_list(os, e);
    TU_ARMA(ForeignItems, e)    print_list(os, e);
    }
    return os;
}

// --- Annotatable ---
const Span& Annotatable::span() const
{
    TU_MATCH_HDRA( (*this), {)
    TU_ARMA(Item, e)        return e->span;
    TU_ARMA(TraitItem, e)   return e->span;
    TU_ARMA(ImplItem, e)    return e->span;
    TU_ARMA(ForeignItem, e) return e->span;
    TU_ARMA(Stmt, e)        return e->span;
    TU_ARMA(Expr, e)        return e->span();
    }
    BUG(Span(), "Bad Annotatable tag");
}
const AttributeList& Annotatable::attrs() const
{
    TU_MATCH_HDRA( (*this), {)
    TU_ARMA(Item, e)        return e->attrs;
    TU_ARMA(TraitItem, e)   return e->attrs;
    TU_ARMA(ImplItem, e)    return e->attrs;
    TU_ARMA(ForeignItem, e) return e->attrs;
    TU_ARMA(Stmt, e)        return e->attrs;
    TU_ARMA(Expr, e)        return e->attrs();
    }
    BUG(Span(), "Bad Annotatable tag");
}
AttributeList& Annotatable::attrs()
{
    return const_cast<AttributeList&>( const_cast<const Annotatable*>(this)->attrs() );
}
bool Annotatable::derive_allowed() const
{
    if( const auto* e = this->opt_Item() )
    {
        return (*e)->is_adt();
    }
    return false;
}

::AST::Item Annotatable::expect_item()
{
    ASSERT_BUG(Span(), this->is_Item(), "expected Item, got " << this->tag_str());
    return mv$(*this->as_Item());
}
::AST::TraitItem Annotatable::expect_trait_item()
{
    ASSERT_BUG(Span(), this->is_TraitItem(), "expected trait item, got " << this->tag_str());
    return mv$(*this->as_TraitItem());
}
::AST::ImplItem Annotatable::expect_impl_item()
{
    ASSERT_BUG(Span(), this->is_ImplItem(), "expected impl item, got " << this->tag_str());
    return mv$(*this->as_ImplItem());
}
::AST::ForeignItem Annotatable::expect_foreign_item()
{
    ASSERT_BUG(Span(), this->is_ForeignItem(), "expected foreign item, got " << this->tag_str());
    return mv$(*this->as_ForeignItem());
}
::AST::Stmt Annotatable::expect_stmt()
{
    ASSERT_BUG(Span(), this->is_Stmt(), "expected statement, got " << this->tag_str());
    return mv$(*this->as_Stmt());
}
ExprNodeP Annotatable::expect_expr()
{
    ASSERT_BUG(Span(), this->is_Expr(), "expected expression, got " << this->tag_str());
    return mv$(this->as_Expr());
}

Annotatable Annotatable::clone() const
{
    TU_MATCH_HDRA( (*this), {)
    TU_ARMA(Item, e)        return Annotatable::make_Item( box$(e->clone()) );
    TU_ARMA(TraitItem, e)   return Annotatable::make_TraitItem( box$(e->clone()) );
    TU_ARMA(ImplItem, e)    return Annotatable::make_ImplItem( box$(e->clone()) );
    TU_ARMA(ForeignItem, e) return Annotatable::make_ForeignItem( box$(e->clone()) );
    TU_ARMA(Stmt, e)        return Annotatable::make_Stmt( box$(e->clone()) );
    TU_ARMA(Expr, e)        return Annotatable::make_Expr( e->clone() );
    }
    BUG(Span(), "Bad Annotatable tag");
}
::std::ostream& operator<<(::std::ostream& os, const Annotatable& x)
{
    TU_MATCH_HDRA( (x), {)
    TU_ARMA(Item, e)        os << *e;
    TU_ARMA(TraitItem, e)   os << *e;
    TU_ARMA(ImplItem, e)    os << *e;
    TU_ARMA(ForeignItem, e) os << *e;
    TU_ARMA(Stmt, e)        os << *e;
    TU_ARMA(Expr, e)        os << *e;
    }
    return os;
}

AstFragment expect_from_annotatables(const Span& sp, AstFragmentKind kind, ::std::vector<Annotatable> items)
{
    switch(kind)
    {
    case AstFragmentKind::Items: {
        ::std::vector<Item> rv;
        for(auto& i : items)
            rv.push_back( i.expect_item() );
        return AstFragment::make_Items(mv$(rv));
        }
    case AstFragmentKind::TraitItems: {
        ::std::vector<TraitItem> rv;
        for(auto& i : items)
            rv.push_back( i.expect_trait_item() );
        return AstFragment::make_TraitItems(mv$(rv));
        }
    case AstFragmentKind::ImplItems: {
        ::std::vector<ImplItem> rv;
        for(auto& i : items)
            rv.push_back( i.expect_impl_item() );
        return AstFragment::make_ImplItems(mv$(rv));
        }
    case AstFragmentKind::ForeignItems: {
        ::std::vector<ForeignItem> rv;
        for(auto& i : items)
            rv.push_back( i.expect_foreign_item() );
        return AstFragment::make_ForeignItems(mv$(rv));
        }
    case AstFragmentKind::Stmts: {
        ::std::vector<Stmt> rv;
        for(auto& i : items)
            rv.push_back( i.expect_stmt() );
        return AstFragment::make_Stmts(mv$(rv));
        }
    case AstFragmentKind::Expr:
        ASSERT_BUG(sp, items.size() == 1, "expected exactly one expression from attribute expansion, got " << items.size());
        return AstFragment::make_Expr( items[0].expect_expr() );
    case AstFragmentKind::Pat:
    case AstFragmentKind::Ty:
        break;
    }
    BUG(sp, "Attribute expansion into " << kind << " position");
}

}   // namespace AST
