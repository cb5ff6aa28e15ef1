/*
 * synext - Syntax extension expansion core
 *
 * expand/mac_result.cpp
 * - Results of structured (legacy) function-like macros
 */
#include "mac_result.hpp"
#include <ast/expr.hpp>

MacResult::~MacResult()
{
}

rust::option<AST::ExprNodeP> MacResult::make_expr()
{
    return rust::None<AST::ExprNodeP>();
}
rust::option<AST::Pattern> MacResult::make_pat()
{
    return rust::None<AST::Pattern>();
}
rust::option<TypeRef> MacResult::make_ty()
{
    return rust::None<TypeRef>();
}
rust::option< ::std::vector<AST::Item> > MacResult::make_items()
{
    return rust::None< ::std::vector<AST::Item> >();
}
rust::option< ::std::vector<AST::ImplItem> > MacResult::make_impl_items()
{
    return rust::None< ::std::vector<AST::ImplItem> >();
}
rust::option< ::std::vector<AST::TraitItem> > MacResult::make_trait_items()
{
    return rust::None< ::std::vector<AST::TraitItem> >();
}
rust::option< ::std::vector<AST::ForeignItem> > MacResult::make_foreign_items()
{
    return rust::None< ::std::vector<AST::ForeignItem> >();
}
rust::option< ::std::vector<AST::Stmt> > MacResult::make_stmts()
{
    auto e = this->make_expr();
    if( e.is_none() )
        return rust::None< ::std::vector<AST::Stmt> >();
    auto sp = e.unwrap()->span();
    return make_vec1( AST::Stmt::new_expr(mv$(sp), mv$(e.unwrap())) );
}

rust::option<AST::AstFragment> MacResult_make(::std::unique_ptr<MacResult> result, AST::AstFragmentKind kind)
{
    ASSERT_BUG(Span(), result, "Null macro result");
    #define _(NAME, FCN) do { \
        auto v = result->FCN(); \
        if( v.is_none() ) return rust::None<AST::AstFragment>(); \
        return AST::AstFragment::make_##NAME( mv$(v.unwrap()) ); \
        } while(0)
    switch(kind)
    {
    case AST::AstFragmentKind::Expr:    _(Expr, make_expr);
    case AST::AstFragmentKind::Pat:     _(Pat, make_pat);
    case AST::AstFragmentKind::Ty:      _(Ty, make_ty);
    case AST::AstFragmentKind::Stmts:   _(Stmts, make_stmts);
    case AST::AstFragmentKind::Items:   _(Items, make_items);
    case AST::AstFragmentKind::TraitItems:  _(TraitItems, make_trait_items);
    case AST::AstFragmentKind::ImplItems:   _(ImplItems, make_impl_items);
    case AST::AstFragmentKind::ForeignItems:    _(ForeignItems, make_foreign_items);
    }
    #undef _
    BUG(Span(), "Bad AstFragmentKind");
}

// --------------------------------------------------------------------
// MacEager
// --------------------------------------------------------------------
#define EAGER_CTOR(NAME, TY) \
    ::std::unique_ptr<MacResult> MacEager::new_##NAME(TY v) { \
        auto rv = ::std::unique_ptr<MacEager>(new MacEager()); \
        rv->NAME = mv$(v); \
        return ::std::unique_ptr<MacResult>(mv$(rv)); \
    }
EAGER_CTOR(expr, AST::ExprNodeP)
EAGER_CTOR(pat, AST::Pattern)
EAGER_CTOR(ty, TypeRef)
EAGER_CTOR(items, ::std::vector<AST::Item>)
EAGER_CTOR(impl_items, ::std::vector<AST::ImplItem>)
EAGER_CTOR(trait_items, ::std::vector<AST::TraitItem>)
EAGER_CTOR(foreign_items, ::std::vector<AST::ForeignItem>)
EAGER_CTOR(stmts, ::std::vector<AST::Stmt>)
#undef EAGER_CTOR

rust::option<AST::ExprNodeP> MacEager::make_expr()
{
    return expr.take();
}
rust::option<AST::Pattern> MacEager::make_pat()
{
    if( pat.is_some() )
        return pat.take();
    if( expr.is_some() && expr.unwrap() && AST::is_literal(*expr.unwrap()) )
    {
        auto e = expr.take();
        auto sp = e.unwrap()->span();
        return AST::Pattern::new_value(mv$(sp), mv$(e.unwrap()));
    }
    return rust::None<AST::Pattern>();
}
rust::option<TypeRef> MacEager::make_ty()
{
    return ty.take();
}
rust::option< ::std::vector<AST::Item> > MacEager::make_items()
{
    return items.take();
}
rust::option< ::std::vector<AST::ImplItem> > MacEager::make_impl_items()
{
    return impl_items.take();
}
rust::option< ::std::vector<AST::TraitItem> > MacEager::make_trait_items()
{
    return trait_items.take();
}
rust::option< ::std::vector<AST::ForeignItem> > MacEager::make_foreign_items()
{
    return foreign_items.take();
}
rust::option< ::std::vector<AST::Stmt> > MacEager::make_stmts()
{
    if( stmts.is_some() && !stmts.unwrap().empty() )
        return stmts.take();
    return MacResult::make_stmts();
}

// --------------------------------------------------------------------
// DummyResult
// --------------------------------------------------------------------
::std::unique_ptr<MacResult> DummyResult::any(Span sp)
{
    return ::std::unique_ptr<MacResult>(new DummyResult(true, mv$(sp)));
}
::std::unique_ptr<MacResult> DummyResult::any_valid(Span sp)
{
    return ::std::unique_ptr<MacResult>(new DummyResult(false, mv$(sp)));
}

AST::ExprNodeP DummyResult::raw_expr(Span sp, bool is_error)
{
    AST::ExprNodeP  rv;
    if( is_error )
        rv = AST::ExprNodeP(new AST::ExprNode_Error());
    else
        rv = AST::ExprNodeP(new AST::ExprNode_Tuple({}));
    rv->set_span(mv$(sp));
    return rv;
}
AST::Pattern DummyResult::raw_pat(Span sp)
{
    return AST::Pattern::new_wild(mv$(sp));
}
TypeRef DummyResult::raw_ty(Span sp, bool is_error)
{
    if( is_error )
        return TypeRef::new_err(mv$(sp));
    else
        return TypeRef::new_unit(mv$(sp));
}

AST::AstFragment DummyResult::make_fragment(Span sp, AST::AstFragmentKind kind)
{
    auto rv = MacResult_make(DummyResult::any(mv$(sp)), kind);
    ASSERT_BUG(Span(), rv.is_some(), "DummyResult declined " << kind);
    return mv$(rv.unwrap());
}

rust::option<AST::ExprNodeP> DummyResult::make_expr()
{
    return raw_expr(m_span, m_is_error);
}
rust::option<AST::Pattern> DummyResult::make_pat()
{
    return raw_pat(m_span);
}
rust::option<TypeRef> DummyResult::make_ty()
{
    return raw_ty(m_span, m_is_error);
}
rust::option< ::std::vector<AST::Item> > DummyResult::make_items()
{
    return ::std::vector<AST::Item>();
}
rust::option< ::std::vector<AST::ImplItem> > DummyResult::make_impl_items()
{
    return ::std::vector<AST::ImplItem>();
}
rust::option< ::std::vector<AST::TraitItem> > DummyResult::make_trait_items()
{
    return ::std::vector<AST::TraitItem>();
}
rust::option< ::std::vector<AST::ForeignItem> > DummyResult::make_foreign_items()
{
    return ::std::vector<AST::ForeignItem>();
}
rust::option< ::std::vector<AST::Stmt> > DummyResult::make_stmts()
{
    return make_vec1( AST::Stmt::new_expr(m_span, raw_expr(m_span, m_is_error)) );
}
