/*
 * synext - Syntax extension expansion core
 *
 * expand/concat.cpp
 * - concat! handler
 */
#include "builtins.hpp"
#include "ext_ctxt.hpp"
#include "mac_result.hpp"
#include "../parse/lex.hpp" // For Codepoint
#include <ast/expr.hpp>

class CConcatExpander:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        auto es = get_exprs_from_tts(cx, sp, tt);
        if( es.is_none() )
            return DummyResult::any(sp);

        ::std::string   rv;
        ::std::vector<Span> missing_literals;
        bool has_errors = false;
        for(const auto& v : es.unwrap())
        {
            DEBUG("concat - v=" << *v);
            if( const auto* vp = dynamic_cast<const AST::ExprNode_String*>(v.get()) )
            {
                rv += vp->m_value;
            }
            else if( const auto* vp = dynamic_cast<const AST::ExprNode_Integer*>(v.get()) )
            {
                if( vp->m_datatype == CORETYPE_CHAR ) {
                    rv += Codepoint { static_cast<uint32_t>(vp->m_value) };
                }
                else {
                    rv += FMT(vp->m_value);
                }
            }
            else if( const auto* vp = dynamic_cast<const AST::ExprNode_Bool*>(v.get()) )
            {
                rv += (vp->m_value ? "true" : "false");
            }
            else if( dynamic_cast<const AST::ExprNode_Error*>(v.get()) )
            {
                // Already reported
                has_errors = true;
            }
            else
            {
                missing_literals.push_back( v->span() );
            }
        }

        if( !missing_literals.empty() )
        {
            for(const auto& msp : missing_literals)
            {
                auto db = cx.struct_span_err(msp, "expected a literal");
                db.note("only literals (like `\"foo\"`, `42` and `3.14`) can be passed to `concat!()`");
                db.emit();
            }
            return DummyResult::any(sp);
        }
        if( has_errors )
            return DummyResult::any(sp);

        return MacEager::new_expr( cx.expr_str(cx.with_def_site_ctxt(sp), mv$(rv)) );
    }
};

void Expand_Register_Concat(BuiltinRegistrar& r)
{
    r.add_legacy_bang<CConcatExpander>("concat");
}
