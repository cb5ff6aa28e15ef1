/*
 * synext - Syntax extension expansion core
 *
 * expand/rustc_diagnostics.cpp
 * - __register_diagnostic, __diagnostic_used and __build_diagnostic_array
 */
#include "builtins.hpp"
#include "ext_ctxt.hpp"
#include "mac_result.hpp"
#include <parse_sess.hpp>

namespace {
    /// The leaf tokens of a macro input (null if the input holds a delimited group)
    ::std::vector<const Token*> get_flat_tokens(const TokenTree& tt)
    {
        ::std::vector<const Token*> rv;
        if( tt.is_token() ) {
            rv.push_back(&tt.tok());
            return rv;
        }
        for(const auto& st : tt.subtrees())
        {
            if( !st.is_token() ) {
                rv.push_back(nullptr);
                continue ;
            }
            rv.push_back(&st.tok());
        }
        return rv;
    }
    bool is_tok(const Token* t, eTokenType ty) {
        return t && t->type() == ty;
    }
}

class CExpanderRegisterDiagnostic:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        auto toks = get_flat_tokens(tt);
        RcString    code;
        rust::option<::std::string> description;
        if( toks.size() == 1 && is_tok(toks[0], TOK_IDENT) ) {
            code = toks[0]->ident();
        }
        else if( toks.size() == 3 && is_tok(toks[0], TOK_IDENT) && is_tok(toks[1], TOK_COMMA) && is_tok(toks[2], TOK_STRING) ) {
            code = toks[0]->ident();
            description = toks[2]->str();
        }
        else {
            cx.span_bug(sp, FMT("__register_diagnostic! takes a code and an optional description, got `" << tt.to_source() << "`"));
        }

        // Formatting problems are reported, the code is registered regardless
        if( description.is_some() )
        {
            for(const auto& msg : Diagnostics::ErrorRegistry::check_description(code, description.unwrap()))
                cx.span_err(sp, msg);
        }

        if( !cx.parse_sess.registered_diagnostics.register_code(code, mv$(description)) )
        {
            cx.span_err(sp, FMT("diagnostic code " << code << " already registered"));
        }

        return MacEager::new_items(::std::vector<AST::Item>());
    }
};

class CExpanderDiagnosticUsed:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        auto toks = get_flat_tokens(tt);
        if( !(toks.size() == 1 && is_tok(toks[0], TOK_IDENT)) ) {
            cx.span_bug(sp, FMT("__diagnostic_used! takes a single code, got `" << tt.to_source() << "`"));
        }
        const auto& code = toks[0]->ident();

        auto res = cx.parse_sess.registered_diagnostics.mark_used(code, sp);
        switch(res.kind)
        {
        case Diagnostics::ErrorRegistry::UseResult::Kind::First:
        case Diagnostics::ErrorRegistry::UseResult::Kind::Repeat:
            break;
        case Diagnostics::ErrorRegistry::UseResult::Kind::Reused: {
            auto db = cx.struct_span_warn(sp, FMT("diagnostic code " << code << " already used"));
            db.span_note(res.previous, "previous invocation");
            db.emit();
            break; }
        case Diagnostics::ErrorRegistry::UseResult::Kind::Unregistered:
            cx.span_err(sp, FMT("used diagnostic code " << code << " not registered"));
            break;
        }
        return MacEager::new_expr( cx.expr_tuple(sp, ::std::vector<AST::ExprNodeP>()) );
    }
};

class CExpanderBuildDiagnosticArray:
    public ExpandLegacyMacro
{
    ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& tt) override
    {
        auto toks = get_flat_tokens(tt);
        if( !(toks.size() == 3 && is_tok(toks[0], TOK_IDENT) && is_tok(toks[1], TOK_COMMA) && is_tok(toks[2], TOK_IDENT)) ) {
            cx.span_bug(sp, FMT("__build_diagnostic_array! takes a crate name and an item name, got `" << tt.to_source() << "`"));
        }
        const auto& crate_name = toks[0]->ident();
        const auto& item_name = toks[2]->ident();
        DEBUG("crate=" << crate_name << " item=" << item_name);

        auto descriptions = cx.parse_sess.registered_diagnostics.render();
        auto count = descriptions.size();

        // `[(&'static str, &'static str); N]`
        auto str_ty = [&]() {
            return cx.ty_rptr(sp, cx.ty_ident(sp, cx.ident_of("str", sp)), RcString::new_interned("static"), false);
            };
        ::std::vector<TypeRef>  tup_tys;
        tup_tys.push_back( str_ty() );
        tup_tys.push_back( str_ty() );
        auto ty = cx.ty_array(sp, cx.ty_tup(sp, mv$(tup_tys)), cx.expr_usize(sp, count));

        ::std::vector<AST::ExprNodeP>   entries;
        for(auto& d : descriptions)
        {
            ::std::vector<AST::ExprNodeP>   pair;
            pair.push_back( cx.expr_str(sp, d.first.c_str()) );
            pair.push_back( cx.expr_str(sp, mv$(d.second)) );
            entries.push_back( cx.expr_tuple(sp, mv$(pair)) );
        }

        auto item = cx.item_static(sp, Ident(item_name, sp), mv$(ty), AST::StaticClass::Static, cx.expr_vec(sp, mv$(entries)));
        return MacEager::new_items(make_vec1(mv$(item)));
    }
};

void Expand_Register_Diagnostics(BuiltinRegistrar& r)
{
    r.add_legacy_bang<CExpanderRegisterDiagnostic>("__register_diagnostic");
    r.add_legacy_bang<CExpanderDiagnosticUsed>("__diagnostic_used");
    r.add_legacy_bang<CExpanderBuildDiagnosticArray>("__build_diagnostic_array");
}
