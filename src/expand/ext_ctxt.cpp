/*
 * synext - Syntax extension expansion core
 *
 * expand/ext_ctxt.cpp
 * - Context handed to syntax extensions, and argument helpers for built-ins
 */
#include "ext_ctxt.hpp"
#include "expander.hpp"
#include <ast/expr.hpp>
#include <parse/ttstream.hpp>
#include <parse/parseerror.hpp>
#include <parse/common.hpp>

ExpansionConfig ExpansionConfig::default_(RcString crate_name)
{
    ExpansionConfig rv;
    rv.crate_name = mv$(crate_name);
    rv.edition = AST::Edition::Rust2015;
    rv.recursion_limit = 64;
    rv.trace_mac = false;
    return rv;
}
bool ExpansionConfig::is_feature_enabled(const char* name) const
{
    return features.count(RcString::new_interned(name)) > 0;
}

ExtCtxt::ExtCtxt(ParseSess& parse_sess, ExpansionConfig ecfg, Resolver& resolver):
    parse_sess(parse_sess),
    ecfg( mv$(ecfg) ),
    resolver(resolver)
{
    current_expansion.module_path.push_back( Ident(this->ecfg.crate_name) );
}

MacroExpander ExtCtxt::expander()
{
    return MacroExpander(*this, false);
}
MacroExpander ExtCtxt::monotonic_expander()
{
    return MacroExpander(*this, true);
}

::std::unique_ptr<TokenStream> ExtCtxt::new_parser_from_tts(const TokenTree& tts) const
{
    return ::std::unique_ptr<TokenStream>(new TTStream(this->call_site(), tts));
}

Span ExtCtxt::call_site() const
{
    return current_expansion.id.expn_data().call_site;
}
Span ExtCtxt::with_def_site_ctxt(const Span& sp) const
{
    return sp.with_def_site_ctxt(current_expansion.id);
}
Span ExtCtxt::with_call_site_ctxt(const Span& sp) const
{
    return sp.with_call_site_ctxt(current_expansion.id);
}
Span ExtCtxt::with_legacy_ctxt(const Span& sp) const
{
    return sp.with_mixed_site_ctxt(current_expansion.id);
}

rust::option<Span> ExtCtxt::expansion_cause() const
{
    ExpnId  expn_id = current_expansion.id;
    rust::option<Span>  last_macro;
    for(;;)
    {
        const auto& expn_data = expn_id.expn_data();
        // Stop going up the backtrace once `include!` is encountered
        if( expn_data.is_root() || expn_data.kind.name == "include" )
            break;
        expn_id = expn_data.call_site.ctxt().outer_expn();
        last_macro = expn_data.call_site;
    }
    return last_macro;
}

Diagnostics::DiagnosticBuilder ExtCtxt::struct_span_warn(Span sp, ::std::string msg)
{
    return parse_sess.span_diagnostic.struct_span_warn(mv$(sp), mv$(msg));
}
Diagnostics::DiagnosticBuilder ExtCtxt::struct_span_err(Span sp, ::std::string msg)
{
    return parse_sess.span_diagnostic.struct_span_err(mv$(sp), mv$(msg));
}
Diagnostics::DiagnosticBuilder ExtCtxt::struct_span_fatal(Span sp, ::std::string msg)
{
    return parse_sess.span_diagnostic.struct_span_fatal(mv$(sp), mv$(msg));
}
void ExtCtxt::span_warn(Span sp, ::std::string msg)
{
    parse_sess.span_diagnostic.span_warn(mv$(sp), mv$(msg));
}
void ExtCtxt::span_err(Span sp, ::std::string msg)
{
    parse_sess.span_diagnostic.span_err(mv$(sp), mv$(msg));
}
void ExtCtxt::span_err_with_code(Span sp, ::std::string msg, ::std::string code)
{
    parse_sess.span_diagnostic.span_err_with_code(mv$(sp), mv$(msg), mv$(code));
}
void ExtCtxt::span_fatal(Span sp, ::std::string msg)
{
    parse_sess.span_diagnostic.span_fatal(mv$(sp), mv$(msg));
}
void ExtCtxt::span_bug(Span sp, ::std::string msg)
{
    parse_sess.span_diagnostic.span_bug(mv$(sp), mv$(msg));
}
void ExtCtxt::bug(::std::string msg)
{
    parse_sess.span_diagnostic.bug(mv$(msg));
}
void ExtCtxt::span_unimpl(Span sp, ::std::string msg)
{
    parse_sess.span_diagnostic.span_unimpl(mv$(sp), mv$(msg));
}

void ExtCtxt::trace_macros_diag()
{
    for(auto& e : this->expansions)
    {
        auto db = parse_sess.span_diagnostic.struct_span_note(e.first, "trace_macro");
        for(auto& note : e.second)
            db.note(mv$(note));
        db.emit();
    }
    this->expansions.clear();
}

Ident ExtCtxt::ident_of(const char* s, Span sp) const
{
    return Ident::from_str_and_span(s, mv$(sp));
}
AST::Path ExtCtxt::std_path(const ::std::vector<const char*>& components) const
{
    auto def_site = this->with_def_site_ctxt(Span());
    ::std::vector<Ident>    segs;
    segs.push_back( Ident(RcString::new_interned("$crate"), def_site) );
    for(const auto* c : components)
        segs.push_back( Ident(c) );
    return AST::Path(mv$(def_site), false, mv$(segs));
}
AST::Path ExtCtxt::path_global(Span sp, const ::std::vector<const char*>& components) const
{
    ::std::vector<Ident>    segs;
    for(const auto* c : components)
        segs.push_back( Ident(RcString::new_interned(c), sp) );
    return AST::Path(mv$(sp), true, mv$(segs));
}

::std::string ExtCtxt::resolve_path(const ::std::string& path, const Span& sp)
{
    if( !path.empty() && path[0] == '/' )
        return path;

    // Relative paths are resolved against the file containing the (outermost) call site
    auto callsite = sp.source_callsite();
    const SpanInner_Source* file = nullptr;
    for(const Span* cur = &callsite; *cur; cur = &(*cur)->parent_span)
    {
        const auto* src = cur->get_source();
        if( src && src->is_real_file() ) {
            file = src;
            break;
        }
    }
    if( !file )
    {
        this->span_bug(sp, FMT("cannot resolve relative path `" << path << "` in non-file source"));
    }

    ::std::string   rv = file->filename.c_str();
    auto slash = rv.find_last_of('/');
    if( slash == ::std::string::npos )
        return path;
    rv.resize(slash + 1);
    rv += path;
    return rv;
}

void ExtCtxt::check_unused_macros()
{
    resolver.check_unused_macros();
}
void ExtCtxt::set_module_scope(AST::NodeId module_id)
{
    current_expansion.id = resolver.get_module_scope(module_id);
    DEBUG("module " << module_id << " -> " << current_expansion.id);
}

// --------------------------------------------------------------------
// AST construction
// --------------------------------------------------------------------
namespace {
    AST::ExprNodeP spanned(Span sp, AST::ExprNode* node)
    {
        AST::ExprNodeP  rv(node);
        rv->set_span(mv$(sp));
        return rv;
    }
}

AST::ExprNodeP ExtCtxt::expr_tuple(Span sp, ::std::vector<AST::ExprNodeP> exprs) const
{
    return spanned(mv$(sp), new AST::ExprNode_Tuple(mv$(exprs)));
}
AST::ExprNodeP ExtCtxt::expr_str(Span sp, ::std::string s) const
{
    return spanned(mv$(sp), new AST::ExprNode_String(mv$(s)));
}
AST::ExprNodeP ExtCtxt::expr_usize(Span sp, uint64_t v) const
{
    return spanned(mv$(sp), new AST::ExprNode_Integer(v, CORETYPE_UINT));
}
AST::ExprNodeP ExtCtxt::expr_u32(Span sp, uint32_t v) const
{
    return spanned(mv$(sp), new AST::ExprNode_Integer(v, CORETYPE_U32));
}
AST::ExprNodeP ExtCtxt::expr_bool(Span sp, bool v) const
{
    return spanned(mv$(sp), new AST::ExprNode_Bool(v));
}
AST::ExprNodeP ExtCtxt::expr_vec(Span sp, ::std::vector<AST::ExprNodeP> exprs) const
{
    return spanned(mv$(sp), new AST::ExprNode_Array(mv$(exprs)));
}
TypeRef ExtCtxt::ty_ident(Span sp, Ident name) const
{
    return TypeRef::new_path(sp, AST::Path::from_ident(mv$(name)));
}
TypeRef ExtCtxt::ty_rptr(Span sp, TypeRef inner, RcString lifetime, bool is_mut) const
{
    return TypeRef::new_borrow(mv$(sp), mv$(lifetime), is_mut, mv$(inner));
}
TypeRef ExtCtxt::ty_tup(Span sp, ::std::vector<TypeRef> tys) const
{
    return TypeRef(mv$(sp), TypeRef::Data::make_Tuple(mv$(tys)));
}
TypeRef ExtCtxt::ty_array(Span sp, TypeRef inner, AST::ExprNodeP size) const
{
    return TypeRef::new_array(mv$(sp), mv$(inner), mv$(size));
}
AST::Item ExtCtxt::item_static(Span sp, Ident name, TypeRef ty, AST::StaticClass cls, AST::ExprNodeP value) const
{
    return AST::Item(mv$(sp), AST::AttributeList(), true, mv$(name), AST::Item::Data::make_Static({ cls, mv$(ty), mv$(value) }));
}
AST::Item ExtCtxt::item_impl(Span sp, AST::Path trait_path, TypeRef self_ty, ::std::vector<AST::ImplItem> items) const
{
    return AST::Item(mv$(sp), AST::AttributeList(), false, Ident(""),
        AST::Item::Data::make_Impl({ rust::Some(mv$(trait_path)), mv$(self_ty), mv$(items) })
        );
}
AST::Stmt ExtCtxt::stmt_expr(AST::ExprNodeP e) const
{
    auto sp = e->span();
    return AST::Stmt::new_semi(mv$(sp), mv$(e));
}

// --------------------------------------------------------------------
// Argument helpers
// --------------------------------------------------------------------
ExprStringResult expr_to_spanned_string(ExtCtxt& cx, AST::ExprNodeP expr, const char* err_msg)
{
    // Eagerly expand, so `concat!("a", "b")` etc can be used
    auto frag = cx.expander().fully_expand_fragment( AST::AstFragment::make_Expr(mv$(expr)) );
    auto e = frag.unwrap_Expr();
    ASSERT_BUG(cx.call_site(), e, "Expression expanded to nothing");

    if( const auto* s = dynamic_cast<const AST::ExprNode_String*>(e.get()) )
    {
        return ExprStringResult::make_Ok({ s->m_value, e->span() });
    }
    if( dynamic_cast<const AST::ExprNode_Error*>(e.get()) )
    {
        // Already reported
        return ExprStringResult::make_Err(nullptr);
    }
    return ExprStringResult::make_Err( ::std::unique_ptr<Diagnostics::DiagnosticBuilder>(
        new Diagnostics::DiagnosticBuilder(cx.struct_span_err(e->span(), err_msg))
        ) );
}
rust::option< ::std::string> expr_to_string(ExtCtxt& cx, AST::ExprNodeP expr, const char* err_msg)
{
    auto res = expr_to_spanned_string(cx, mv$(expr), err_msg);
    TU_MATCH_HDRA( (res), {)
    TU_ARMA(Ok, v)
        return v.value;
    TU_ARMA(Err, db) {
        if( db )
            db->emit();
        }
    }
    return rust::None< ::std::string>();
}

void check_zero_tts(ExtCtxt& cx, const Span& sp, const TokenTree& tts, const char* name)
{
    if( !tts.is_empty() ) {
        cx.span_err(sp, FMT(name << " takes no arguments"));
    }
}

rust::option< ::std::string> get_single_str_from_tts(ExtCtxt& cx, const Span& sp, const TokenTree& tts, const char* name)
{
    auto lex = cx.new_parser_from_tts(tts);
    if( lex->lookahead(0) == TOK_EOF ) {
        cx.span_err(sp, FMT(name << " takes 1 argument"));
        return rust::None< ::std::string>();
    }
    AST::ExprNodeP  ret;
    try
    {
        ret = Parse_Expr(*lex);
        lex->getTokenIf(TOK_COMMA);
        if( lex->lookahead(0) != TOK_EOF ) {
            cx.span_err(sp, FMT(name << " takes 1 argument"));
        }
    }
    catch(const ParseError::Base& e)
    {
        cx.span_err(e.span(), e.what());
        return rust::None< ::std::string>();
    }
    return expr_to_string(cx, mv$(ret), "argument must be a string literal");
}

rust::option< ::std::vector<AST::ExprNodeP> > get_exprs_from_tts(ExtCtxt& cx, const Span& sp, const TokenTree& tts)
{
    auto lex = cx.new_parser_from_tts(tts);
    ::std::vector<AST::ExprNodeP>   es;
    while( lex->lookahead(0) != TOK_EOF )
    {
        AST::ExprNodeP  expr;
        try
        {
            expr = Parse_Expr(*lex);
        }
        catch(const ParseError::Base& e)
        {
            cx.span_err(e.span(), e.what());
            return rust::None< ::std::vector<AST::ExprNodeP> >();
        }
        // Eager expansion of the argument
        auto frag = cx.expander().fully_expand_fragment( AST::AstFragment::make_Expr(mv$(expr)) );
        es.push_back( frag.unwrap_Expr() );

        if( lex->getTokenIf(TOK_COMMA) )
            continue;
        if( lex->lookahead(0) != TOK_EOF ) {
            cx.span_err(sp, "expected token: `,`");
            return rust::None< ::std::vector<AST::ExprNodeP> >();
        }
    }
    return es;
}
