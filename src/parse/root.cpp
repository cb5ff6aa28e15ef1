/*
 * synext - Syntax extension expansion core
 *
 * parse/root.cpp
 * - Parsing of attributes, items and associated items
 *
 * Entrypoint:
 * - Parse_AstFragment : Parses a whole token stream as one fragment kind
 */
#include "common.hpp"
#include "parseerror.hpp"
#include <ast/ast.hpp>
#include <ast/expr.hpp>
#include <ast/fragment.hpp>

// Check the next two tokens
#define LOOKAHEAD2(lex, tok1, tok2) ((lex).lookahead(0) == (tok1) && (lex).lookahead(1) == (tok2))

namespace {

bool Parse_Publicity(TokenStream& lex)
{
    if( !lex.getTokenIf(TOK_RWORD_PUB) )
        return false;
    // `pub(crate)`, `pub(self)` and `pub(super)` are treated as `pub`
    if( lex.lookahead(0) == TOK_PAREN_OPEN && lex.lookahead(2) == TOK_PAREN_CLOSE )
    {
        auto t = lex.lookahead(1);
        if( t == TOK_RWORD_CRATE || t == TOK_RWORD_SELF || t == TOK_RWORD_SUPER )
        {
            Parse_TT(lex, false);
        }
    }
    return true;
}

bool is_literal_tok(eTokenType t)
{
    switch(t)
    {
    case TOK_STRING:
    case TOK_INTEGER:
    case TOK_CHAR:
    case TOK_RWORD_TRUE:
    case TOK_RWORD_FALSE:
        return true;
    default:
        return false;
    }
}

Ident Parse_Ident(TokenStream& lex)
{
    Token   tok;
    GET_CHECK_TOK(tok, lex, TOK_IDENT);
    return Ident(tok.ident(), tok.span());
}

::std::vector<AST::StructField> Parse_NamedFields(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    ::std::vector<AST::StructField> rv;
    GET_CHECK_TOK(tok, lex, TOK_BRACE_OPEN);
    while( lex.lookahead(0) != TOK_BRACE_CLOSE )
    {
        auto attrs = Parse_ItemAttrs(lex);
        bool is_pub = Parse_Publicity(lex);
        auto name = Parse_Ident(lex);
        GET_CHECK_TOK(tok, lex, TOK_COLON);
        auto ty = Parse_Type(lex);
        rv.push_back(AST::StructField { mv$(attrs), is_pub, mv$(name), mv$(ty) });
        if( !lex.getTokenIf(TOK_COMMA) )
            break;
    }
    GET_CHECK_TOK(tok, lex, TOK_BRACE_CLOSE);
    return rv;
}
::std::vector<AST::StructField> Parse_TupleFields(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    ::std::vector<AST::StructField> rv;
    GET_CHECK_TOK(tok, lex, TOK_PAREN_OPEN);
    while( lex.lookahead(0) != TOK_PAREN_CLOSE )
    {
        auto attrs = Parse_ItemAttrs(lex);
        bool is_pub = Parse_Publicity(lex);
        auto ty = Parse_Type(lex);
        rv.push_back(AST::StructField { mv$(attrs), is_pub, Ident(""), mv$(ty) });
        if( !lex.getTokenIf(TOK_COMMA) )
            break;
    }
    GET_CHECK_TOK(tok, lex, TOK_PAREN_CLOSE);
    return rv;
}

AST::Item::Data Parse_Struct(TokenStream& lex)
{
    Token   tok;
    switch( lex.lookahead(0) )
    {
    case TOK_SEMICOLON:
        GET_TOK(tok, lex);
        return AST::Item::Data::make_Struct({ AST::StructKind::Unit, {} });
    case TOK_PAREN_OPEN: {
        auto fields = Parse_TupleFields(lex);
        GET_CHECK_TOK(tok, lex, TOK_SEMICOLON);
        return AST::Item::Data::make_Struct({ AST::StructKind::Tuple, mv$(fields) });
        }
    case TOK_BRACE_OPEN:
        return AST::Item::Data::make_Struct({ AST::StructKind::Named, Parse_NamedFields(lex) });
    default:
        GET_TOK(tok, lex);
        throw ParseError::Unexpected(lex, tok, { TOK_SEMICOLON, TOK_PAREN_OPEN, TOK_BRACE_OPEN });
    }
}

AST::Item::Data Parse_Enum(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    ::std::vector<AST::EnumVariant> variants;
    GET_CHECK_TOK(tok, lex, TOK_BRACE_OPEN);
    while( lex.lookahead(0) != TOK_BRACE_CLOSE )
    {
        auto attrs = Parse_ItemAttrs(lex);
        auto name = Parse_Ident(lex);
        switch( lex.lookahead(0) )
        {
        case TOK_PAREN_OPEN:
            variants.push_back(AST::EnumVariant { mv$(attrs), mv$(name), AST::StructKind::Tuple, Parse_TupleFields(lex) });
            break;
        case TOK_BRACE_OPEN:
            variants.push_back(AST::EnumVariant { mv$(attrs), mv$(name), AST::StructKind::Named, Parse_NamedFields(lex) });
            break;
        default:
            variants.push_back(AST::EnumVariant { mv$(attrs), mv$(name), AST::StructKind::Unit, {} });
            break;
        }
        if( !lex.getTokenIf(TOK_COMMA) )
            break;
    }
    GET_CHECK_TOK(tok, lex, TOK_BRACE_CLOSE);
    return AST::Item::Data::make_Enum({ mv$(variants) });
}

/// `NAME: TYPE = VALUE;` for `const` and `static`
AST::Item::Data Parse_Static(TokenStream& lex, AST::StaticClass cls, Ident& out_name)
{
    Token   tok;
    out_name = Parse_Ident(lex);
    GET_CHECK_TOK(tok, lex, TOK_COLON);
    auto ty = Parse_Type(lex);
    GET_CHECK_TOK(tok, lex, TOK_EQUAL);
    auto val = Parse_Expr(lex);
    GET_CHECK_TOK(tok, lex, TOK_SEMICOLON);
    return AST::Item::Data::make_Static({ cls, mv$(ty), mv$(val) });
}

template<typename T>
::std::vector<T> Parse_BlockContents(TokenStream& lex, ::std::function<T(TokenStream&)> parse_one)
{
    Token   tok;
    ::std::vector<T>    rv;
    GET_CHECK_TOK(tok, lex, TOK_BRACE_OPEN);
    while( lex.lookahead(0) != TOK_BRACE_CLOSE )
    {
        rv.push_back( parse_one(lex) );
    }
    GET_CHECK_TOK(tok, lex, TOK_BRACE_CLOSE);
    return rv;
}

/// Associated item (shared between impl/trait/extern blocks)
AST::AssocItem Parse_AssocItem(TokenStream& lex, bool require_value)
{
    TRACE_FUNCTION;
    Token   tok;
    auto ps = lex.start_span();
    auto attrs = Parse_ItemAttrs(lex);
    bool is_pub = Parse_Publicity(lex);

    switch( GET_TOK(tok, lex) )
    {
    case TOK_RWORD_CONST: {
        auto name = Parse_Ident(lex);
        GET_CHECK_TOK(tok, lex, TOK_COLON);
        auto ty = Parse_Type(lex);
        AST::ExprNodeP  val;
        if( require_value || lex.lookahead(0) == TOK_EQUAL )
        {
            GET_CHECK_TOK(tok, lex, TOK_EQUAL);
            val = Parse_Expr(lex);
        }
        GET_CHECK_TOK(tok, lex, TOK_SEMICOLON);
        return AST::AssocItem(lex.end_span(ps), mv$(attrs), is_pub, mv$(name), AST::AssocItem::Data::make_Const({ mv$(ty), mv$(val) }));
        }
    case TOK_RWORD_STATIC: {
        bool is_mut = lex.getTokenIf(TOK_RWORD_MUT);
        auto name = Parse_Ident(lex);
        GET_CHECK_TOK(tok, lex, TOK_COLON);
        auto ty = Parse_Type(lex);
        GET_CHECK_TOK(tok, lex, TOK_SEMICOLON);
        return AST::AssocItem(lex.end_span(ps), mv$(attrs), is_pub, mv$(name), AST::AssocItem::Data::make_Static({ is_mut, mv$(ty) }));
        }
    case TOK_RWORD_TYPE: {
        auto name = Parse_Ident(lex);
        ::std::unique_ptr<TypeRef>  ty;
        if( require_value || lex.lookahead(0) == TOK_EQUAL )
        {
            GET_CHECK_TOK(tok, lex, TOK_EQUAL);
            ty = box$( Parse_Type(lex) );
        }
        GET_CHECK_TOK(tok, lex, TOK_SEMICOLON);
        return AST::AssocItem(lex.end_span(ps), mv$(attrs), is_pub, mv$(name), AST::AssocItem::Data::make_Type({ mv$(ty) }));
        }
    default:
        if( Parse_IsPathStart(tok.type()) )
        {
            PUTBACK(tok, lex);
            auto path = Parse_Path(lex);
            GET_CHECK_TOK(tok, lex, TOK_EXCLAM);
            auto inv = Parse_MacroInvocation(ps, mv$(path), lex);
            if( inv.delim() != AST::MacDelimiter::Brace )
                GET_CHECK_TOK(tok, lex, TOK_SEMICOLON);
            return AST::AssocItem(lex.end_span(ps), mv$(attrs), is_pub, Ident(""), AST::AssocItem::Data::make_Macro(mv$(inv)));
        }
        throw ParseError::Unexpected(lex, tok, { TOK_RWORD_CONST, TOK_RWORD_STATIC, TOK_RWORD_TYPE, TOK_IDENT });
    }
}

}   // namespace

AST::MetaItem Parse_MetaItem(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    auto ps = lex.start_span();

    AST::MetaItem   rv;
    if( is_literal_tok(lex.lookahead(0)) )
    {
        rv.data = AST::MetaItem::Data::make_Literal( lex.getToken() );
        rv.span = lex.end_span(ps);
        return rv;
    }

    do {
        GET_CHECK_TOK(tok, lex, TOK_IDENT);
        rv.name.elems.push_back( tok.ident() );
    } while( lex.getTokenIf(TOK_DOUBLE_COLON) );

    switch( lex.lookahead(0) )
    {
    case TOK_EQUAL:
        GET_TOK(tok, lex);
        GET_TOK(tok, lex);
        if( !is_literal_tok(tok.type()) )
            throw ParseError::Unexpected(lex, tok, { TOK_STRING, TOK_INTEGER, TOK_CHAR, TOK_RWORD_TRUE, TOK_RWORD_FALSE });
        rv.data = AST::MetaItem::Data::make_NameValue({ mv$(tok) });
        break;
    case TOK_PAREN_OPEN: {
        GET_TOK(tok, lex);
        auto items = Parse_MetaItemList(lex, TOK_PAREN_CLOSE);
        GET_CHECK_TOK(tok, lex, TOK_PAREN_CLOSE);
        rv.data = AST::MetaItem::Data::make_List( mv$(items) );
        } break;
    default:
        break;
    }
    rv.span = lex.end_span(ps);
    return rv;
}
::std::vector<AST::MetaItem> Parse_MetaItemList(TokenStream& lex, eTokenType close)
{
    ::std::vector<AST::MetaItem>    rv;
    while( lex.lookahead(0) != close )
    {
        rv.push_back( Parse_MetaItem(lex) );
        if( !lex.getTokenIf(TOK_COMMA) )
            break;
    }
    return rv;
}

AST::Attribute Parse_Attribute(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    auto ps = lex.start_span();
    GET_CHECK_TOK(tok, lex, TOK_HASH);
    GET_CHECK_TOK(tok, lex, TOK_SQUARE_OPEN);

    AST::AttributeName  name;
    do {
        GET_CHECK_TOK(tok, lex, TOK_IDENT);
        name.elems.push_back(tok.ident());
    } while(GET_TOK(tok, lex) == TOK_DOUBLE_COLON);

    TokenTree   attr_data;
    switch(tok.type())
    {
    case TOK_EQUAL: {
        ::std::vector<TokenTree>  tt;
        tt.push_back(mv$(tok));
        while( lex.lookahead(0) != TOK_EOF && lex.lookahead(0) != TOK_SQUARE_CLOSE )
        {
            tt.push_back(Parse_TT(lex, false));
        }
        attr_data = TokenTree(mv$(tt));
        } break;
    case TOK_PAREN_OPEN:
    case TOK_SQUARE_OPEN:
    case TOK_BRACE_OPEN:
        PUTBACK(tok, lex);
        attr_data = Parse_TT(lex, false);
        break;
    default:
        // Empty
        PUTBACK(tok, lex);
        break;
    }
    GET_CHECK_TOK(tok, lex, TOK_SQUARE_CLOSE);
    return AST::Attribute(lex.end_span(ps), mv$(name), mv$(attr_data));
}
AST::AttributeList Parse_ItemAttrs(TokenStream& lex)
{
    AST::AttributeList  rv;
    while( lex.lookahead(0) == TOK_HASH )
    {
        rv.push_back( Parse_Attribute(lex) );
    }
    return rv;
}

AST::Item Parse_Item(TokenStream& lex)
{
    auto attrs = Parse_ItemAttrs(lex);
    return Parse_Item(lex, mv$(attrs));
}
AST::Item Parse_Item(TokenStream& lex, AST::AttributeList attrs)
{
    TRACE_FUNCTION;
    Token   tok;
    auto ps = lex.start_span();
    bool is_pub = Parse_Publicity(lex);

    Ident   name { "" };
    AST::Item::Data data;
    switch( GET_TOK(tok, lex) )
    {
    case TOK_RWORD_STRUCT:
        name = Parse_Ident(lex);
        data = Parse_Struct(lex);
        break;
    case TOK_RWORD_ENUM:
        name = Parse_Ident(lex);
        data = Parse_Enum(lex);
        break;
    case TOK_RWORD_CONST:
        data = Parse_Static(lex, AST::StaticClass::Const, name);
        break;
    case TOK_RWORD_STATIC:
        if( lex.getTokenIf(TOK_RWORD_MUT) )
            data = Parse_Static(lex, AST::StaticClass::MutStatic, name);
        else
            data = Parse_Static(lex, AST::StaticClass::Static, name);
        break;
    case TOK_RWORD_IMPL: {
        auto ty = Parse_Type(lex);
        rust::option<AST::Path> trait_path;
        if( lex.getTokenIf(TOK_RWORD_FOR) )
        {
            if( !ty.m_data.is_Path() )
                throw ParseError::Generic(lex, FMT("expected a trait, found type `" << ty << "`"));
            trait_path = rust::Some( ty.m_data.as_Path() );
            ty = Parse_Type(lex);
        }
        auto items = Parse_BlockContents< AST::ImplItem >(lex, Parse_ImplItem);
        data = AST::Item::Data::make_Impl({ mv$(trait_path), mv$(ty), mv$(items) });
        } break;
    case TOK_RWORD_TRAIT:
        name = Parse_Ident(lex);
        data = AST::Item::Data::make_Trait({ Parse_BlockContents< AST::TraitItem >(lex, Parse_TraitItem) });
        break;
    case TOK_RWORD_MOD:
        name = Parse_Ident(lex);
        data = AST::Item::Data::make_Mod({ Parse_BlockContents< AST::Item >(lex, [](TokenStream& lex) { return Parse_Item(lex); }) });
        break;
    case TOK_RWORD_EXTERN:
        // Optional ABI string
        lex.getTokenIf(TOK_STRING);
        data = AST::Item::Data::make_ForeignMod({ Parse_BlockContents< AST::ForeignItem >(lex, Parse_ForeignItem) });
        break;
    case TOK_IDENT:
        if( tok.ident() == "union" && lex.lookahead(0) == TOK_IDENT )
        {
            name = Parse_Ident(lex);
            data = AST::Item::Data::make_Union({ Parse_NamedFields(lex) });
            break;
        }
        // Fall through to macro invocation
    default:
        if( Parse_IsPathStart(tok.type()) )
        {
            PUTBACK(tok, lex);
            auto path = Parse_Path(lex);
            GET_CHECK_TOK(tok, lex, TOK_EXCLAM);
            auto inv = Parse_MacroInvocation(ps, mv$(path), lex);
            if( inv.delim() != AST::MacDelimiter::Brace )
                GET_CHECK_TOK(tok, lex, TOK_SEMICOLON);
            data = AST::Item::Data::make_MacroInv(mv$(inv));
            break;
        }
        throw ParseError::Unexpected(lex, tok);
    }
    return AST::Item(lex.end_span(ps), mv$(attrs), is_pub, mv$(name), mv$(data));
}

AST::ImplItem Parse_ImplItem(TokenStream& lex)
{
    return AST::ImplItem( Parse_AssocItem(lex, true) );
}
AST::TraitItem Parse_TraitItem(TokenStream& lex)
{
    return AST::TraitItem( Parse_AssocItem(lex, false) );
}
AST::ForeignItem Parse_ForeignItem(TokenStream& lex)
{
    return AST::ForeignItem( Parse_AssocItem(lex, false) );
}

AST::AstFragment Parse_AstFragment(TokenStream& lex, AST::AstFragmentKind kind)
{
    TRACE_FUNCTION_F(kind);
    Token   tok;
    AST::AstFragment    rv;
    switch(kind)
    {
    case AST::AstFragmentKind::Expr:
        rv = AST::AstFragment::make_Expr( Parse_Expr(lex) );
        break;
    case AST::AstFragmentKind::Pat:
        rv = AST::AstFragment::make_Pat( Parse_Pattern(lex) );
        break;
    case AST::AstFragmentKind::Ty:
        rv = AST::AstFragment::make_Ty( Parse_Type(lex) );
        break;
    case AST::AstFragmentKind::Stmts: {
        ::std::vector<AST::Stmt>    stmts;
        for(;;)
        {
            auto s = Parse_Stmt(lex);
            if( s.is_none() )
                break;
            stmts.push_back( mv$(s.unwrap()) );
        }
        rv = AST::AstFragment::make_Stmts( mv$(stmts) );
        } break;
    case AST::AstFragmentKind::Items: {
        ::std::vector<AST::Item>    items;
        while( lex.lookahead(0) != TOK_EOF )
            items.push_back( Parse_Item(lex) );
        rv = AST::AstFragment::make_Items( mv$(items) );
        } break;
    case AST::AstFragmentKind::TraitItems: {
        ::std::vector<AST::TraitItem>   items;
        while( lex.lookahead(0) != TOK_EOF )
            items.push_back( Parse_TraitItem(lex) );
        rv = AST::AstFragment::make_TraitItems( mv$(items) );
        } break;
    case AST::AstFragmentKind::ImplItems: {
        ::std::vector<AST::ImplItem>    items;
        while( lex.lookahead(0) != TOK_EOF )
            items.push_back( Parse_ImplItem(lex) );
        rv = AST::AstFragment::make_ImplItems( mv$(items) );
        } break;
    case AST::AstFragmentKind::ForeignItems: {
        ::std::vector<AST::ForeignItem> items;
        while( lex.lookahead(0) != TOK_EOF )
            items.push_back( Parse_ForeignItem(lex) );
        rv = AST::AstFragment::make_ForeignItems( mv$(items) );
        } break;
    }
    GET_CHECK_TOK(tok, lex, TOK_EOF);
    return rv;
}
