/*
 * synext - Syntax extension expansion core
 *
 * parse/expr.cpp
 * - Expression, statement and token tree parsing
 */
#include "common.hpp"
#include <ast/expr.hpp>
#include "tokentree.hpp"

#define NEWNODE(type, ...)  ::AST::ExprNodeP(new type(__VA_ARGS__))

namespace {
    AST::ExprNodeP Parse_ExprVal(TokenStream& lex);

    AST::ExprNodeP set_span(AST::ExprNodeP node, Span sp)
    {
        node->set_span(mv$(sp));
        return node;
    }
}

bool Parse_IsTokValue(eTokenType tok_type)
{
    switch(tok_type)
    {
    case TOK_INTEGER:
    case TOK_CHAR:
    case TOK_STRING:
    case TOK_RWORD_TRUE:
    case TOK_RWORD_FALSE:
    case TOK_PAREN_OPEN:
    case TOK_SQUARE_OPEN:
    case TOK_AMP:
    case TOK_DOUBLE_AMP:
        return true;
    default:
        return Parse_IsPathStart(tok_type);
    }
}

AST::ExprNodeP Parse_ExprLiteral(Token tok)
{
    auto sp = tok.span();
    switch(tok.type())
    {
    case TOK_INTEGER:
        return set_span(NEWNODE(AST::ExprNode_Integer, tok.intval(), tok.datatype()), mv$(sp));
    case TOK_CHAR:
        return set_span(NEWNODE(AST::ExprNode_Integer, tok.intval(), CORETYPE_CHAR), mv$(sp));
    case TOK_STRING:
        return set_span(NEWNODE(AST::ExprNode_String, tok.str()), mv$(sp));
    case TOK_RWORD_TRUE:
        return set_span(NEWNODE(AST::ExprNode_Bool, true), mv$(sp));
    case TOK_RWORD_FALSE:
        return set_span(NEWNODE(AST::ExprNode_Bool, false), mv$(sp));
    default:
        BUG(sp, "Parse_ExprLiteral with non-literal " << tok);
    }
}

AST::ExprNodeP Parse_Expr(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    auto ps = lex.start_span();
    switch( GET_TOK(tok, lex) )
    {
    case TOK_DOUBLE_AMP: {
        // `&&x` is two borrows
        bool is_mut = lex.getTokenIf(TOK_RWORD_MUT);
        auto inner = Parse_Expr(lex);
        auto sp = lex.end_span(ps);
        auto rv = set_span(NEWNODE(AST::ExprNode_Borrow, is_mut, mv$(inner)), sp);
        return set_span(NEWNODE(AST::ExprNode_Borrow, false, mv$(rv)), sp);
        }
    case TOK_AMP: {
        bool is_mut = lex.getTokenIf(TOK_RWORD_MUT);
        auto inner = Parse_Expr(lex);
        return set_span(NEWNODE(AST::ExprNode_Borrow, is_mut, mv$(inner)), lex.end_span(ps));
        }
    default:
        PUTBACK(tok, lex);
        return Parse_ExprVal(lex);
    }
}

namespace {
/// Comma separated expressions, up to and including `close`
::std::vector<AST::ExprNodeP> Parse_ExprList(TokenStream& lex, eTokenType close, bool& out_trailing_comma)
{
    Token   tok;
    ::std::vector<AST::ExprNodeP>   rv;
    out_trailing_comma = false;
    while( lex.lookahead(0) != close )
    {
        rv.push_back( Parse_Expr(lex) );
        if( !lex.getTokenIf(TOK_COMMA) )
            break;
        out_trailing_comma = true;
    }
    GET_CHECK_TOK(tok, lex, close);
    if( rv.empty() )
        out_trailing_comma = false;
    return rv;
}

AST::ExprNodeP Parse_ExprVal(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    auto ps = lex.start_span();
    switch( GET_TOK(tok, lex) )
    {
    case TOK_INTEGER:
    case TOK_CHAR:
    case TOK_STRING:
    case TOK_RWORD_TRUE:
    case TOK_RWORD_FALSE:
        return Parse_ExprLiteral(mv$(tok));
    case TOK_PAREN_OPEN: {
        bool trailing_comma;
        auto vals = Parse_ExprList(lex, TOK_PAREN_CLOSE, trailing_comma);
        auto sp = lex.end_span(ps);
        if( vals.size() == 1 && !trailing_comma )
            return set_span(NEWNODE(AST::ExprNode_Paren, mv$(vals[0])), sp);
        return set_span(NEWNODE(AST::ExprNode_Tuple, mv$(vals)), sp);
        }
    case TOK_SQUARE_OPEN: {
        bool trailing_comma;
        auto vals = Parse_ExprList(lex, TOK_SQUARE_CLOSE, trailing_comma);
        return set_span(NEWNODE(AST::ExprNode_Array, mv$(vals)), lex.end_span(ps));
        }
    default:
        if( Parse_IsPathStart(tok.type()) )
        {
            PUTBACK(tok, lex);
            auto path = Parse_Path(lex);
            if( lex.getTokenIf(TOK_EXCLAM) )
            {
                auto inv = Parse_MacroInvocation(ps, mv$(path), lex);
                return set_span(NEWNODE(AST::ExprNode_Macro, mv$(inv)), lex.end_span(ps));
            }
            return set_span(NEWNODE(AST::ExprNode_NamedValue, mv$(path)), lex.end_span(ps));
        }
        throw ParseError::Unexpected(lex, tok);
    }
}
}   // namespace

rust::option<AST::Stmt> Parse_Stmt(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;

    if( lex.lookahead(0) == TOK_EOF )
        return rust::None<AST::Stmt>();

    auto ps = lex.start_span();
    if( lex.getTokenIf(TOK_SEMICOLON) )
        return rust::Some(AST::Stmt(lex.end_span(ps), AST::Stmt::Data::make_Empty({})));

    auto attrs = Parse_ItemAttrs(lex);

    switch( lex.lookahead(0) )
    {
    case TOK_RWORD_LET: {
        GET_CHECK_TOK(tok, lex, TOK_RWORD_LET);
        auto pat = Parse_Pattern(lex);
        ::std::unique_ptr<TypeRef>  ty;
        if( lex.getTokenIf(TOK_COLON) )
            ty = box$( Parse_Type(lex) );
        AST::ExprNodeP  init;
        if( lex.getTokenIf(TOK_EQUAL) )
            init = Parse_Expr(lex);
        GET_CHECK_TOK(tok, lex, TOK_SEMICOLON);
        AST::Stmt   rv(lex.end_span(ps), AST::Stmt::Data::make_Local({ mv$(pat), mv$(ty), mv$(init) }));
        rv.attrs = mv$(attrs);
        return rust::Some(mv$(rv));
        }
    case TOK_RWORD_PUB:
    case TOK_RWORD_STRUCT:
    case TOK_RWORD_ENUM:
    case TOK_RWORD_STATIC:
    case TOK_RWORD_CONST:
    case TOK_RWORD_IMPL:
    case TOK_RWORD_TRAIT:
    case TOK_RWORD_MOD:
    case TOK_RWORD_EXTERN: {
        auto item = Parse_Item(lex, mv$(attrs));
        return rust::Some(AST::Stmt::new_item(lex.end_span(ps), mv$(item)));
        }
    default:
        break;
    }

    // `union Foo { ... }` (contextual keyword)
    if( lex.lookahead(0) == TOK_IDENT && lex.lookahead(1) == TOK_IDENT )
    {
        GET_TOK(tok, lex);
        bool is_union = (tok.ident() == "union");
        PUTBACK(tok, lex);
        if( is_union )
        {
            auto item = Parse_Item(lex, mv$(attrs));
            return rust::Some(AST::Stmt::new_item(lex.end_span(ps), mv$(item)));
        }
    }

    // Statement macro (`foo!(...);`, `foo! { ... }` or a trailing `foo!(...)`)
    if( Parse_IsPathStart(lex.lookahead(0)) )
    {
        auto path = Parse_Path(lex);
        if( lex.getTokenIf(TOK_EXCLAM) )
        {
            auto inv = Parse_MacroInvocation(ps, mv$(path), lex);
            AST::MacStmtStyle   style;
            if( lex.getTokenIf(TOK_SEMICOLON) )
                style = AST::MacStmtStyle::Semicolon;
            else if( inv.delim() == AST::MacDelimiter::Brace )
                style = AST::MacStmtStyle::Braces;
            else
                style = AST::MacStmtStyle::NoBraces;
            AST::Stmt   rv(lex.end_span(ps), AST::Stmt::Data::make_Macro({ mv$(inv), style }));
            rv.attrs = mv$(attrs);
            return rust::Some(mv$(rv));
        }
        auto expr = set_span(NEWNODE(AST::ExprNode_NamedValue, mv$(path)), lex.end_span(ps));
        expr->set_attrs(mv$(attrs));
        if( lex.getTokenIf(TOK_SEMICOLON) )
            return rust::Some(AST::Stmt::new_semi(lex.end_span(ps), mv$(expr)));
        return rust::Some(AST::Stmt::new_expr(lex.end_span(ps), mv$(expr)));
    }

    auto expr = Parse_Expr(lex);
    expr->set_attrs(mv$(attrs));
    if( lex.getTokenIf(TOK_SEMICOLON) )
        return rust::Some(AST::Stmt::new_semi(lex.end_span(ps), mv$(expr)));
    return rust::Some(AST::Stmt::new_expr(lex.end_span(ps), mv$(expr)));
}

// Token Tree Parsing
TokenTree Parse_TT(TokenStream& lex, bool unwrapped)
{
    TokenTree   rv;
    TRACE_FUNCTION_FR("", rv);

    Token tok = lex.getToken();
    eTokenType  closer = TOK_PAREN_CLOSE;
    switch(tok.type())
    {
    case TOK_PAREN_OPEN:
        closer = TOK_PAREN_CLOSE;
        break;
    case TOK_SQUARE_OPEN:
        closer = TOK_SQUARE_CLOSE;
        break;
    case TOK_BRACE_OPEN:
        closer = TOK_BRACE_CLOSE;
        break;

    case TOK_EOF:
    case TOK_NULL:
    case TOK_PAREN_CLOSE:
    case TOK_SQUARE_CLOSE:
    case TOK_BRACE_CLOSE:
        throw ParseError::Unexpected(lex, tok);
    default:
        rv = TokenTree( mv$(tok) );
        DEBUG(rv);
        return rv;
    }

    ::std::vector<TokenTree>   items;
    if( !unwrapped )
        items.push_back( TokenTree(mv$(tok)) );
    while(GET_TOK(tok, lex) != closer)
    {
        if( tok.type() == TOK_NULL || tok.type() == TOK_EOF )
            throw ParseError::Unexpected(lex, tok, Token(closer));
        PUTBACK(tok, lex);
        items.push_back(Parse_TT(lex, false));
    }
    if( !unwrapped )
        items.push_back( TokenTree(mv$(tok)) );
    rv = TokenTree( mv$(items) );
    DEBUG(rv);
    return rv;
}

TokenTree Parse_TokenStream(TokenStream& lex)
{
    TRACE_FUNCTION;
    ::std::vector<TokenTree>    items;
    while( lex.lookahead(0) != TOK_EOF )
    {
        items.push_back( Parse_TT(lex, false) );
    }
    return TokenTree( mv$(items) );
}
