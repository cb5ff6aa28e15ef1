/*
 * synext - Syntax extension expansion core
 *
 * parse/paths.cpp
 * - Parsing for module paths and macro invocations
 */
#include "common.hpp"
#include "../ast/ast.hpp"

namespace {
    /// Parse a single path segment (the current token has already been read)
    Ident Parse_PathSegment(TokenStream& lex, Token tok)
    {
        switch(tok.type())
        {
        case TOK_IDENT:
            return Ident(tok.ident(), tok.span());
        case TOK_DOLLAR: {
            auto sp = tok.span();
            GET_CHECK_TOK(tok, lex, TOK_RWORD_CRATE);
            return Ident(RcString::new_interned("$crate"), lex.end_span(sp));
            }
        case TOK_RWORD_CRATE:
            return Ident(RcString::new_interned("crate"), tok.span());
        case TOK_RWORD_SELF:
            return Ident(RcString::new_interned("self"), tok.span());
        case TOK_RWORD_SUPER:
            return Ident(RcString::new_interned("super"), tok.span());
        default:
            throw ParseError::Unexpected(lex, tok, { TOK_IDENT, TOK_RWORD_CRATE, TOK_RWORD_SELF, TOK_RWORD_SUPER });
        }
    }
}

bool Parse_IsPathStart(eTokenType tok_type)
{
    switch(tok_type)
    {
    case TOK_IDENT:
    case TOK_DOUBLE_COLON:
    case TOK_DOLLAR:
    case TOK_RWORD_CRATE:
    case TOK_RWORD_SELF:
    case TOK_RWORD_SUPER:
        return true;
    default:
        return false;
    }
}

AST::Path Parse_Path(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    auto ps = lex.start_span();

    bool is_global = false;
    if( lex.getTokenIf(TOK_DOUBLE_COLON) )
        is_global = true;

    ::std::vector<Ident>    segments;
    segments.push_back( Parse_PathSegment(lex, lex.getToken()) );
    while( lex.lookahead(0) == TOK_DOUBLE_COLON )
    {
        // `foo::{...}` and `foo::<T>` are not supported
        GET_CHECK_TOK(tok, lex, TOK_DOUBLE_COLON);
        segments.push_back( Parse_PathSegment(lex, lex.getToken()) );
    }
    return AST::Path(lex.end_span(ps), is_global, mv$(segments));
}

AST::MacroInvocation Parse_MacroInvocation(Span start, AST::Path path, TokenStream& lex)
{
    TRACE_FUNCTION_F(path);
    AST::MacDelimiter   delim;
    switch(lex.lookahead(0))
    {
    case TOK_PAREN_OPEN:    delim = AST::MacDelimiter::Parenthesis; break;
    case TOK_SQUARE_OPEN:   delim = AST::MacDelimiter::Bracket; break;
    case TOK_BRACE_OPEN:    delim = AST::MacDelimiter::Brace;   break;
    default: {
        auto tok = lex.getToken();
        throw ParseError::Unexpected(lex, tok, { TOK_PAREN_OPEN, TOK_SQUARE_OPEN, TOK_BRACE_OPEN });
        }
    }
    TokenTree tt = Parse_TT(lex, true);
    if( tt.is_token() ) {
        throw ParseError::Unexpected(lex, tt.tok());
    }
    return AST::MacroInvocation(lex.end_span(start), mv$(path), mv$(tt), delim);
}
