/*
 * synext - Syntax extension expansion core
 *
 * parse/types.cpp
 * - Parsing for type usages
 */
#include "common.hpp"
#include <ast/expr.hpp>

TypeRef Parse_Type(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    auto ps = lex.start_span();

    switch( GET_TOK(tok, lex) )
    {
    case TOK_UNDERSCORE:
        return TypeRef(tok.span(), TypeRef::Data::make_Infer({}));
    case TOK_DOUBLE_AMP: {
        // `&&T` is `& &T`
        RcString    lifetime;
        if( lex.lookahead(0) == TOK_LIFETIME )
            lifetime = RcString::new_interned(lex.getToken().str());
        bool is_mut = lex.getTokenIf(TOK_RWORD_MUT);
        auto inner = Parse_Type(lex);
        auto sp = lex.end_span(ps);
        auto rv = TypeRef::new_borrow(sp, mv$(lifetime), is_mut, mv$(inner));
        return TypeRef::new_borrow(sp, RcString(), false, mv$(rv));
        }
    case TOK_AMP: {
        RcString    lifetime;
        if( lex.lookahead(0) == TOK_LIFETIME )
            lifetime = RcString::new_interned(lex.getToken().str());
        bool is_mut = lex.getTokenIf(TOK_RWORD_MUT);
        auto inner = Parse_Type(lex);
        return TypeRef::new_borrow(lex.end_span(ps), mv$(lifetime), is_mut, mv$(inner));
        }
    case TOK_SQUARE_OPEN: {
        auto inner = Parse_Type(lex);
        GET_CHECK_TOK(tok, lex, TOK_SEMICOLON);
        auto size = Parse_Expr(lex);
        GET_CHECK_TOK(tok, lex, TOK_SQUARE_CLOSE);
        return TypeRef::new_array(lex.end_span(ps), mv$(inner), mv$(size));
        }
    case TOK_PAREN_OPEN: {
        ::std::vector<TypeRef>  types;
        bool trailing_comma = false;
        while( lex.lookahead(0) != TOK_PAREN_CLOSE )
        {
            types.push_back( Parse_Type(lex) );
            trailing_comma = false;
            if( !lex.getTokenIf(TOK_COMMA) )
                break;
            trailing_comma = true;
        }
        GET_CHECK_TOK(tok, lex, TOK_PAREN_CLOSE);
        if( types.size() == 1 && !trailing_comma )
        {
            // Parenthesised type
            auto rv = mv$(types[0]);
            rv.m_span = lex.end_span(ps);
            return rv;
        }
        return TypeRef(lex.end_span(ps), TypeRef::Data::make_Tuple(mv$(types)));
        }
    default:
        break;
    }

    if( Parse_IsPathStart(tok.type()) )
    {
        PUTBACK(tok, lex);
        auto path = Parse_Path(lex);
        if( lex.getTokenIf(TOK_EXCLAM) )
        {
            auto inv = Parse_MacroInvocation(ps, mv$(path), lex);
            return TypeRef(lex.end_span(ps), TypeRef::Data::make_Macro(mv$(inv)));
        }
        return TypeRef::new_path(lex.end_span(ps), mv$(path));
    }
    throw ParseError::Unexpected(lex, tok);
}
