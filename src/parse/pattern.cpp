/*
 * synext - Syntax extension expansion core
 *
 * parse/pattern.cpp
 * - Parsing for patterns
 */
#include "common.hpp"
#include <ast/expr.hpp>

AST::Pattern Parse_Pattern(TokenStream& lex)
{
    TRACE_FUNCTION;
    Token   tok;
    auto ps = lex.start_span();

    switch( GET_TOK(tok, lex) )
    {
    case TOK_UNDERSCORE:
        return AST::Pattern::new_wild(tok.span());
    case TOK_RWORD_MUT: {
        GET_CHECK_TOK(tok, lex, TOK_IDENT);
        auto name = Ident(tok.ident(), tok.span());
        return AST::Pattern(lex.end_span(ps), AST::Pattern::Data::make_MaybeBind({ mv$(name), true }));
        }
    case TOK_INTEGER:
    case TOK_CHAR:
    case TOK_STRING:
    case TOK_RWORD_TRUE:
    case TOK_RWORD_FALSE:
        return AST::Pattern::new_value(tok.span(), Parse_ExprLiteral(mv$(tok)));
    case TOK_PAREN_OPEN: {
        ::std::vector<AST::Pattern> sub;
        bool trailing_comma = false;
        while( lex.lookahead(0) != TOK_PAREN_CLOSE )
        {
            sub.push_back( Parse_Pattern(lex) );
            trailing_comma = false;
            if( !lex.getTokenIf(TOK_COMMA) )
                break;
            trailing_comma = true;
        }
        GET_CHECK_TOK(tok, lex, TOK_PAREN_CLOSE);
        if( sub.size() == 1 && !trailing_comma )
        {
            // `(pat)` is just `pat`
            auto rv = mv$(sub[0]);
            rv.set_span( lex.end_span(ps) );
            return rv;
        }
        return AST::Pattern(lex.end_span(ps), AST::Pattern::Data::make_Tuple(mv$(sub)));
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
            return AST::Pattern(lex.end_span(ps), AST::Pattern::Data::make_Macro( box$(inv) ));
        }
        if( path.is_trivial() )
        {
            auto name = path.as_trivial();
            return AST::Pattern(lex.end_span(ps), AST::Pattern::Data::make_MaybeBind({ mv$(name), false }));
        }
        auto sp = lex.end_span(ps);
        AST::ExprNodeP  val { new AST::ExprNode_NamedValue(mv$(path)) };
        val->set_span(sp);
        return AST::Pattern::new_value(mv$(sp), mv$(val));
    }
    throw ParseError::Unexpected(lex, tok);
}
