/*
 * synext - Syntax extension expansion core
 *
 * parse/parseerror.cpp
 * - Exceptions thrown for different types of parsing errors
 */
#include "parseerror.hpp"
#include <common.hpp>

namespace {
    Span tok_span(const TokenStream& lex, const Token& tok) {
        return tok.span() ? tok.span() : lex.point_span();
    }
}

ParseError::Base::Base(Span sp, ::std::string message):
    CompileError::Base( mv$(message) ),
    m_span( mv$(sp) )
{
}
ParseError::Base::~Base() throw()
{
}

ParseError::Generic::Generic(const TokenStream& lex, ::std::string message):
    Base( lex.point_span(), mv$(message) )
{
}
ParseError::Generic::Generic(Span sp, ::std::string message):
    Base( mv$(sp), mv$(message) )
{
}

ParseError::BadChar::BadChar(Span sp, uint32_t character):
    Base( mv$(sp), FMT("unknown start of token: \\u{" << ::std::hex << character << "}") )
{
}
ParseError::BadChar::~BadChar() throw()
{
}

ParseError::Unexpected::Unexpected(const TokenStream& lex, const Token& tok):
    Base( tok_span(lex, tok), FMT("unexpected token " << tok) ),
    m_tok( tok )
{
}
ParseError::Unexpected::Unexpected(const TokenStream& lex, const Token& tok, Token exp):
    Base( tok_span(lex, tok), FMT("expected " << exp << ", found " << tok) ),
    m_tok( tok )
{
}
ParseError::Unexpected::Unexpected(const TokenStream& lex, const Token& tok, ::std::vector<eTokenType> exp):
    Base( tok_span(lex, tok), FMT("expected one of " << FMT_CB(os, {
        bool f = true;
        for(auto v: exp) {
            if(!f)
                os << ", ";
            f = false;
            os << Token(v);
        }
        }) << ", found " << tok) ),
    m_tok( tok )
{
}
ParseError::Unexpected::~Unexpected() throw()
{
}
