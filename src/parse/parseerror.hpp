/*
 * synext - Syntax extension expansion core
 *
 * parse/parseerror.hpp
 * - Exceptions thrown for different types of parsing errors
 */
#ifndef PARSEERROR_HPP_INCLUDED
#define PARSEERROR_HPP_INCLUDED

#include <vector>
#include <compile_error.hpp>
#include "tokenstream.hpp"

namespace ParseError {

/// Base for all parse errors, carries the location of the failure
class Base:
    public CompileError::Base
{
    Span    m_span;
public:
    Base(Span sp, ::std::string message);
    virtual ~Base() throw ();

    const Span& span() const { return m_span; }
};

class Generic:
    public Base
{
public:
    Generic(const TokenStream& lex, ::std::string message);
    Generic(Span sp, ::std::string message);
    virtual ~Generic() throw () {}
};

class BadChar:
    public Base
{
public:
    BadChar(Span sp, uint32_t character);
    virtual ~BadChar() throw ();
};

class Unexpected:
    public Base
{
    Token   m_tok;
public:
    Unexpected(const TokenStream& lex, const Token& tok);
    Unexpected(const TokenStream& lex, const Token& tok, Token exp);
    Unexpected(const TokenStream& lex, const Token& tok, ::std::vector<eTokenType> exp);
    virtual ~Unexpected() throw ();

    const Token& tok() const { return m_tok; }
};

}

#endif // PARSEERROR_HPP_INCLUDED
