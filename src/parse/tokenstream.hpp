/*
 * synext - Syntax extension expansion core
 *
 * parse/tokenstream.hpp
 * - Parser stream (TokenStream) header
 */
#pragma once

#include <iostream>
#include <vector>
#include <span.hpp>
#include <debug.hpp>
#include "token.hpp"

class TokenStream
{
    bool    m_cache_valid;
    Token   m_cache;
    ::std::vector<Token>    m_lookahead;
    Span    m_last_span;
public:
    TokenStream();
    virtual ~TokenStream();
    Token   getToken();
    /// Consumes a token if it is of the specified type
    bool   getTokenIf(eTokenType exp) {
        if(lookahead(0) == exp) {
            getToken();
            return true;
        }
        else {
            return false;
        }
    }
    /// Obtains a token, erroring if it's not of the specified type
    Token   getTokenCheck(eTokenType exp);
    void    putback(Token tok);
    eTokenType  lookahead(unsigned int count);

    /// Span of the next token (without consuming it)
    Span    start_span();
    /// Span of the most recently read token
    Span    point_span() const;
    /// Span from `start` to the most recently read token
    Span    end_span(const Span& start) const;

protected:
    virtual Span    outerSpan() const { return Span(); }
    virtual Token   realGetToken() = 0;
private:
    Token innerGetToken();
};
