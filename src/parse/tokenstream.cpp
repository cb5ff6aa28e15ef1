/*
 * synext - Syntax extension expansion core
 *
 * parse/tokenstream.cpp
 * - TokenStream - Parser token source interface
 */
#include "tokenstream.hpp"
#include <common.hpp>
#include "parseerror.hpp"

TokenStream::TokenStream():
    m_cache_valid(false)
{
}
TokenStream::~TokenStream()
{
}

Token TokenStream::innerGetToken()
{
    Token ret = this->realGetToken();
    if( ret != TOK_EOF && !ret.span() )
        ret.set_span( this->outerSpan() );
    return ret;
}
Token TokenStream::getToken()
{
    Token   ret;
    if( m_cache_valid )
    {
        DEBUG("<= " << m_cache << " (cache)");
        m_cache_valid = false;
        ret = mv$(m_cache);
    }
    else if( m_lookahead.size() )
    {
        ret = mv$( m_lookahead.front() );
        m_lookahead.erase(m_lookahead.begin());
        DEBUG("<= " << ret << " (lookahead)");
    }
    else
    {
        ret = this->innerGetToken();
        DEBUG("<= " << ret << " (new)");
    }
    if( ret.span() )
        m_last_span = ret.span();
    return ret;
}
Token TokenStream::getTokenCheck(eTokenType exp)
{
    auto tok = getToken();
    if(tok.type() != exp)
        throw ParseError::Unexpected(*this, tok, Token(exp));
    return tok;
}
void TokenStream::putback(Token tok)
{
    if( m_cache_valid )
    {
        DEBUG("Double putback: " << tok << " but " << m_cache);
        BUG(point_span(), "Double putback");
    }
    else
    {
        DEBUG(">>> " << tok);
        m_cache_valid = true;
        m_cache = mv$(tok);
    }
}

eTokenType TokenStream::lookahead(unsigned int i)
{
    const unsigned int MAX_LOOKAHEAD = 3;

    if( m_cache_valid )
    {
        if( i == 0 )
            return m_cache.type();
        i --;
    }

    if( i >= MAX_LOOKAHEAD )
        BUG(point_span(), "Excessive lookahead");

    while( i >= m_lookahead.size() )
    {
        m_lookahead.push_back( this->innerGetToken() );
    }

    DEBUG("lookahead(" << i << ") = " << m_lookahead[i]);
    return m_lookahead[i].type();
}

Span TokenStream::start_span()
{
    const Token* next;
    if( m_cache_valid ) {
        next = &m_cache;
    }
    else {
        lookahead(0);
        next = &m_lookahead.front();
    }
    if( next->span() )
        return next->span();
    return point_span();
}
Span TokenStream::point_span() const
{
    if( m_last_span )
        return m_last_span;
    return this->outerSpan();
}
Span TokenStream::end_span(const Span& start) const
{
    if( !start )
        return point_span();
    return start.to( point_span() );
}
