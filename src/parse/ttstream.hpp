/*
 * synext - Syntax extension expansion core
 *
 * parse/ttstream.hpp
 * - Token tree streams (for post-lex parsing)
 */
#pragma once

#include "tokentree.hpp"
#include "tokenstream.hpp"

/// Borrowed TTStream
///
/// Tokens without a span of their own are given the stream's parent span.
class TTStream:
    public TokenStream
{
    ::std::vector< ::std::pair<unsigned int, const TokenTree*> > m_stack;
    Span m_parent_span;
public:
    TTStream(Span parent, const TokenTree& input_tt);
    ~TTStream();

    Span outerSpan() const override { return m_parent_span; }

protected:
    Token realGetToken() override;
};
