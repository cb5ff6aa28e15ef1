/*
 * synext - Syntax extension expansion core
 *
 * parse/ttstream.cpp
 * - Token-Tree backed token streams
 */
#include "ttstream.hpp"
#include <common.hpp>

TTStream::TTStream(Span parent, const TokenTree& input_tt):
    m_parent_span( mv$(parent) )
{
    DEBUG("input_tt = [" << input_tt << "]");
    m_stack.push_back( ::std::make_pair(0, &input_tt) );
}
TTStream::~TTStream()
{
}
Token TTStream::realGetToken()
{
    while(m_stack.size() > 0)
    {
        // If current index is above TT size, go up
        unsigned int& idx = m_stack.back().first;
        assert( m_stack.back().second );
        const TokenTree& tree = *m_stack.back().second;

        if(idx == 0 && tree.is_token()) {
            idx ++;
            return tree.tok();
        }

        if(idx < tree.size())
        {
            const TokenTree&    subtree = tree[idx];
            idx ++;
            if( subtree.is_token() ) {
                return subtree.tok();
            }
            else {
                m_stack.push_back( ::std::make_pair(0, &subtree) );
            }
        }
        else {
            m_stack.pop_back();
        }
    }
    return Token(TOK_EOF, m_parent_span);
}
