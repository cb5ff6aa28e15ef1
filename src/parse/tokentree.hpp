/*
 * synext - Syntax extension expansion core
 *
 * parse/tokentree.hpp
 * - Token Trees (groups of tokens)
 *
 * A leaf holds a single token. A group holds its subtrees, including the
 * opening and closing delimiter tokens when it came from a delimited group.
 * The input to a macro is an undelimited group.
 */
#ifndef TOKENTREE_HPP_INCLUDED
#define TOKENTREE_HPP_INCLUDED

#include "token.hpp"
#include <vector>

class TokenTree
{
    Token   m_tok;
    ::std::vector<TokenTree>    m_subtrees;
public:
    virtual ~TokenTree() {}
    TokenTree() {}
    TokenTree(TokenTree&&) = default;
    TokenTree& operator=(TokenTree&&) = default;
    TokenTree(enum eTokenType ty):
        m_tok( Token(ty) )
    {
    }
    TokenTree(Token tok):
        m_tok( ::std::move(tok) )
    {
    }
    TokenTree(::std::vector<TokenTree> subtrees):
        m_subtrees( ::std::move(subtrees) )
    {
    }

    TokenTree clone() const;

    bool is_token() const {
        return m_tok.type() != TOK_NULL;
    }
    /// An undelimited group with nothing in it
    bool is_empty() const {
        return !is_token() && m_subtrees.empty();
    }
    size_t size() const {
        return m_subtrees.size();
    }
    const TokenTree& operator[](unsigned int idx) const { assert(idx < m_subtrees.size()); return m_subtrees[idx]; }
          TokenTree& operator[](unsigned int idx)       { assert(idx < m_subtrees.size()); return m_subtrees[idx]; }
    const Token& tok() const { return m_tok; }
          Token& tok()       { return m_tok; }
    const ::std::vector<TokenTree>& subtrees() const { return m_subtrees; }
          ::std::vector<TokenTree>& subtrees()       { return m_subtrees; }

    /// Span of the first token in the tree (dummy if there are none)
    Span span() const;
    /// Number of leaf tokens
    size_t token_count() const;

    /// Source-like rendering (used by `stringify!` and for re-lexing)
    ::std::string to_source() const;

    friend ::std::ostream& operator<<(::std::ostream& os, const TokenTree& tt);
};

#endif // TOKENTREE_HPP_INCLUDED
