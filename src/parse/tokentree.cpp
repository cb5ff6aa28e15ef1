/*
 * synext - Syntax extension expansion core
 *
 * parse/tokentree.cpp
 * - Token Tree (collection of tokens)
 */
#include "tokentree.hpp"
#include <common.hpp>

TokenTree TokenTree::clone() const
{
    if( m_subtrees.size() == 0 ) {
        return TokenTree(m_tok);
    }
    else {
        ::std::vector< TokenTree>   ents;
        ents.reserve( m_subtrees.size() );
        for(const auto& sub : m_subtrees)
            ents.push_back( sub.clone() );
        return TokenTree( mv$(ents) );
    }
}

Span TokenTree::span() const
{
    if( is_token() )
        return m_tok.span();
    for(const auto& sub : m_subtrees)
    {
        auto sp = sub.span();
        if( sp )
            return sp;
    }
    return Span();
}

size_t TokenTree::token_count() const
{
    if( is_token() )
        return 1;
    size_t  rv = 0;
    for(const auto& sub : m_subtrees)
        rv += sub.token_count();
    return rv;
}

namespace {
    void flatten(const TokenTree& tt, ::std::vector<const Token*>& out)
    {
        if( tt.is_token() ) {
            out.push_back(&tt.tok());
        }
        else {
            for(const auto& sub : tt.subtrees())
                flatten(sub, out);
        }
    }
    bool no_space_before(eTokenType ty)
    {
        switch(ty)
        {
        case TOK_PAREN_CLOSE:
        case TOK_SQUARE_CLOSE:
        case TOK_COMMA:
        case TOK_SEMICOLON:
        case TOK_COLON:
        case TOK_DOT:
        case TOK_DOUBLE_COLON:
        case TOK_QMARK:
            return true;
        default:
            return false;
        }
    }
    bool no_space_after(eTokenType ty)
    {
        switch(ty)
        {
        case TOK_PAREN_OPEN:
        case TOK_SQUARE_OPEN:
        case TOK_DOT:
        case TOK_DOUBLE_COLON:
        case TOK_HASH:
        case TOK_DOLLAR:
            return true;
        default:
            return false;
        }
    }
}

::std::string TokenTree::to_source() const
{
    ::std::vector<const Token*> toks;
    flatten(*this, toks);

    ::std::string   rv;
    const Token* prev = nullptr;
    for(const auto* tok : toks)
    {
        if( prev )
        {
            bool space = true;
            if( no_space_after(prev->type()) || no_space_before(tok->type()) )
                space = false;
            // `foo!(...)`, `foo(...)` and `x[...]`
            else if( tok->type() == TOK_EXCLAM && prev->type() == TOK_IDENT )
                space = false;
            else if( (tok->type() == TOK_PAREN_OPEN || tok->type() == TOK_SQUARE_OPEN)
                    && (prev->type() == TOK_IDENT || prev->type() == TOK_EXCLAM) )
                space = false;
            if( space )
                rv += ' ';
        }
        rv += tok->to_str();
        prev = tok;
    }
    return rv;
}

::std::ostream& operator<<(::std::ostream& os, const TokenTree& tt)
{
    if( tt.is_token() )
        return os << tt.m_tok;
    return os << "TT(" << tt.to_source() << ")";
}
