/*
 * synext - Syntax extension expansion core
 *
 * ast/macro.hpp
 * - AST representation of a macro invocation
 */
#ifndef _AST_MACRO_HPP_
#define _AST_MACRO_HPP_

#include "../parse/tokentree.hpp"
#include <span.hpp>
#include <hygiene.hpp>
#include "attrs.hpp"
#include <ast/path.hpp>

namespace AST {

enum class MacDelimiter {
    Parenthesis,
    Bracket,
    Brace,
};

/// `path!(input)`
///
/// Also used as the placeholder left behind by the invocation collector (see `is_placeholder`).
class MacroInvocation
{
    Span    m_span;

    AST::Path   m_macro_path;
    TokenTree   m_input;
    MacDelimiter    m_delim;
    /// Expansion that will replace this node (root for a real invocation)
    ExpnId  m_placeholder_id;
public:
    MacroInvocation(MacroInvocation&&) = default;
    MacroInvocation& operator=(MacroInvocation&&) = default;
    MacroInvocation(const MacroInvocation&) = delete;
    MacroInvocation& operator=(const MacroInvocation&) = delete;

    MacroInvocation():
        m_delim(MacDelimiter::Parenthesis)
    {
    }

    MacroInvocation(Span span, AST::Path macro, TokenTree input, MacDelimiter delim=MacDelimiter::Parenthesis):
        m_span( mv$(span) ),
        m_macro_path( mv$(macro) ),
        m_input( mv$(input) ),
        m_delim( delim )
    {
    }
    static MacroInvocation new_placeholder(Span span, ExpnId id) {
        MacroInvocation rv;
        rv.m_span = mv$(span);
        rv.m_placeholder_id = id;
        return rv;
    }

    MacroInvocation clone() const;

    const Span& span() const { return m_span; }
    const AST::Path& path() const { return m_macro_path; }
    MacDelimiter delim() const { return m_delim; }

    bool is_placeholder() const { return !m_placeholder_id.is_root(); }
    const ExpnId& placeholder_id() const { return m_placeholder_id; }

    const TokenTree& input_tt() const { return m_input; }
          TokenTree& input_tt()       { return m_input; }

    /// Tokens for the whole invocation (`path ! ( input )`)
    TokenTree to_tokens() const;

    friend ::std::ostream& operator<<(::std::ostream& os, const MacroInvocation& x);
};

}

#endif
