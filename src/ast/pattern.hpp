/*
 * synext - Syntax extension expansion core
 *
 * ast/pattern.hpp
 * - AST Patterns
 */
#ifndef _AST_PATTERN_HPP_INCLUDED_
#define _AST_PATTERN_HPP_INCLUDED_

#include <vector>
#include <memory>
#include <string>
#include <tagged_union.hpp>
#include "path.hpp"
#include "macro.hpp"
#include "expr_ptr.hpp"

namespace AST {

class Pattern
{
public:
    TAGGED_UNION(Data, Any,
        // `_`
        (Any, struct {}),
        // A binding, or a path to a unit struct/constant (resolution decides)
        (MaybeBind, struct {
            Ident   name;
            bool    is_mut;
            }),
        // Literal or path
        (Value, struct {
            ExprNodeP   val;
            }),
        (Tuple, ::std::vector<Pattern>),
        (Macro, ::std::unique_ptr<MacroInvocation>)
        );
private:
    Span    m_span;
    Data    m_data;

public:
    virtual ~Pattern();

    Pattern():
        m_data( Data::make_Any({}) )
    {}
    Pattern(Span sp, Data data):
        m_span( mv$(sp) ),
        m_data( mv$(data) )
    {}

    Pattern(Pattern&&) = default;
    Pattern& operator=(Pattern&&) = default;
    Pattern(const Pattern&) = delete;
    Pattern& operator=(const Pattern&) = delete;

    static Pattern new_wild(Span sp) {
        return Pattern(mv$(sp), Data::make_Any({}));
    }
    static Pattern new_value(Span sp, ExprNodeP val) {
        return Pattern(mv$(sp), Data::make_Value({ mv$(val) }));
    }

    Pattern clone() const;

    const Span& span() const { return m_span; }
    void set_span(Span sp) { m_span = mv$(sp); }

    Data& data() { return m_data; }
    const Data& data() const { return m_data; }

    friend ::std::ostream& operator<<(::std::ostream& os, const Pattern& pat);
};

}

#endif
