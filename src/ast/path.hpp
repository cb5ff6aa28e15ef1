/*
 * synext - Syntax extension expansion core
 *
 * ast/path.hpp
 * - AST::Path
 */
#ifndef AST_PATH_HPP_INCLUDED
#define AST_PATH_HPP_INCLUDED

#include "../common.hpp"
#include <string>
#include <vector>
#include <span.hpp>
#include <ident.hpp>

namespace AST {

/// A (simple) path, e.g. `foo`, `::core::clone::Clone` or `$crate::fmt`
class Path
{
    Span    m_span;
    bool    m_is_global;
    ::std::vector<Ident>    m_segments;
public:
    Path():
        m_is_global(false)
    {}
    Path(Span sp, bool is_global, ::std::vector<Ident> segments):
        m_span( mv$(sp) ),
        m_is_global(is_global),
        m_segments( mv$(segments) )
    {}
    static Path from_ident(Ident i) {
        auto sp = i.span;
        return Path(mv$(sp), false, make_vec1(mv$(i)));
    }

    Path(Path&&) = default;
    Path& operator=(Path&&) = default;
    Path(const Path&) = default;
    Path& operator=(const Path&) = default;

    const Span& span() const { return m_span; }
    void set_span(Span sp) { m_span = mv$(sp); }
    bool is_global() const { return m_is_global; }
    bool is_valid() const { return !m_segments.empty(); }
    const ::std::vector<Ident>& segments() const { return m_segments; }
          ::std::vector<Ident>& segments()       { return m_segments; }

    /// A single-segment, non-global path
    bool is_trivial() const { return !m_is_global && m_segments.size() == 1; }
    const Ident& as_trivial() const;
    /// Last segment name
    const RcString& last_name() const;

    /// Compare segment names (ignoring hygiene)
    bool names_eq(const Path& x) const;
    bool operator==(const char* s) const { return is_trivial() && m_segments[0].name == s; }

    friend ::std::ostream& operator<<(::std::ostream& os, const Path& x);
};

}   // namespace AST

#endif
