/*
 * synext - Syntax extension expansion core
 *
 * ast/path.cpp
 * - AST::Path
 */
#include "path.hpp"

namespace AST {

const Ident& Path::as_trivial() const
{
    ASSERT_BUG(m_span, is_trivial(), "Path::as_trivial on non-trivial path " << *this);
    return m_segments[0];
}
const RcString& Path::last_name() const
{
    ASSERT_BUG(m_span, !m_segments.empty(), "Path::last_name on empty path");
    return m_segments.back().name;
}

bool Path::names_eq(const Path& x) const
{
    if( m_is_global != x.m_is_global )
        return false;
    if( m_segments.size() != x.m_segments.size() )
        return false;
    for(size_t i = 0; i < m_segments.size(); i ++)
    {
        if( m_segments[i].name != x.m_segments[i].name )
            return false;
    }
    return true;
}

::std::ostream& operator<<(::std::ostream& os, const Path& x)
{
    bool first = !x.m_is_global;
    for(const auto& seg : x.m_segments)
    {
        if( !first )
            os << "::";
        first = false;
        os << seg.name;
    }
    return os;
}

}   // namespace AST
