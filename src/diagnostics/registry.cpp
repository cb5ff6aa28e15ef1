/*
 * synext - Syntax extension expansion core
 *
 * diagnostics/registry.cpp
 * - Error code registry
 */
#include "registry.hpp"
#include <common.hpp>
#include <debug.hpp>

namespace Diagnostics {

namespace {
    /// Width of a line in characters (UTF-8 continuation bytes do not count)
    size_t line_width(const ::std::string& line)
    {
        size_t  rv = 0;
        for(char c : line)
        {
            if( (static_cast<unsigned char>(c) & 0xC0) != 0x80 )
                rv ++;
        }
        return rv;
    }
}

bool ErrorRegistry::register_code(const RcString& code, rust::option<::std::string> description)
{
    TRACE_FUNCTION_F(code);
    ::std::lock_guard<::std::mutex> lh { m_lock };
    auto it = m_codes.find(code);
    if( it != m_codes.end() )
    {
        DEBUG("Already registered");
        return false;
    }
    m_codes.insert( ::std::make_pair(code, ErrorInfo { mv$(description), rust::None<Span>() }) );
    return true;
}
ErrorRegistry::UseResult ErrorRegistry::mark_used(const RcString& code, const Span& sp)
{
    TRACE_FUNCTION_F(code << " @ " << sp);
    ::std::lock_guard<::std::mutex> lh { m_lock };
    auto it = m_codes.find(code);
    if( it == m_codes.end() )
    {
        return UseResult { UseResult::Kind::Unregistered, Span() };
    }
    auto& info = it->second;
    if( info.use_site.is_none() )
    {
        info.use_site = rust::Some(sp);
        return UseResult { UseResult::Kind::First, Span() };
    }
    const auto& prev = info.use_site.unwrap();
    if( prev.same_location(sp) )
    {
        return UseResult { UseResult::Kind::Repeat, prev };
    }
    DEBUG("Previously used at " << prev);
    return UseResult { UseResult::Kind::Reused, prev };
}

bool ErrorRegistry::is_registered(const RcString& code) const
{
    ::std::lock_guard<::std::mutex> lh { m_lock };
    return m_codes.count(code) > 0;
}
rust::option<ErrorInfo> ErrorRegistry::get(const RcString& code) const
{
    ::std::lock_guard<::std::mutex> lh { m_lock };
    auto it = m_codes.find(code);
    if( it == m_codes.end() )
        return rust::None<ErrorInfo>();
    return rust::Some(it->second);
}
size_t ErrorRegistry::size() const
{
    ::std::lock_guard<::std::mutex> lh { m_lock };
    return m_codes.size();
}

::std::vector< ::std::pair<RcString, ::std::string> > ErrorRegistry::render() const
{
    ::std::lock_guard<::std::mutex> lh { m_lock };
    ::std::vector< ::std::pair<RcString, ::std::string> >   rv;
    // NOTE: `std::map` iterates in ascending key order
    for(const auto& e : m_codes)
    {
        if( e.second.description.is_some() )
            rv.push_back( ::std::make_pair(e.first, e.second.description.unwrap()) );
    }
    return rv;
}

bool ErrorRegistry::is_url_footnote(const ::std::string& line)
{
    // `[name]:` followed by optional spaces and `http`
    if( line.size() < 2 || line[0] != '[' )
        return false;
    auto close = line.find("]:", 2);
    if( close == ::std::string::npos )
        return false;
    auto pos = close + 2;
    while( pos < line.size() && line[pos] == ' ' )
        pos ++;
    return line.compare(pos, 4, "http") == 0;
}

::std::vector<::std::string> ErrorRegistry::check_description(const RcString& code, const ::std::string& description)
{
    ::std::vector<::std::string>    rv;
    if( description.empty() || description.front() != '\n' || description.back() != '\n' )
    {
        rv.push_back(FMT("description for error code " << code << " doesn't start and end with a newline"));
    }

    size_t  start = 0;
    while( start < description.size() )
    {
        auto end = description.find('\n', start);
        if( end == ::std::string::npos )
            end = description.size();
        auto line = description.substr(start, end - start);
        if( line_width(line) > MAX_DESCRIPTION_WIDTH && !is_url_footnote(line) )
        {
            rv.push_back(FMT("description for error code " << code << " contains a line longer than "
                << MAX_DESCRIPTION_WIDTH << " characters.\n"
                << "if you're inserting a long URL use the footnote style to bypass this check."));
            break;
        }
        start = end + 1;
    }
    return rv;
}

}   // namespace Diagnostics
