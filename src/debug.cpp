/*
 * synext - Syntax extension expansion core
 *
 * debug.cpp
 * - Debug printing (with indenting and per-phase toggles)
 */
#include <debug_inner.hpp>
#include <debug.hpp>
#include <set>
#include <iostream>
#include <iomanip>
#include <common.hpp>   // FmtEscaped
#include <cstring>	// strchr
#include <cstdint>
#include <cstdlib>  // getenv

int g_debug_indent_level = 0;
namespace {
    bool g_debug_enabled = false;
    bool g_phases_initialised = false;
    const char* g_cur_phase = "";
    ::std::set< ::std::string>    g_debug_disable_map;

    bool debug_enabled_update() {
        // Output outside of a named phase is never shown
        if( g_cur_phase[0] == '\0' )
            return false;
        return g_debug_disable_map.count(g_cur_phase) == 0;
    }
}

TraceLog::TraceLog(const char* tag, ::std::function<void(::std::ostream&)> info_cb, ::std::function<void(::std::ostream&)> ret):
    m_tag(tag),
    m_ret(ret)
{
    if(debug_enabled() && m_tag) {
        auto& os = debug_output(g_debug_indent_level, m_tag);
        os << ">> (";
        info_cb(os);
        os << ")" << ::std::endl;
    }
    INDENT();
}
TraceLog::TraceLog(const char* tag, ::std::function<void(::std::ostream&)> info_cb):
    TraceLog(tag, mv$(info_cb), [](::std::ostream&){})
{
}
TraceLog::TraceLog(const char* tag):
    m_tag(tag),
    m_ret([](::std::ostream&){})
{
    if(debug_enabled() && m_tag) {
        debug_output(g_debug_indent_level, m_tag) << ">>" << ::std::endl;
    }
    INDENT();
}
TraceLog::~TraceLog() {
    UNINDENT();
    if(debug_enabled() && m_tag) {
        auto& os = debug_output(g_debug_indent_level, m_tag);
        os << "<< (";
        m_ret(os);
        os << ")" << ::std::endl;
    }
}

bool debug_enabled()
{
    return g_debug_enabled;
}
bool debug_phase_enabled(const char* name)
{
    return g_debug_disable_map.count(name) == 0;
}
::std::ostream& debug_output(int indent, const char* function)
{
    return ::std::cout << g_cur_phase << "- " << RepeatLitStr { " ", indent } << function << ": ";
}

DebugTimedPhase::DebugTimedPhase(const char* name):
    m_name(name),
    m_prev_name(g_cur_phase),
    m_prev_enabled(g_debug_enabled)
{
    g_cur_phase = m_name;
    g_debug_enabled = debug_enabled_update();
    if( g_debug_enabled )
        ::std::cout << m_name << ": V V V" << ::std::endl;
    m_start = clock();
}
DebugTimedPhase::~DebugTimedPhase()
{
    auto end = clock();
    if( g_debug_enabled )
    {
        ::std::cout << "(" << ::std::fixed << ::std::setprecision(2) << static_cast<double>(end - m_start) / static_cast<double>(CLOCKS_PER_SEC) << " s) ";
        ::std::cout << m_name << ": DONE" << ::std::endl;
    }
    g_cur_phase = m_prev_name;
    g_debug_enabled = m_prev_enabled;
}

void debug_init_phases(const char* env_var_name, std::initializer_list<const char*> il)
{
    if( g_phases_initialised )
        return ;
    g_phases_initialised = true;

    for(const char* e : il)
    {
        g_debug_disable_map.insert(e);
    }

    const char* debug_string = ::std::getenv(env_var_name);
    if( debug_string )
    {
        while( debug_string[0] )
        {
            const char* end = strchr(debug_string, ':');

            ::std::string   s;
            if( end )
            {
                s = ::std::string { debug_string, end };
                debug_string = end + 1;
            }
            else
            {
                s = debug_string;
            }
            if( g_debug_disable_map.erase(s) == 0 )
            {
                ::std::cerr << "WARN: Unknown debug phase '" << s << "' in $" << env_var_name << ::std::endl;
            }
            if( !end ) {
                break;
            }
        }
    }
}


::std::ostream& operator<<(::std::ostream& os, const FmtEscaped& x)
{
    for(auto s = x.s; s != x.e; s ++)
    {
        switch(*s)
        {
        case '\0':  os << "\\0";    break;
        case '\n':  os << "\\n";    break;
        case '\t':  os << "\\t";    break;
        case '\\':  os << "\\\\";   break;
        case '"':   os << "\\\"";   break;
        default: {
            uint8_t v = *s;
            if( v < ' ' || v == 0x7F )
                os << "\\u{" << ::std::hex << (unsigned int)v << ::std::dec << "}";
            else
                // UTF-8 sequences pass through unchanged
                os << *s;
            } break;
        }
    }
    return os;
}
