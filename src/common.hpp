/*
 * synext - Syntax extension expansion core
 *
 * common.hpp
 * - Library-wide common header
 */
#ifndef _SYNEXT_COMMON_HPP_
#define _SYNEXT_COMMON_HPP_

#include <iostream>
#include <vector>
#include <map>
#include <set>
#include <cassert>
#include <sstream>
#include <memory>

#define FMT(ss)    (static_cast<::std::ostringstream&&>(::std::ostringstream() << ss).str())
// Shorter name for ::std::move
#define mv$(...) ::std::move(__VA_ARGS__)
#define box$(...) ::make_unique_ptr(::std::move(__VA_ARGS__))

#include "include/debug.hpp"
#include "include/compile_error.hpp"

template<typename T>
::std::unique_ptr<T> make_unique_ptr(T&& v) {
    return ::std::unique_ptr<T>(new T(mv$(v)));
}
template<typename T>
::std::vector<T> make_vec1(T&& v) {
    ::std::vector<T>    rv;
    rv.push_back( mv$(v) );
    return rv;
}

enum Ordering
{
    OrdLess = -1,
    OrdEqual,
    OrdGreater,
};
static inline Ordering ord(bool l, bool r)
{
    if(l == r)
        return OrdEqual;
    else if( l )
        return OrdGreater;
    else
        return OrdLess;
}
static inline Ordering ord(int l, int r)
{
    return (l == r ? OrdEqual : (l > r ? OrdGreater : OrdLess));
}
static inline Ordering ord(unsigned l, unsigned r)
{
    return (l == r ? OrdEqual : (l > r ? OrdGreater : OrdLess));
}
static inline Ordering ord(unsigned long l, unsigned long r)
{
    return (l == r ? OrdEqual : (l > r ? OrdGreater : OrdLess));
}
static inline Ordering ord(unsigned long long l, unsigned long long r)
{
    return (l == r ? OrdEqual : (l > r ? OrdGreater : OrdLess));
}
static inline Ordering ord(const ::std::string& l, const ::std::string& r)
{
    if(l == r)
        return OrdEqual;
    else if( l > r )
        return OrdGreater;
    else
        return OrdLess;
}
template<typename T>
Ordering ord(const T& l, const T& r)
{
    return l.ord(r);
}
template<typename T>
Ordering ord(const ::std::vector<T>& l, const ::std::vector<T>& r)
{
    unsigned int i = 0;
    for(const auto& it : l)
    {
        if( i >= r.size() )
            return OrdGreater;

        auto rv = ::ord( it, r[i] );
        if( rv != OrdEqual )
            return rv;

        i ++;
    }

    if( i < r.size() )
        return OrdLess;
    return OrdEqual;
}
#define ORD(a,b)    do { Ordering ORD_rv = ::ord(a,b); if( ORD_rv != ::OrdEqual )   return ORD_rv; } while(0)

class FmtEscaped {
    const char* s;
    const char* e;
public:
    FmtEscaped(const ::std::string& s):
        s(s.c_str()),
        e(s.c_str() + s.size())
    {}
    // See debug.cpp
    friend ::std::ostream& operator<<(::std::ostream& os, const FmtEscaped& x);
};

#endif
