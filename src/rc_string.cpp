/*
 * synext - Syntax extension expansion core
 *
 * rc_string.cpp
 * - Reference-counted string
 */
#include <rc_string.hpp>
#include <cstring>
#include <cstdlib>
#include <string>
#include <iostream>
#include <algorithm>    // std::min
#include <mutex>
#include <set>
#include <new>

RcString::RcString(const char* s, size_t len):
    m_ptr(nullptr)
{
    if( len > 0 )
    {
        void* mem = malloc(sizeof(Inner) + len);
        if( !mem )
            throw ::std::bad_alloc();
        m_ptr = new(mem) Inner;
        m_ptr->refcount = 1;
        m_ptr->size = static_cast<unsigned>(len);
        m_ptr->interned = false;
        memcpy(m_ptr->data, s, len);
        m_ptr->data[len] = '\0';
    }
}
RcString::~RcString()
{
    if(m_ptr)
    {
        if( --m_ptr->refcount == 0 )
        {
            m_ptr->~Inner();
            free(m_ptr);
        }
        m_ptr = nullptr;
    }
}
Ordering RcString::ord(const char* s, size_t len) const
{
    auto cmp_len = ::std::min(len, this->size());
    if( cmp_len > 0 )
    {
        int cmp = memcmp(this->c_str(), s, cmp_len);
        if(cmp != 0) {
            return ::ord(cmp, 0);
        }
    }
    // Since the prefix is equal, then sort `this` before `s` if it's shorter
    return ::ord(static_cast<unsigned long>(this->size()), static_cast<unsigned long>(len));
}

::std::ostream& operator<<(::std::ostream& os, const RcString& x)
{
    os.write(x.c_str(), x.size());
    return os;
}

namespace {
    struct Cmp_RcString_Raw {
        using is_transparent = void;
        bool operator()(const RcString& a, const RcString& b) const {
            return a.ord(b.c_str(), b.size()) == OrdLess;
        }
    };
    // Interned strings live for the lifetime of the program (the set holds a reference)
    ::std::mutex    g_interned_lock;
    ::std::set<RcString, Cmp_RcString_Raw>  g_interned_strings;
}

RcString RcString::new_interned(const char* s, size_t len)
{
    if(len == 0)
        return RcString();
    RcString    key(s, len);
    ::std::unique_lock<::std::mutex>    _lh { g_interned_lock };
    auto it = g_interned_strings.find(key);
    if( it == g_interned_strings.end() )
    {
        key.m_ptr->interned = true;
        it = g_interned_strings.insert(mv$(key)).first;
    }
    return *it;
}

size_t std::hash<RcString>::operator()(const RcString& s) const noexcept
{
    // http://www.cse.yorku.ca/~oz/hash.html "djb2"
    size_t h = 5381;
    for(auto c : s) {
        h = h * 33 + (unsigned)c;
    }
    return h;
}
