/*
 * synext - Syntax extension expansion core
 *
 * include/rc_string.hpp
 * - Reference-counted string (used for identifiers, file names and diagnostic codes)
 */
#pragma once

#include <cstring>
#include <ostream>
#include <atomic>
#include "../common.hpp"

class RcString
{
    struct Inner {
        ::std::atomic<unsigned int> refcount;
        unsigned int    size;
        bool    interned;
        char    data[1];    // Actually arbitary
    }*  m_ptr;
public:
    RcString():
        m_ptr(nullptr)
    {}
    RcString(const char* s, size_t len);
    RcString(const char* s):
        RcString(s, ::std::strlen(s))
    {
    }
    explicit RcString(const ::std::string& s):
        RcString(s.data(), s.size())
    {
    }

    /// Obtain the shared instance of a string (equal interned strings share storage)
    static RcString new_interned(const char* s, size_t len);
    static RcString new_interned(const ::std::string& s) {
        return new_interned(s.data(), s.size());
    }
    static RcString new_interned(const char* s) {
        return new_interned(s, ::std::strlen(s));
    }

    RcString(const RcString& x):
        m_ptr(x.m_ptr)
    {
        if( m_ptr ) m_ptr->refcount += 1;
    }
    RcString(RcString&& x):
        m_ptr(x.m_ptr)
    {
        x.m_ptr = nullptr;
    }

    ~RcString();

    RcString& operator=(const RcString& x)
    {
        if( &x != this )
        {
            this->~RcString();
            m_ptr = x.m_ptr;
            if( m_ptr ) m_ptr->refcount += 1;
        }
        return *this;
    }
    RcString& operator=(RcString&& x)
    {
        if( &x != this )
        {
            this->~RcString();
            m_ptr = x.m_ptr;
            x.m_ptr = nullptr;
        }
        return *this;
    }

    const char* begin() const { return c_str(); }
    const char* end() const { return c_str() + size(); }

    bool is_interned() const { return m_ptr && m_ptr->interned; }
    bool empty() const { return size() == 0; }
    size_t size() const { return m_ptr ? m_ptr->size : 0; }
    const char* c_str() const {
        return m_ptr ? m_ptr->data : "";
    }
    ::std::string to_string() const {
        return ::std::string(c_str(), size());
    }

    Ordering ord(const char* s, size_t l) const;
    Ordering ord(const RcString& s) const {
        if( m_ptr == s.m_ptr )
            return OrdEqual;
        return ord(s.c_str(), s.size());
    }
    bool operator==(const RcString& s) const {
        if( m_ptr == s.m_ptr )
            return true;
        if( s.size() != this->size() )
            return false;
        // Two distinct interned instances can never be equal
        if( is_interned() && s.is_interned() )
            return false;
        return this->ord(s) == OrdEqual;
    }
    bool operator!=(const RcString& s) const { return !(*this == s); }
    bool operator<(const RcString& s) const { return this->ord(s) == OrdLess; }
    bool operator>(const RcString& s) const { return this->ord(s) == OrdGreater; }

    Ordering ord(const std::string& s) const { return ord(s.data(), s.size()); }
    bool operator==(const std::string& s) const { return this->ord(s) == OrdEqual; }
    bool operator!=(const std::string& s) const { return this->ord(s) != OrdEqual; }

    bool operator==(const char* s) const { return this->ord(s, ::std::strlen(s)) == OrdEqual; }
    bool operator!=(const char* s) const { return this->ord(s, ::std::strlen(s)) != OrdEqual; }

    bool starts_with(const char* s) const {
        auto l = ::std::strlen(s);
        return l <= size() && memcmp(c_str(), s, l) == 0;
    }

    friend ::std::ostream& operator<<(::std::ostream& os, const RcString& x);

    friend bool operator==(const char* a, const RcString& b) {
        return b == a;
    }
    friend bool operator!=(const char* a, const RcString& b) {
        return b != a;
    }
};

namespace std {
    static inline bool operator==(const string& a, const ::RcString& b) {
        return b == a;
    }
    static inline bool operator!=(const string& a, const ::RcString& b) {
        return b != a;
    }
    template<> struct hash<RcString>
    {
        size_t operator()(const RcString& s) const noexcept;
    };
}
