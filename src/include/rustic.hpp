/*
 * synext - Syntax extension expansion core
 *
 * include/rustic.hpp
 * - Optional value holder (used where "nothing" is a valid answer)
 */
#pragma once

#include <new>
#include <utility>
#include <functional>
#include <cassert>

namespace rust {

template<typename T>
class option
{
    alignas(T) unsigned char    m_data[ sizeof(T) ];
    bool    m_set;

    T* ptr() { return reinterpret_cast<T*>(m_data); }
    const T* ptr() const { return reinterpret_cast<const T*>(m_data); }
public:
    option(T ent):
        m_set(true)
    {
        new (m_data) T(::std::move(ent));
    }
    option():
        m_set(false)
    {}
    option(const option& x):
        m_set(x.m_set)
    {
        if( m_set )
            new (m_data) T(*x.ptr());
    }
    option(option&& x):
        m_set(x.m_set)
    {
        if( m_set ) {
            new (m_data) T(::std::move(*x.ptr()));
            x.reset();
        }
    }
    option& operator=(const option& x) {
        if( &x != this ) {
            this->reset();
            if( x.m_set ) {
                new (m_data) T(*x.ptr());
                m_set = true;
            }
        }
        return *this;
    }
    option& operator=(option&& x) {
        if( &x != this ) {
            this->reset();
            if( x.m_set ) {
                new (m_data) T(::std::move(*x.ptr()));
                m_set = true;
                x.reset();
            }
        }
        return *this;
    }
    ~option() {
        this->reset();
    }

    void reset() {
        if( m_set ) {
            ptr()->~T();
            m_set = false;
        }
    }

    bool is_none() const { return !m_set; }
    bool is_some() const { return m_set; }

    const T& unwrap() const {
        assert(is_some());
        return *ptr();
    }
    T& unwrap() {
        assert(is_some());
        return *ptr();
    }
    /// Move the contained value out, leaving `None`
    option take() {
        option  rv = ::std::move(*this);
        return rv;
    }
    T unwrap_or(T def) const {
        return m_set ? *ptr() : ::std::move(def);
    }

    void if_set(::std::function<void (const T&)> f) const {
        if( m_set ) {
            f(*ptr());
        }
    }
};
template<typename T>
class option<T&>
{
    T* m_ptr;
public:
    option(T& ent):
        m_ptr(&ent)
    {}
    option():
        m_ptr(nullptr)
    {}

    bool is_none() const { return m_ptr == nullptr; }
    bool is_some() const { return m_ptr != nullptr; }
    T& unwrap() const {
        assert(is_some());
        return *m_ptr;
    }
};
template<typename T>
option<T> Some(T data) {
    return option<T>( ::std::move(data) );
}
template<typename T>
option<T> None() {
    return option<T>( );
}

}
