/*
 * synext - Syntax extension expansion core
 *
 * include/ident.hpp
 * - Identifiers with hygiene (the hygiene lives in the span's syntax context)
 */
#pragma once
#include <string>
#include <rc_string.hpp>
#include <hygiene.hpp>

struct Ident
{
    RcString   name;
    Span    span;

    Ident(const char* name):
        name(RcString::new_interned(name)),
        span()
    { }
    Ident(RcString name, Span span=Span()):
        name(::std::move(name)),
        span(::std::move(span))
    { }

    Ident(Ident&& x) = default;
    Ident(const Ident& x) = default;
    Ident& operator=(Ident&& x) = default;
    Ident& operator=(const Ident& x) = default;

    static Ident from_str_and_span(const char* s, Span sp) {
        return Ident(RcString::new_interned(s), ::std::move(sp));
    }

    /// Keep this identifier's hygiene, but take the location from `sp`
    Ident with_span_pos(const Span& sp) const;
    Ident normalize_to_macros_2_0() const;
    Ident normalize_to_macro_rules() const;

    bool is_dollar_crate() const { return name == "$crate"; }

    bool operator==(const char* s) const {
        return this->name == s;
    }
    /// Equal names in the same syntax context
    bool operator==(const Ident& x) const {
        return this->name == x.name && this->span.ctxt() == x.span.ctxt();
    }
    bool operator!=(const Ident& x) const {
        return !(*this == x);
    }
    bool operator<(const Ident& x) const {
        if(this->name != x.name)
            return this->name < x.name;
        return this->span.ctxt() < x.span.ctxt();
    }

    friend ::std::ostream& operator<<(::std::ostream& os, const Ident& x);
};
