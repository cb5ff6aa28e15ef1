/*
 * synext - Syntax extension expansion core
 *
 * ident.cpp
 * - Identifiers with hygiene
 */
#include <iostream>
#include <ident.hpp>
#include <debug.hpp>
#include <common.hpp>

Ident Ident::with_span_pos(const Span& sp) const
{
    return Ident(this->name, sp.with_ctxt(this->span.ctxt()));
}
Ident Ident::normalize_to_macros_2_0() const
{
    return Ident(this->name, this->span.with_ctxt(this->span.ctxt().normalize_to_macros_2_0()));
}
Ident Ident::normalize_to_macro_rules() const
{
    return Ident(this->name, this->span.with_ctxt(this->span.ctxt().normalize_to_macro_rules()));
}

::std::ostream& operator<<(::std::ostream& os, const Ident& x) {
    os << x.name;
    return os;
}
