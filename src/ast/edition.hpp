/*
 * synext - Syntax extension expansion core
 *
 * ast/edition.hpp
 * - Language editions
 */
#pragma once
#include <iostream>
#include <string>

namespace AST {

    enum class Edition {
        Rust2015,
        Rust2018,
        Rust2021,
    };
    static inline std::ostream& operator<<(std::ostream& os, const Edition& e) {
        switch(e)
        {
        case Edition::Rust2015: os << "Rust2015";   break;
        case Edition::Rust2018: os << "Rust2018";   break;
        case Edition::Rust2021: os << "Rust2021";   break;
        }
        return os;
    }
    /// Parse an edition year (`2015`, `2018`, `2021`), returning false if unknown
    static inline bool edition_from_str(const ::std::string& s, Edition& out) {
        if( s == "2015" ) { out = Edition::Rust2015; return true; }
        if( s == "2018" ) { out = Edition::Rust2018; return true; }
        if( s == "2021" ) { out = Edition::Rust2021; return true; }
        return false;
    }

}
