/*
 * synext - Syntax extension expansion core
 *
 * ast/types.cpp
 * - Backing code for the TypeRef class
 */
#include "types.hpp"
#include <ast/expr.hpp>
#include <cstring>

/// Mappings from internal type names to the core type enum
static const struct {
    const char* name;
    enum eCoreType  type;
} CORETYPES[] = {
    // NOTE: Sorted
    {"_", CORETYPE_ANY},
    {"bool", CORETYPE_BOOL},
    {"char", CORETYPE_CHAR},
    {"i16", CORETYPE_I16},
    {"i32", CORETYPE_I32},
    {"i64", CORETYPE_I64},
    {"i8", CORETYPE_I8},
    {"isize", CORETYPE_INT},
    {"str", CORETYPE_STR},
    {"u16", CORETYPE_U16},
    {"u32", CORETYPE_U32},
    {"u64", CORETYPE_U64},
    {"u8",  CORETYPE_U8},
    {"usize", CORETYPE_UINT},
};

enum eCoreType coretype_fromstring(const char* name)
{
    for(unsigned int i = 0; i < sizeof(CORETYPES)/sizeof(CORETYPES[0]); i ++)
    {
        int cmp = strcmp(name, CORETYPES[i].name);
        if( cmp < 0 )
            break;
        if( cmp == 0 )
            return CORETYPES[i].type;
    }
    return CORETYPE_INVAL;
}

const char* coretype_name(const eCoreType ct ) {
    switch(ct)
    {
    case CORETYPE_INVAL:return "INVAL";
    case CORETYPE_ANY:  return "";
    case CORETYPE_CHAR: return "char";
    case CORETYPE_STR:  return "str";
    case CORETYPE_BOOL: return "bool";
    case CORETYPE_UINT: return "usize";
    case CORETYPE_INT:  return "isize";
    case CORETYPE_U8:   return "u8";
    case CORETYPE_I8:   return "i8";
    case CORETYPE_U16:  return "u16";
    case CORETYPE_I16:  return "i16";
    case CORETYPE_U32:  return "u32";
    case CORETYPE_I32:  return "i32";
    case CORETYPE_U64:  return "u64";
    case CORETYPE_I64:  return "i64";
    }
    DEBUG("Unknown core type?! " << static_cast<int>(ct));
    return "NFI";
}

TypeRef TypeRef::clone() const
{
    TU_MATCH_HDRA( (m_data), {)
    TU_ARMA(Tuple, e) {
        ::std::vector<TypeRef>  inner;
        for(const auto& t : e)
            inner.push_back( t.clone() );
        return TypeRef(m_span, Data::make_Tuple(mv$(inner)));
        }
    TU_ARMA(Err, e) {
        return TypeRef::new_err(m_span);
        }
    TU_ARMA(Infer, e) {
        return TypeRef(m_span, Data::make_Infer({}));
        }
    TU_ARMA(Path, e) {
        return TypeRef::new_path(m_span, e);
        }
    TU_ARMA(Borrow, e) {
        return TypeRef::new_borrow(m_span, e.lifetime, e.is_mut, e.inner->clone());
        }
    TU_ARMA(Array, e) {
        return TypeRef::new_array(m_span, e.inner->clone(), e.size ? e.size->clone() : AST::ExprNodeP());
        }
    TU_ARMA(Macro, e) {
        return TypeRef(m_span, Data::make_Macro(e.clone()));
        }
    }
    BUG(m_span, "Bad TypeRef tag");
}

::std::ostream& operator<<(::std::ostream& os, const TypeRef& tr)
{
    TU_MATCH_HDRA( (tr.m_data), {)
    TU_ARMA(Tuple, e) {
        os << "(";
        for(size_t i = 0; i < e.size(); i ++)
        {
            if( i != 0 )
                os << ", ";
            os << e[i];
        }
        if( e.size() == 1 )
            os << ",";
        os << ")";
        }
    TU_ARMA(Err, e) {
        os << "{error}";
        }
    TU_ARMA(Infer, e) {
        os << "_";
        }
    TU_ARMA(Path, e) {
        os << e;
        }
    TU_ARMA(Borrow, e) {
        os << "&";
        if( e.lifetime != "" )
            os << "'" << e.lifetime << " ";
        if( e.is_mut )
            os << "mut ";
        os << *e.inner;
        }
    TU_ARMA(Array, e) {
        os << "[" << *e.inner << "; " << *e.size << "]";
        }
    TU_ARMA(Macro, e) {
        os << e;
        }
    }
    return os;
}
