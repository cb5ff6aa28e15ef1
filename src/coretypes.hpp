/*
 * synext - Syntax extension expansion core
 *
 * coretypes.hpp
 * - AST-level builtin types (used for literal suffixes)
 */
#ifndef _SYNEXT_CORETYPES_HPP_INCLUDED
#define _SYNEXT_CORETYPES_HPP_INCLUDED

enum eCoreType
{
    CORETYPE_INVAL,
    CORETYPE_ANY,
    CORETYPE_BOOL,
    CORETYPE_CHAR, CORETYPE_STR,
    CORETYPE_UINT, CORETYPE_INT,
    CORETYPE_U8,  CORETYPE_I8,
    CORETYPE_U16, CORETYPE_I16,
    CORETYPE_U32, CORETYPE_I32,
    CORETYPE_U64, CORETYPE_I64,
};

/// Returns CORETYPE_INVAL for unknown names
extern enum eCoreType coretype_fromstring(const char* name);
/// Returns "" for CORETYPE_ANY
extern const char* coretype_name(const eCoreType ct);

#endif // _SYNEXT_CORETYPES_HPP_INCLUDED
