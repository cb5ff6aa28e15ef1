/*
 * synext - Syntax extension expansion core
 *
 * ast/types.hpp
 * - AST Type reference (and helpers)
 */
#ifndef TYPES_HPP_INCLUDED
#define TYPES_HPP_INCLUDED

#include <memory>

#include "../common.hpp"
#include "../coretypes.hpp"
#include <span.hpp>
#include <tagged_union.hpp>
#include "path.hpp"
#include "macro.hpp"
#include "expr_ptr.hpp"

class TypeRef
{
public:
    TAGGED_UNION(Data, Tuple,
        (Tuple, ::std::vector<TypeRef>),
        // Type error marker (produced by failed expansions)
        (Err, struct {}),
        (Infer, struct {}),
        (Path, AST::Path),
        (Borrow, struct {
            RcString    lifetime;   // Empty for elided
            bool is_mut;
            ::std::unique_ptr<TypeRef> inner;
            }),
        (Array, struct {
            ::std::unique_ptr<TypeRef> inner;
            AST::ExprNodeP  size;
            }),
        (Macro, AST::MacroInvocation)
        );

    Span    m_span;
    Data    m_data;

    TypeRef(TypeRef&& other) = default;
    TypeRef& operator=(TypeRef&& other) = default;
    TypeRef(const TypeRef& other) = delete;
    TypeRef& operator=(const TypeRef& other) = delete;

    TypeRef(Span sp, Data data):
        m_span(mv$(sp)),
        m_data(mv$(data))
    {}

    /// `()`
    static TypeRef new_unit(Span sp) {
        return TypeRef(mv$(sp), Data::make_Tuple({}));
    }
    static TypeRef new_err(Span sp) {
        return TypeRef(mv$(sp), Data::make_Err({}));
    }
    static TypeRef new_path(Span sp, AST::Path p) {
        return TypeRef(mv$(sp), Data::make_Path(mv$(p)));
    }
    static TypeRef new_borrow(Span sp, RcString lifetime, bool is_mut, TypeRef inner) {
        return TypeRef(mv$(sp), Data::make_Borrow({ mv$(lifetime), is_mut, box$(inner) }));
    }
    static TypeRef new_array(Span sp, TypeRef inner, AST::ExprNodeP size) {
        return TypeRef(mv$(sp), Data::make_Array({ box$(inner), mv$(size) }));
    }

    TypeRef clone() const;

    const Span& span() const { return m_span; }
    bool is_unit() const { return m_data.is_Tuple() && m_data.as_Tuple().empty(); }

    friend ::std::ostream& operator<<(::std::ostream& os, const TypeRef& tr);
};

#endif // TYPES_HPP_INCLUDED
