/*
 * synext - Syntax extension expansion core
 *
 * ast/item.hpp
 * - AST items, associated items and statements
 */
#pragma once

#include <string>
#include <vector>
#include <tagged_union.hpp>
#include "attrs.hpp"
#include "types.hpp"
#include "pattern.hpp"
#include "expr_ptr.hpp"
#include "macro.hpp"

namespace AST {

/// Identity of an AST node (assigned by the resolver)
typedef unsigned int    NodeId;
static const NodeId DUMMY_NODE_ID = ~0u;

struct StructField
{
    AttributeList   attrs;
    bool    is_pub;
    Ident   name;   // Empty for tuple fields
    TypeRef ty;

    StructField clone() const;
};
enum class StructKind
{
    Unit,   // `struct Foo;`
    Tuple,  // `struct Foo(T);`
    Named,  // `struct Foo { a: T }`
};
struct EnumVariant
{
    AttributeList   attrs;
    Ident   name;
    StructKind  kind;
    ::std::vector<StructField>  fields;

    EnumVariant clone() const;
};

enum class StaticClass
{
    Const,
    Static,
    MutStatic,
};

class Item;
struct ImplItem;
struct TraitItem;
struct ForeignItem;

/// Item inside an `impl`, `trait` or `extern` block
struct AssocItem
{
    TAGGED_UNION(Data, None,
        (None, struct {}),
        // `const NAME: T = val;` (value optional in traits)
        (Const, struct {
            TypeRef type;
            ExprNodeP   value;
            }),
        // `static NAME: T;` (foreign blocks)
        (Static, struct {
            bool    is_mut;
            TypeRef type;
            }),
        // `type NAME = T;` (type optional in traits)
        (Type, struct {
            ::std::unique_ptr<TypeRef>  type;
            }),
        (Macro, MacroInvocation)
        );

    Span    span;
    AttributeList   attrs;
    bool    is_pub;
    Ident   name;
    NodeId  id;
    Data    data;

    AssocItem(Span sp, AttributeList attrs, bool is_pub, Ident name, Data data):
        span( mv$(sp) ),
        attrs( mv$(attrs) ),
        is_pub( is_pub ),
        name( mv$(name) ),
        id( DUMMY_NODE_ID ),
        data( mv$(data) )
    {}
    AssocItem(AssocItem&&) = default;
    AssocItem& operator=(AssocItem&&) = default;
    virtual ~AssocItem() {}

    bool is_macro() const { return data.is_Macro(); }

    void print(::std::ostream& os) const;
protected:
    AssocItem clone_inner() const;
};
struct ImplItem: public AssocItem
{
    ImplItem(AssocItem&& x): AssocItem(mv$(x)) {}
    ImplItem clone() const { return ImplItem(clone_inner()); }
};
struct TraitItem: public AssocItem
{
    TraitItem(AssocItem&& x): AssocItem(mv$(x)) {}
    TraitItem clone() const { return TraitItem(clone_inner()); }
};
struct ForeignItem: public AssocItem
{
    ForeignItem(AssocItem&& x): AssocItem(mv$(x)) {}
    ForeignItem clone() const { return ForeignItem(clone_inner()); }
};
extern ::std::ostream& operator<<(::std::ostream& os, const AssocItem& x);

class Item
{
public:
    TAGGED_UNION(Data, None,
        (None, struct {}),
        // Item-position macro (or a placeholder for one)
        (MacroInv, MacroInvocation),
        (Struct, struct {
            StructKind  kind;
            ::std::vector<StructField>  fields;
            }),
        (Enum, struct {
            ::std::vector<EnumVariant>  variants;
            }),
        (Union, struct {
            ::std::vector<StructField>  fields;
            }),
        (Static, struct {
            StaticClass cls;
            TypeRef type;
            ExprNodeP   value;
            }),
        (Impl, struct {
            rust::option<AST::Path> trait_path;
            TypeRef self_ty;
            ::std::vector<ImplItem> items;
            }),
        (Trait, struct {
            ::std::vector<TraitItem>    items;
            }),
        (Mod, struct {
            ::std::vector<Item> items;
            }),
        (ForeignMod, struct {
            ::std::vector<ForeignItem>  items;
            })
        );

    Span    span;
    AttributeList   attrs;
    bool    is_pub;
    Ident   name;   // Empty for impls, foreign blocks and macros
    NodeId  id;
    Data    data;

    Item(Span sp, AttributeList attrs, bool is_pub, Ident name, Data data):
        span( mv$(sp) ),
        attrs( mv$(attrs) ),
        is_pub( is_pub ),
        name( mv$(name) ),
        id( DUMMY_NODE_ID ),
        data( mv$(data) )
    {}
    Item(Item&&) = default;
    Item& operator=(Item&&) = default;
    Item(const Item&) = delete;
    Item& operator=(const Item&) = delete;

    static Item new_macro(Span sp, AttributeList attrs, MacroInvocation inv) {
        return Item(mv$(sp), mv$(attrs), false, Ident(""), Data::make_MacroInv(mv$(inv)));
    }

    Item clone() const;

    /// Struct, enum or union (the only items that `#[derive]` applies to)
    bool is_adt() const { return data.is_Struct() || data.is_Enum() || data.is_Union(); }
    const char* tag_descr() const;

    friend ::std::ostream& operator<<(::std::ostream& os, const Item& x);
};

enum class MacStmtStyle
{
    /// `foo!(...);`
    Semicolon,
    /// `foo! { ... }`
    Braces,
    /// `foo!(...)` (tail expression position)
    NoBraces,
};

class Stmt
{
public:
    TAGGED_UNION(Data, Empty,
        // `;`
        (Empty, struct {}),
        // Tail expression (no semicolon)
        (Expr, ExprNodeP),
        (Semi, struct {
            ExprNodeP   expr;
            }),
        (Item, ::std::unique_ptr<AST::Item>),
        // `let PAT: TY = INIT;`
        (Local, struct {
            Pattern pat;
            ::std::unique_ptr<TypeRef>  ty;
            ExprNodeP   init;
            }),
        (Macro, struct {
            MacroInvocation inv;
            MacStmtStyle    style;
            })
        );

    Span    span;
    AttributeList   attrs;
    NodeId  id;
    Data    data;

    Stmt(Span sp, Data data):
        span( mv$(sp) ),
        id( DUMMY_NODE_ID ),
        data( mv$(data) )
    {}
    Stmt(Stmt&&) = default;
    Stmt& operator=(Stmt&&) = default;
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;

    static Stmt new_expr(Span sp, ExprNodeP e) {
        return Stmt(mv$(sp), Data::make_Expr(mv$(e)));
    }
    static Stmt new_semi(Span sp, ExprNodeP e) {
        return Stmt(mv$(sp), Data::make_Semi({ mv$(e) }));
    }
    static Stmt new_item(Span sp, Item i) {
        return Stmt(mv$(sp), Data::make_Item(box$(i)));
    }

    Stmt clone() const;

    friend ::std::ostream& operator<<(::std::ostream& os, const Stmt& x);
};

}   // namespace AST
