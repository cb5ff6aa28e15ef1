/*
 * synext - Syntax extension expansion core
 *
 * expand/invocation.hpp
 * - A macro call site found during expansion
 */
#pragma once

#include <vector>
#include <ast/fragment.hpp>
#include <hygiene.hpp>
#include <ident.hpp>

/// Where the expansion is up to when an invocation is found (or run)
struct ExpansionData
{
    /// Expansion that produced this code (the placeholder id for a queued invocation)
    ExpnId  id;
    unsigned int    depth;
    /// Module the code lives in (starting with the crate name)
    ::std::vector<Ident>    module_path;
    /// Directory of the current module's source (for relative paths)
    ::std::string   directory;

    ExpansionData():
        depth(0)
    {}
};

TAGGED_UNION(InvocationKind, Bang,
    // `foo!(...)`
    (Bang, struct {
        AST::MacroInvocation    mac;
        /// Statement style (`Semicolon` unless in statement position)
        AST::MacStmtStyle   style;
        }),
    // `#[foo] item`, `attr` has been removed from the item's attribute list
    (Attr, struct {
        AST::Attribute  attr;
        /// Position the attribute was removed from
        size_t  attr_pos;
        /// Paths of the `#[derive]`s still on the item (their helper attributes are inert)
        ::std::vector<AST::Path>    derives;
        AST::Annotatable    item;
        }),
    // `#[derive(A, B)] item`
    (DeriveGroup, struct {
        Span    span;
        ::std::vector<AST::Path>    paths;
        AST::Annotatable    item;
        })
    );

struct Invocation
{
    InvocationKind  kind;
    AST::AstFragmentKind    fragment_kind;
    /// Expansion containing the call site
    ExpnId  parent;
    ExpansionData   expansion_data;

    Invocation(InvocationKind kind, AST::AstFragmentKind fragment_kind, ExpnId parent, ExpansionData expansion_data):
        kind( mv$(kind) ),
        fragment_kind( fragment_kind ),
        parent( parent ),
        expansion_data( mv$(expansion_data) )
    {}
    Invocation(Invocation&&) = default;
    Invocation& operator=(Invocation&&) = default;

    /// Span of the call site (the macro path, the attribute, or the `derive`)
    const Span& span() const;
    /// Kind of macro the call site needs
    MacroKind macro_kind() const;
    /// Printable name of the invoked macro
    ::std::string name() const;

    friend ::std::ostream& operator<<(::std::ostream& os, const Invocation& x);
};

