/*
 * synext - Syntax extension expansion core
 *
 * expand/resolver.hpp
 * - Interface to the name resolver used during expansion
 *
 * The resolver owns the macro namespace: built-ins are registered into it,
 * and every invocation is resolved through it. It may not know the answer yet
 * (the macro could be defined by code that has not been expanded), in which
 * case it answers `Indeterminate` and is asked again on a later pass.
 */
#pragma once

#include <memory>
#include <vector>
#include <synext.hpp>
#include <ast/item.hpp>
#include "invocation.hpp"

/// Derives that later passes need to know about
struct SpecialDerives
{
    enum Flag {
        NONE       = 0,
        PARTIAL_EQ = 1 << 0,
        EQ         = 1 << 1,
        COPY       = 1 << 2,
    };
    unsigned int    bits;

    SpecialDerives(): bits(0) {}
    SpecialDerives(Flag f): bits(f) {}
    explicit SpecialDerives(unsigned int b): bits(b) {}

    bool contains(const SpecialDerives& x) const { return (bits & x.bits) == x.bits; }
    SpecialDerives operator|(const SpecialDerives& x) const { return SpecialDerives(bits | x.bits); }
    SpecialDerives& operator|=(const SpecialDerives& x) { bits |= x.bits; return *this; }
    bool operator==(const SpecialDerives& x) const { return bits == x.bits; }
};

TAGGED_UNION(ResolveResult, Indeterminate,
    // Not known yet, retry on a later pass
    (Indeterminate, struct {}),
    (Single, ::std::shared_ptr<SyntaxExtension>),
    // One extension per path of a `#[derive(...)]`, in order
    (DeriveGroup, ::std::vector< ::std::shared_ptr<SyntaxExtension> >)
    );

class Resolver
{
public:
    virtual ~Resolver();

    virtual AST::NodeId next_node_id() = 0;
    /// Expansion that produced the given module (root for the crate)
    virtual ExpnId get_module_scope(AST::NodeId module_id) = 0;

    /// Register a built-in macro under the given name
    virtual void register_builtin_macro(Ident name, ::std::shared_ptr<SyntaxExtension> ext) = 0;

    /// Resolve the macro for an invocation
    ///
    /// `eager_root` is the expansion eager expansion started from, when `force`
    /// is set the resolver must give a definitive answer (reporting its own errors,
    /// and returning a dummy extension for unresolvable macros).
    ///
    /// An `Indeterminate` answer must not have had any side effects.
    /// Attribute invocations carry the item's derive paths, so that helper attributes of
    /// those derives can be resolved (as inert attributes) before the derives run.
    virtual ResolveResult resolve_macro_invocation(const Invocation& invoc, ExpnId eager_root, bool force) = 0;

    /// Called after each fragment is collected (before its invocations are resolved)
    virtual void visit_ast_fragment_with_placeholders(ExpnId expansion, const AST::AstFragment& fragment) {}

    /// Report macros that were defined but never used
    virtual void check_unused_macros() = 0;

    virtual bool has_derives(ExpnId expn_id, SpecialDerives derives) const = 0;
    virtual void add_derives(ExpnId expn_id, SpecialDerives derives) = 0;
};

