/*
 * synext - Syntax extension expansion core
 *
 * include/synext.hpp
 * - Generic syntax extension support
 *
 * A `SyntaxExtension` is one resolved macro (built-in or user-defined): what
 * kind of expander it is, and the properties its expansions inherit.
 */
#pragma once
#ifndef _SYNEXT_HPP_
#define _SYNEXT_HPP_

#include "../common.hpp"
#include <tagged_union.hpp>
#include <hygiene.hpp>
#include "synext_decorator.hpp"
#include "synext_macro.hpp"

struct ParseSess;

/// The expander behind an extension (exactly one callable per kind)
TAGGED_UNION(SyntaxExtensionKind, NonMacroAttr,
    // `foo!()`: tokens to tokens
    (Bang, ::std::unique_ptr<ExpandProcMacro>),
    // `foo!()`: tokens to a structured result
    (LegacyBang, ::std::unique_ptr<ExpandLegacyMacro>),
    // `#[foo]`: (arguments, item) tokens to tokens
    (Attr, ::std::unique_ptr<ExpandAttrProcMacro>),
    // `#[foo]`: item to items
    (LegacyAttr, ::std::unique_ptr<ExpandDecorator>),
    // An inert attribute registered as if it were a macro (left on the item)
    (NonMacroAttr, struct {
        bool    mark_used;
        }),
    // `#[derive(Foo)]`: item tokens to appended tokens
    (Derive, ::std::unique_ptr<ExpandDeriveProcMacro>),
    // `#[derive(Foo)]`: item to appended items
    (LegacyDerive, ::std::unique_ptr<ExpandLegacyDerive>)
    );

struct SyntaxExtension
{
    SyntaxExtensionKind kind;
    /// Definition site
    Span    span;
    /// Features usable inside the expansion without being enabled by the user
    rust::option< ::std::vector<RcString> > allow_internal_unstable;
    bool    allow_internal_unsafe;
    /// `#[macro_export(local_inner_macros)]`
    bool    local_inner_macros;
    rust::option<AST::Stability>    stability;
    rust::option<AST::Deprecation>  deprecation;
    /// Attribute names the derive allows on the item (marked known once it runs)
    ::std::vector<RcString>    helper_attrs;
    AST::Edition    edition;
    /// `#[rustc_builtin_macro]`
    bool    is_builtin;
    /// The built-in `Copy` derive
    bool    is_derive_copy;

    SyntaxExtension(SyntaxExtension&&) = default;
    SyntaxExtension& operator=(SyntaxExtension&&) = default;
    SyntaxExtension(const SyntaxExtension&) = delete;
    SyntaxExtension& operator=(const SyntaxExtension&) = delete;

    MacroKind macro_kind() const;

    /// Extension with every optional property off
    static SyntaxExtension default_(SyntaxExtensionKind kind, AST::Edition edition);
    /// Construct from a definition's attributes (`allow_internal_unstable`, `macro_export`, ...)
    static SyntaxExtension new_(
        ParseSess& sess,
        SyntaxExtensionKind kind,
        Span span,
        ::std::vector<RcString> helper_attrs,
        AST::Edition edition,
        const RcString& name,
        const AST::AttributeList& attrs
        );

    /// Bang macro that expands to an error placeholder
    static SyntaxExtension dummy_bang(AST::Edition edition);
    /// Derive that produces nothing
    static SyntaxExtension dummy_derive(AST::Edition edition);
    static SyntaxExtension non_macro_attr(bool mark_used, AST::Edition edition);

    /// Provenance record for one expansion of this extension
    ExpnData expn_data(ExpnId parent, Span call_site, RcString descr) const;

private:
    SyntaxExtension(SyntaxExtensionKind kind, AST::Edition edition);
};

/// Name of the feature that stands for "any feature" when `allow_internal_unstable` has no list
extern const char* const ALLOW_INTERNAL_UNSTABLE_BACKCOMPAT;

#endif

