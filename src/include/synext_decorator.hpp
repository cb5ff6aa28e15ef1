/*
 * synext - Syntax extension expansion core
 *
 * include/synext_decorator.hpp
 * - Decorator syntax extensions (#[foo] and #[derive(Foo)])
 */
#pragma once
#ifndef _SYNEXT_DECORATOR_HPP_
#define _SYNEXT_DECORATOR_HPP_

#include <string>
#include <memory>
#include <vector>
#include <span.hpp>
#include "../ast/fragment.hpp"

class TokenTree;
class ExtCtxt;

/// Token-based attribute macro (`proc_macro_attribute`)
///
/// Given the attribute's arguments and the annotated item, returns the
/// replacement tokens.
class ExpandAttrProcMacro
{
public:
    virtual ~ExpandAttrProcMacro() = default;
    virtual TokenTree expand(ExtCtxt& cx, const Span& sp, const TokenTree& annotation, const TokenTree& annotated) = 0;
};

/// Attribute macro operating on the AST
///
/// The annotated item is consumed, and replaced by the returned list (which may be empty).
class ExpandDecorator
{
public:
    virtual ~ExpandDecorator() = default;
    virtual ::std::vector<AST::Annotatable> expand(ExtCtxt& cx, const Span& sp, const AST::Attribute& mi, AST::Annotatable item) = 0;
};

/// Token-based derive (`proc_macro_derive`)
///
/// Output is appended after the item, which is left as-is.
class ExpandDeriveProcMacro
{
public:
    virtual ~ExpandDeriveProcMacro() = default;
    virtual TokenTree expand(ExtCtxt& cx, const Span& sp, const TokenTree& item) = 0;
};

/// Derive operating on the AST
class ExpandLegacyDerive
{
public:
    virtual ~ExpandLegacyDerive() = default;
    /// `path` is the derive as written (e.g. `Clone`), the returned items are placed after `item`
    virtual ::std::vector<AST::Annotatable> expand(ExtCtxt& cx, const Span& sp, const AST::Path& path, const AST::Annotatable& item) = 0;
};

#endif

