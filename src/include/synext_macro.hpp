/*
 * synext - Syntax extension expansion core
 *
 * include/synext_macro.hpp
 * - Macro-style syntax extensions ( `foo!()` )
 */
#pragma once
#ifndef _SYNEXT_MACRO_HPP_
#define _SYNEXT_MACRO_HPP_

#include <string>
#include <memory>
#include <span.hpp>

class TokenTree;
class ExtCtxt;
class MacResult;

/// Token-based function-like macro (`proc_macro`)
///
/// The output is parsed as whatever the call site expects.
class ExpandProcMacro
{
public:
    virtual ~ExpandProcMacro() = default;
    virtual TokenTree expand(ExtCtxt& cx, const Span& sp, const TokenTree& input) = 0;
};

/// Function-like macro producing structured AST (compiler built-ins)
///
/// The result is asked for the fragment kind of the call site, and may
/// decline (see `MacResult`).
class ExpandLegacyMacro
{
public:
    virtual ~ExpandLegacyMacro() = default;
    virtual ::std::unique_ptr<MacResult> expand(ExtCtxt& cx, const Span& sp, const TokenTree& input) = 0;
};

#endif

