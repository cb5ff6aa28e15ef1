/*
 * synext - Syntax extension expansion core
 *
 * expand/builtins.hpp
 * - Registration of the built-in syntax extensions
 */
#pragma once

#include <synext.hpp>
#include <synext_macro.hpp>
#include <synext_decorator.hpp>
#include "resolver.hpp"

struct ParseSess;

/// Helper passed to each group of built-ins
class BuiltinRegistrar
{
    Resolver&   m_resolver;
    ParseSess&  m_sess;
    AST::Edition    m_edition;
public:
    BuiltinRegistrar(Resolver& resolver, ParseSess& sess, AST::Edition edition):
        m_resolver(resolver),
        m_sess(sess),
        m_edition(edition)
    {}

    /// Register an extension under `name` (marked as `#[rustc_builtin_macro]`)
    void add(const char* name, SyntaxExtensionKind kind, ::std::vector<RcString> helper_attrs={});

    template<typename T>
    void add_bang(const char* name) {
        add(name, SyntaxExtensionKind::make_Bang(::std::unique_ptr<ExpandProcMacro>(new T())));
    }
    template<typename T>
    void add_legacy_bang(const char* name) {
        add(name, SyntaxExtensionKind::make_LegacyBang(::std::unique_ptr<ExpandLegacyMacro>(new T())));
    }
};

/// Register every built-in extension with the resolver
extern void Expand_RegisterBuiltins(Resolver& resolver, ParseSess& sess, AST::Edition edition);

// Per-file groups
extern void Expand_Register_Concat(BuiltinRegistrar& r);
extern void Expand_Register_Stringify(BuiltinRegistrar& r);
extern void Expand_Register_CompileError(BuiltinRegistrar& r);
extern void Expand_Register_FileLine(BuiltinRegistrar& r);
extern void Expand_Register_TraceMacros(BuiltinRegistrar& r);
extern void Expand_Register_Diagnostics(BuiltinRegistrar& r);
extern void Expand_Register_Derives(BuiltinRegistrar& r);
