/*
 * synext - Syntax extension expansion core
 *
 * expand/builtins.cpp
 * - Registration of the built-in syntax extensions
 */
#include "builtins.hpp"
#include <parse_sess.hpp>

void BuiltinRegistrar::add(const char* name, SyntaxExtensionKind kind, ::std::vector<RcString> helper_attrs)
{
    auto name_s = RcString::new_interned(name);
    Span    sp;

    AST::AttributeList  attrs;
    attrs.push_back( AST::Attribute(sp, AST::AttributeName(RcString::new_interned("rustc_builtin_macro"))) );

    auto ext = SyntaxExtension::new_(m_sess, mv$(kind), sp, mv$(helper_attrs), m_edition, name_s, attrs);
    DEBUG("Built-in " << name << " (" << ext.macro_kind() << ")");
    m_resolver.register_builtin_macro( Ident(name_s, sp), ::std::make_shared<SyntaxExtension>(mv$(ext)) );
}

void Expand_RegisterBuiltins(Resolver& resolver, ParseSess& sess, AST::Edition edition)
{
    TRACE_FUNCTION;
    BuiltinRegistrar    r { resolver, sess, edition };
    Expand_Register_Concat(r);
    Expand_Register_Stringify(r);
    Expand_Register_CompileError(r);
    Expand_Register_FileLine(r);
    Expand_Register_TraceMacros(r);
    Expand_Register_Diagnostics(r);
    Expand_Register_Derives(r);
}
