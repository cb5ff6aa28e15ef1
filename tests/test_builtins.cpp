/*
 * synext - Syntax extension expansion core
 *
 * tests/test_builtins.cpp
 * - Built-in syntax extensions
 */
#include "test_common.hpp"

using AST::AstFragmentKind;

namespace {
    struct BuiltinsTest:
        public ExpandTest
    {
        BuiltinsTest() {
            add_builtins();
        }

        /// Value of a string literal expression (fails the test if it isn't one)
        ::std::string str_value(const AST::ExprNodeP& e) {
            const auto* s = dynamic_cast<const AST::ExprNode_String*>(e.get());
            EXPECT_TRUE(s) << "not a string: " << *e;
            return s ? s->m_value : ::std::string();
        }
        bool is_error(const AST::ExprNodeP& e) {
            return dynamic_cast<const AST::ExprNode_Error*>(e.get()) != nullptr;
        }
    };
}

TEST_F(BuiltinsTest, Registered)
{
    const char* names[] = {
        "concat", "stringify", "compile_error", "file", "line", "column", "module_path", "trace_macros",
        "__register_diagnostic", "__diagnostic_used", "__build_diagnostic_array",
        "Clone", "Copy", "PartialEq", "Eq",
        };
    for(const auto* n : names)
    {
        auto it = resolver.macros.find(n);
        ASSERT_NE(it, resolver.macros.end()) << n;
        EXPECT_TRUE(it->second->is_builtin) << n;
    }
    EXPECT_EQ(resolver.macros.size(), sizeof(names)/sizeof(names[0]));
    EXPECT_EQ(resolver.macros["Clone"]->macro_kind(), MacroKind::Derive);
    EXPECT_TRUE(resolver.macros["Copy"]->is_derive_copy);
    EXPECT_FALSE(resolver.macros["Clone"]->is_derive_copy);
    EXPECT_TRUE(emitter->diags.empty());
}

// --------------------------------------------------------------------
// concat! / stringify!
// --------------------------------------------------------------------
TEST_F(BuiltinsTest, Concat)
{
    EXPECT_EQ(str_value(expand_expr("concat!(\"a\", 1, true, 'c')")), "a1truec");
    EXPECT_EQ(str_value(expand_expr("concat!()")), "");
    EXPECT_EQ(emitter->error_count(), 0u);
}

TEST_F(BuiltinsTest, ConcatExpandsArguments)
{
    EXPECT_EQ(str_value(expand_expr("concat!(\"x=\", stringify!(a b), concat!(1, 2))")), "x=a b12");
    EXPECT_EQ(emitter->error_count(), 0u);
}

TEST_F(BuiltinsTest, ConcatOfNonLiteral)
{
    auto e = expand_expr("concat!(\"a\", b, c)");
    EXPECT_TRUE(is_error(e));
    EXPECT_EQ(emitter->count(Diagnostics::Level::Error, "expected a literal"), 2u);
    ASSERT_FALSE(emitter->diags[0].children.empty());
    EXPECT_NE(emitter->diags[0].children[0].message.find("can be passed to `concat!()`"), ::std::string::npos);
}

TEST_F(BuiltinsTest, Stringify)
{
    EXPECT_EQ(str_value(expand_expr("stringify!(a   +  b)")), "a + b");
    EXPECT_EQ(str_value(expand_expr("stringify!(foo!(x, y))")), "foo!(x, y)");
    EXPECT_EQ(str_value(expand_expr("stringify!()")), "");
}

// --------------------------------------------------------------------
// compile_error!
// --------------------------------------------------------------------
TEST_F(BuiltinsTest, CompileError)
{
    auto e = expand_expr("compile_error!(\"this is broken\")");
    EXPECT_TRUE(is_error(e));
    EXPECT_EQ(emitter->error_count(), 1u);
    EXPECT_TRUE(emitter->has_error("this is broken"));

    // As an item
    auto items = expand_items("compile_error!(\"no items\");");
    EXPECT_TRUE(items.empty());
    EXPECT_TRUE(emitter->has_error("no items"));
}

TEST_F(BuiltinsTest, CompileErrorArguments)
{
    expand_expr("compile_error!()");
    EXPECT_TRUE(emitter->has_error("compile_error! takes 1 argument"));
    expand_expr("compile_error!(42)");
    EXPECT_TRUE(emitter->has_error("argument must be a string literal"));
}

// --------------------------------------------------------------------
// file! / line! / column! / module_path!
// --------------------------------------------------------------------
TEST_F(BuiltinsTest, SourceLocation)
{
    EXPECT_EQ(str_value(expand_expr("file!()")), "test.rs");
    EXPECT_EQ(to_str(*expand_expr("line!()")), "1u32");
    EXPECT_EQ(to_str(*expand_expr("(0,\n\n line!())")), "(0, 3u32)");
    EXPECT_EQ(to_str(*expand_expr("column!()")), "1u32");
    EXPECT_EQ(emitter->error_count(), 0u);
}

TEST_F(BuiltinsTest, LocationOfOutermostCall)
{
    // `line!()` produced by another macro reports where that macro was called
    resolver.add("wrapper", make_legacy_bang([](ExtCtxt& cx, const Span& , const TokenTree& ) {
        auto sp = cx.with_call_site_ctxt(test_span(6, 0));
        AST::ExprNodeP  e(new AST::ExprNode_Macro(
            AST::MacroInvocation(sp, AST::Path::from_ident(Ident("line")), TokenTree(), AST::MacDelimiter::Parenthesis)
            ));
        e->set_span(sp);
        return MacEager::new_expr(mv$(e));
        }));
    EXPECT_EQ(to_str(*expand_expr("\nwrapper!()")), "2u32");
}

TEST_F(BuiltinsTest, LocationTakesNoArguments)
{
    expand_expr("line!(x)");
    EXPECT_TRUE(emitter->has_error("line! takes no arguments"));
    expand_expr("file!(y)");
    EXPECT_TRUE(emitter->has_error("file! takes no arguments"));
}

TEST_F(BuiltinsTest, ModulePath)
{
    EXPECT_EQ(str_value(expand_expr("module_path!()")), "test_crate");

    auto items = expand_items("mod outer { mod inner { const P: u32 = module_path!(); } }");
    const auto& inner = items[0].data.as_Mod().items[0].data.as_Mod().items[0];
    ASSERT_TRUE(inner.data.is_Static());
    EXPECT_EQ(str_value(inner.data.as_Static().value), "test_crate::outer::inner");
}

// --------------------------------------------------------------------
// trace_macros!
// --------------------------------------------------------------------
TEST_F(BuiltinsTest, TraceMacros)
{
    expand("trace_macros!(true); stringify!(a);", AstFragmentKind::Stmts);
    EXPECT_TRUE(cx.trace_macros());
    bool found = false;
    for(const auto& e : cx.expansions)
        for(const auto& note : e.second)
            if( note == "expanding `stringify! { a }`" )
                found = true;
    EXPECT_TRUE(found);

    expand("trace_macros!(false);", AstFragmentKind::Stmts);
    EXPECT_FALSE(cx.trace_macros());
    EXPECT_EQ(emitter->error_count(), 0u);

    expand("trace_macros!(sometimes);", AstFragmentKind::Stmts);
    EXPECT_TRUE(emitter->has_error("trace_macros! accepts only `true` or `false`"));
}

// --------------------------------------------------------------------
// Error code registry macros
// --------------------------------------------------------------------
TEST_F(BuiltinsTest, RegisterDiagnostic)
{
    auto items = expand_items(
        "__register_diagnostic!(E0001, \"\\nFirst error\\n\");\n"
        "__register_diagnostic!(E0002);\n"
        );
    // Registration expands to nothing
    EXPECT_TRUE(items.empty());
    EXPECT_EQ(emitter->error_count(), 0u);

    const auto& reg = sess.registered_diagnostics;
    EXPECT_TRUE(reg.is_registered("E0001"));
    EXPECT_TRUE(reg.is_registered("E0002"));
    EXPECT_EQ(reg.get("E0001").unwrap().description.unwrap(), "\nFirst error\n");
    EXPECT_TRUE(reg.get("E0002").unwrap().description.is_none());
}

TEST_F(BuiltinsTest, RegisterDiagnosticErrors)
{
    auto items = expand_items("__register_diagnostic!(E0001);\n__register_diagnostic!(E0001);");
    EXPECT_TRUE(emitter->has_error("diagnostic code E0001 already registered"));
    EXPECT_TRUE(items.empty());

    expand_items("__register_diagnostic!(E0003, \"no newlines\");");
    EXPECT_TRUE(emitter->has_error("doesn't start and end with a newline"));
    // Registered regardless
    EXPECT_TRUE(sess.registered_diagnostics.is_registered("E0003"));

    EXPECT_THROW(expand_items("__register_diagnostic!(\"not a code\");"), CompileError::BugCheck);
}

TEST_F(BuiltinsTest, DiagnosticUsed)
{
    expand_items("__register_diagnostic!(E0001);");
    EXPECT_EQ(to_str(*expand_expr("__diagnostic_used!(E0001)")), "()");
    EXPECT_EQ(emitter->diags.size(), 0u);

    // A second call site
    expand_expr("(1,\n __diagnostic_used!(E0001))");
    ASSERT_EQ(emitter->diags.size(), 1u);
    const auto& d = emitter->diags[0];
    EXPECT_EQ(d.level, Diagnostics::Level::Warning);
    EXPECT_EQ(d.message, "diagnostic code E0001 already used");
    ASSERT_EQ(d.children.size(), 1u);
    EXPECT_EQ(d.children[0].message, "previous invocation");

    expand_expr("__diagnostic_used!(E9999)");
    EXPECT_TRUE(emitter->has_error("used diagnostic code E9999 not registered"));
}

TEST_F(BuiltinsTest, BuildDiagnosticArray)
{
    expand_items(
        "__register_diagnostic!(E0002, \"\\nSecond\\n\");\n"
        "__register_diagnostic!(E0001, \"\\nFirst\\n\");\n"
        "__register_diagnostic!(E0003);\n"
        );
    auto items = expand_items("__build_diagnostic_array!(my_crate, DIAGNOSTICS);");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].name.name, "DIAGNOSTICS");
    const auto& st = items[0].data.as_Static();
    EXPECT_EQ(st.cls, AST::StaticClass::Static);
    EXPECT_EQ(to_str(st.type), "[(&'static str, &'static str); 2usize]");

    const auto* arr = dynamic_cast<const AST::ExprNode_Array*>(st.value.get());
    ASSERT_TRUE(arr);
    ASSERT_EQ(arr->m_values.size(), 2u);
    const auto* first = dynamic_cast<const AST::ExprNode_Tuple*>(arr->m_values[0].get());
    ASSERT_TRUE(first);
    ASSERT_EQ(first->m_values.size(), 2u);
    EXPECT_EQ(str_value(first->m_values[0]), "E0001");
    EXPECT_EQ(str_value(first->m_values[1]), "\nFirst\n");
}

// --------------------------------------------------------------------
// Marker derives
// --------------------------------------------------------------------
TEST_F(BuiltinsTest, MarkerDerives)
{
    auto items = expand_items("#[derive(Clone, Copy)] struct S;");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].name.name, "S");
    ASSERT_TRUE(items[1].data.is_Impl());
    EXPECT_EQ(to_str(items[1].data.as_Impl().trait_path.unwrap()), "::core::clone::Clone");
    EXPECT_EQ(to_str(items[1].data.as_Impl().self_ty), "S");
    EXPECT_EQ(to_str(items[2].data.as_Impl().trait_path.unwrap()), "::core::marker::Copy");
    EXPECT_EQ(emitter->error_count(), 0u);

    // `Copy` is recorded against the derive group
    ASSERT_EQ(resolver.special_derives.size(), 1u);
    auto group = resolver.special_derives.begin()->first;
    EXPECT_TRUE(resolver.has_derives(group, SpecialDerives::COPY));
    EXPECT_FALSE(resolver.has_derives(group, SpecialDerives::PARTIAL_EQ));
}

TEST_F(BuiltinsTest, EqualityDerivesAreRecorded)
{
    auto items = expand_items("#[derive(PartialEq, Eq)] enum E { A, B }");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(to_str(items[1].data.as_Impl().trait_path.unwrap()), "::core::cmp::PartialEq");
    EXPECT_EQ(to_str(items[2].data.as_Impl().trait_path.unwrap()), "::core::cmp::Eq");

    ASSERT_EQ(resolver.special_derives.size(), 1u);
    auto group = resolver.special_derives.begin()->first;
    EXPECT_TRUE(resolver.has_derives(group, SpecialDerives(SpecialDerives::PARTIAL_EQ) | SpecialDerives::EQ));
    EXPECT_FALSE(resolver.has_derives(group, SpecialDerives::COPY));
    // The group is the `#[derive]` expansion itself
    EXPECT_EQ(group.expn_data().kind.descr(), "#[derive]");
}

TEST_F(BuiltinsTest, MarkerDeriveOnNonAdtReportedOnce)
{
    auto items = expand_items("#[derive(Clone, Copy)] mod m { }");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_TRUE(items[0].data.is_Mod());
    EXPECT_EQ(emitter->count(Diagnostics::Level::Error, "`derive` may only be applied to structs, enums and unions"), 1u);
    EXPECT_EQ(emitter->error_count(), 1u);
    EXPECT_TRUE(resolver.special_derives.empty());
}

TEST_F(BuiltinsTest, SeparateItemsSeparateGroups)
{
    expand_items("#[derive(Copy)] struct A; #[derive(Eq)] struct B;");
    EXPECT_EQ(resolver.special_derives.size(), 2u);
}
