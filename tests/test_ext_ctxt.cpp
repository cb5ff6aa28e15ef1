/*
 * synext - Syntax extension expansion core
 *
 * tests/test_ext_ctxt.cpp
 * - Extension context helpers
 */
#include "test_common.hpp"

typedef ExpandTest ExtCtxtTest;

namespace {
    ExpnId fresh_macro(const char* name, ExpnId parent, Span call_site)
    {
        auto data = ExpnData::default_(ExpnKind::make_macro(MacroKind::Bang, name), mv$(call_site), AST::Edition::Rust2015);
        data.parent = parent;
        return ExpnId::fresh(mv$(data));
    }
}

TEST_F(ExtCtxtTest, Config)
{
    EXPECT_EQ(cx.ecfg.crate_name, "test_crate");
    EXPECT_EQ(cx.ecfg.recursion_limit, 64u);
    EXPECT_FALSE(cx.trace_macros());
    cx.set_trace_macros(true);
    EXPECT_TRUE(cx.trace_macros());

    EXPECT_FALSE(cx.ecfg.is_feature_enabled("my_feature"));
    cx.ecfg.features.insert(RcString::new_interned("my_feature"));
    EXPECT_TRUE(cx.ecfg.is_feature_enabled("my_feature"));

    // Module path starts at the crate
    ASSERT_EQ(cx.current_expansion.module_path.size(), 1u);
    EXPECT_EQ(cx.current_expansion.module_path[0].name, "test_crate");
    EXPECT_EQ(cx.current_expansion.depth, 0u);
}

TEST_F(ExtCtxtTest, ResolvePath)
{
    EXPECT_EQ(cx.resolve_path("/abs/file.txt", test_span(1, 0)), "/abs/file.txt");

    Span    in_dir(Span(), "src/dir/lib.rs", 3, 0, 3, 4);
    EXPECT_EQ(cx.resolve_path("data.txt", in_dir), "src/dir/data.txt");

    // A file with no directory leaves the path as-is
    EXPECT_EQ(cx.resolve_path("data.txt", test_span(1, 0)), "data.txt");

    // No source file to be relative to
    EXPECT_THROW(cx.resolve_path("data.txt", Span()), CompileError::BugCheck);
    Span    synthetic(Span(), "<stringify>", 1, 0, 1, 1);
    EXPECT_THROW(cx.resolve_path("data.txt", synthetic), CompileError::BugCheck);
}

TEST_F(ExtCtxtTest, ExpansionCause)
{
    EXPECT_TRUE(cx.expansion_cause().is_none());

    auto outer_call = test_span(1, 0);
    auto outer = fresh_macro("outer", ExpnId::root(), outer_call);
    auto inner_call = test_span(2, 4).with_call_site_ctxt(outer);
    auto inner = fresh_macro("inner", outer, inner_call);

    cx.current_expansion.id = inner;
    auto cause = cx.expansion_cause();
    ASSERT_TRUE(cause.is_some());
    EXPECT_EQ(cause.unwrap(), outer_call);
}

TEST_F(ExtCtxtTest, ExpansionCauseStopsAtInclude)
{
    auto include_call = test_span(1, 0);
    auto include = fresh_macro("include", ExpnId::root(), include_call);
    auto inner_call = test_span(2, 4).with_call_site_ctxt(include);
    auto inner = fresh_macro("inner", include, inner_call);

    cx.current_expansion.id = inner;
    auto cause = cx.expansion_cause();
    ASSERT_TRUE(cause.is_some());
    EXPECT_EQ(cause.unwrap(), inner_call);
}

TEST_F(ExtCtxtTest, ExpansionCauseOfDeepNesting)
{
    auto a_call = test_span(1, 0);
    auto a = fresh_macro("a", ExpnId::root(), a_call);
    auto b_call = test_span(2, 4).with_call_site_ctxt(a);
    auto b = fresh_macro("b", a, b_call);
    auto c_call = test_span(3, 8).with_call_site_ctxt(b);
    auto c = fresh_macro("c", b, c_call);

    cx.current_expansion.id = c;
    auto cause = cx.expansion_cause();
    ASSERT_TRUE(cause.is_some());
    EXPECT_EQ(cause.unwrap(), a_call);

    cx.current_expansion.id = b;
    ASSERT_TRUE(cx.expansion_cause().is_some());
    EXPECT_EQ(cx.expansion_cause().unwrap(), a_call);
}

TEST_F(ExtCtxtTest, NoExpansionCauseInsideInclude)
{
    auto include = fresh_macro("include", ExpnId::root(), test_span(1, 0));
    cx.current_expansion.id = include;
    EXPECT_TRUE(cx.expansion_cause().is_none());
}

TEST_F(ExtCtxtTest, HygieneHelpers)
{
    auto expn = fresh_macro("m", ExpnId::root(), test_span(1, 0));
    cx.current_expansion.id = expn;
    auto sp = test_span(3, 0);
    EXPECT_EQ(cx.with_def_site_ctxt(sp).ctxt().outer_expn(), expn);
    EXPECT_EQ(cx.with_def_site_ctxt(sp).ctxt().outer_transparency(), Transparency::Opaque);
    EXPECT_EQ(cx.with_call_site_ctxt(sp).ctxt().outer_transparency(), Transparency::Transparent);
    EXPECT_EQ(cx.with_legacy_ctxt(sp).ctxt().outer_transparency(), Transparency::SemiTransparent);
    EXPECT_TRUE(cx.with_def_site_ctxt(sp).same_location(sp));
}

TEST_F(ExtCtxtTest, Paths)
{
    EXPECT_EQ(to_str(cx.path_global(test_span(1, 0), { "core", "clone", "Clone" })), "::core::clone::Clone");
    auto p = cx.std_path({ "fmt", "Debug" });
    EXPECT_FALSE(p.is_global());
    EXPECT_EQ(to_str(p), "$crate::fmt::Debug");
    EXPECT_EQ(p.last_name(), "Debug");

    auto id = cx.ident_of("name", test_span(1, 0));
    EXPECT_EQ(id.name, "name");
}

TEST_F(ExtCtxtTest, ExprBuilders)
{
    auto sp = test_span(1, 0);
    EXPECT_EQ(to_str(*cx.expr_str(sp, "a\"b")), "\"a\\\"b\"");
    EXPECT_EQ(to_str(*cx.expr_usize(sp, 3)), "3usize");
    EXPECT_EQ(to_str(*cx.expr_u32(sp, 7)), "7u32");
    EXPECT_EQ(to_str(*cx.expr_bool(sp, false)), "false");

    ::std::vector<AST::ExprNodeP>   vals;
    vals.push_back( cx.expr_bool(sp, true) );
    vals.push_back( cx.expr_u32(sp, 1) );
    EXPECT_EQ(to_str(*cx.expr_vec(sp, mv$(vals))), "[true, 1u32]");

    ::std::vector<AST::ExprNodeP>   one;
    one.push_back( cx.expr_str(sp, "x") );
    auto tup = cx.expr_tuple(sp, mv$(one));
    EXPECT_EQ(to_str(*tup), "(\"x\",)");
    EXPECT_EQ(tup->span(), sp);

    auto stmt = cx.stmt_expr( cx.expr_bool(sp, true) );
    EXPECT_TRUE(stmt.data.is_Semi());
}

TEST_F(ExtCtxtTest, TypeAndItemBuilders)
{
    auto sp = test_span(1, 0);
    auto u8_ty = cx.ty_ident(sp, cx.ident_of("u8", sp));
    EXPECT_EQ(to_str(u8_ty), "u8");
    EXPECT_EQ(to_str(cx.ty_rptr(sp, cx.ty_ident(sp, cx.ident_of("str", sp)), "static", false)), "&'static str");

    ::std::vector<TypeRef>  tys;
    tys.push_back( cx.ty_ident(sp, cx.ident_of("A", sp)) );
    tys.push_back( cx.ty_ident(sp, cx.ident_of("B", sp)) );
    EXPECT_EQ(to_str(cx.ty_tup(sp, mv$(tys))), "(A, B)");
    EXPECT_EQ(to_str(cx.ty_array(sp, cx.ty_ident(sp, cx.ident_of("u8", sp)), cx.expr_usize(sp, 4))), "[u8; 4usize]");

    auto st = cx.item_static(sp, cx.ident_of("X", sp), mv$(u8_ty), AST::StaticClass::Static, cx.expr_u32(sp, 1));
    EXPECT_TRUE(st.is_pub);
    EXPECT_EQ(st.name.name, "X");
    ASSERT_TRUE(st.data.is_Static());
    EXPECT_EQ(st.data.as_Static().cls, AST::StaticClass::Static);

    auto imp = cx.item_impl(sp, cx.path_global(sp, { "core", "marker", "Copy" }), cx.ty_ident(sp, cx.ident_of("S", sp)), {});
    ASSERT_TRUE(imp.data.is_Impl());
    EXPECT_EQ(to_str(imp.data.as_Impl().trait_path.unwrap()), "::core::marker::Copy");
}

TEST_F(ExtCtxtTest, CheckZeroTts)
{
    check_zero_tts(cx, test_span(1, 0), lex(""), "file!");
    EXPECT_TRUE(emitter->diags.empty());
    check_zero_tts(cx, test_span(1, 0), lex("x"), "file!");
    EXPECT_TRUE(emitter->has_error("file! takes no arguments"));
}

TEST_F(ExtCtxtTest, SingleStr)
{
    auto sp = test_span(1, 0);
    auto s = get_single_str_from_tts(cx, sp, lex("\"hello\""), "m!");
    ASSERT_TRUE(s.is_some());
    EXPECT_EQ(s.unwrap(), "hello");

    // Trailing comma is allowed
    auto t = get_single_str_from_tts(cx, sp, lex("\"hi\","), "m!");
    ASSERT_TRUE(t.is_some());
    EXPECT_EQ(t.unwrap(), "hi");
    EXPECT_TRUE(emitter->diags.empty());

    EXPECT_TRUE(get_single_str_from_tts(cx, sp, lex(""), "m!").is_none());
    EXPECT_TRUE(emitter->has_error("m! takes 1 argument"));

    EXPECT_TRUE(get_single_str_from_tts(cx, sp, lex("42"), "m!").is_none());
    EXPECT_TRUE(emitter->has_error("argument must be a string literal"));
}

TEST_F(ExtCtxtTest, ExtraArgumentsToSingleStr)
{
    get_single_str_from_tts(cx, test_span(1, 0), lex("\"a\", \"b\""), "m!");
    EXPECT_TRUE(emitter->has_error("m! takes 1 argument"));
}

TEST_F(ExtCtxtTest, ExprList)
{
    auto sp = test_span(1, 0);
    auto es = get_exprs_from_tts(cx, sp, lex("1, \"a\", (b, c),"));
    ASSERT_TRUE(es.is_some());
    ASSERT_EQ(es.unwrap().size(), 3u);
    EXPECT_EQ(to_str(*es.unwrap()[1]), "\"a\"");
    EXPECT_EQ(to_str(*es.unwrap()[2]), "(b, c)");

    auto empty = get_exprs_from_tts(cx, sp, lex(""));
    ASSERT_TRUE(empty.is_some());
    EXPECT_TRUE(empty.unwrap().empty());
    EXPECT_TRUE(emitter->diags.empty());

    EXPECT_TRUE(get_exprs_from_tts(cx, sp, lex("1 2")).is_none());
    EXPECT_TRUE(emitter->has_error("expected token: `,`"));
}

TEST_F(ExtCtxtTest, ExprToString)
{
    auto sp = test_span(1, 0);
    auto ok = expr_to_spanned_string(cx, cx.expr_str(sp, "text"), "need a string");
    ASSERT_TRUE(ok.is_Ok());
    EXPECT_EQ(ok.as_Ok().value, "text");
    EXPECT_EQ(ok.as_Ok().span, sp);

    // Errors are left to the caller
    auto bad = expr_to_spanned_string(cx, cx.expr_bool(sp, true), "need a string");
    ASSERT_TRUE(bad.is_Err());
    ASSERT_TRUE(bad.as_Err());
    bad.as_Err()->cancel();
    EXPECT_TRUE(emitter->diags.empty());

    EXPECT_TRUE(expr_to_string(cx, cx.expr_bool(sp, true), "need a string").is_none());
    EXPECT_TRUE(emitter->has_error("need a string"));
}

TEST_F(ExtCtxtTest, TraceMacrosDiag)
{
    auto sp = test_span(4, 0);
    cx.expansions[sp].push_back("expanding `a! { }`");
    cx.expansions[sp].push_back("to `1`");
    cx.trace_macros_diag();

    ASSERT_EQ(emitter->diags.size(), 1u);
    const auto& d = emitter->diags[0];
    EXPECT_EQ(d.level, Diagnostics::Level::Note);
    EXPECT_EQ(d.message, "trace_macro");
    ASSERT_EQ(d.children.size(), 2u);
    EXPECT_EQ(d.children[1].message, "to `1`");
    EXPECT_TRUE(cx.expansions.empty());

    // Nothing recorded, nothing emitted
    cx.trace_macros_diag();
    EXPECT_EQ(emitter->diags.size(), 1u);
}

TEST_F(ExtCtxtTest, CheckUnusedMacrosDelegates)
{
    cx.check_unused_macros();
    EXPECT_EQ(resolver.unused_checks, 1u);
}

TEST_F(ExtCtxtTest, ModuleScope)
{
    auto parent = ExpnId::fresh(rust::None<ExpnData>());
    resolver.module_scopes[7] = parent;
    cx.set_module_scope(7);
    EXPECT_EQ(cx.current_expansion.id, parent);
    cx.set_module_scope(0);
    EXPECT_EQ(cx.current_expansion.id, ExpnId::root());
}

TEST_F(ExtCtxtTest, ReportingHelpers)
{
    cx.span_warn(test_span(1, 0), "warned");
    cx.span_err_with_code(test_span(1, 0), "coded", "E0123");
    EXPECT_EQ(sess.span_diagnostic.warn_count(), 1u);
    EXPECT_EQ(sess.span_diagnostic.err_count(), 1u);
    EXPECT_THROW(cx.span_fatal(test_span(1, 0), "fatal"), CompileError::Fatal);
    EXPECT_THROW(cx.bug("bug"), CompileError::BugCheck);
}
