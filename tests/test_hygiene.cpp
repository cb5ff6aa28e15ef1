/*
 * synext - Syntax extension expansion core
 *
 * tests/test_hygiene.cpp
 * - Expansion ids and syntax contexts
 */
#include "test_common.hpp"

namespace {
    ExpnId fresh_macro(const char* name, ExpnId parent, Span call_site)
    {
        auto data = ExpnData::default_(ExpnKind::make_macro(MacroKind::Bang, name), mv$(call_site), AST::Edition::Rust2015);
        data.parent = parent;
        return ExpnId::fresh(mv$(data));
    }
}

TEST(Hygiene, RootExpansion)
{
    auto root = ExpnId::root();
    EXPECT_TRUE(root.is_root());
    EXPECT_TRUE(root.has_expn_data());
    EXPECT_TRUE(root.expn_data().is_root());
    EXPECT_EQ(root.expn_data().kind.descr(), "<root>");
}

TEST(Hygiene, FreshIdsAreDistinct)
{
    auto a = ExpnId::fresh(rust::None<ExpnData>());
    auto b = ExpnId::fresh(rust::None<ExpnData>());
    EXPECT_NE(a, b);
    EXPECT_FALSE(a.is_root());
    EXPECT_FALSE(a.has_expn_data());

    a.set_expn_data( ExpnData::default_(ExpnKind::make_macro(MacroKind::Attr, "test"), test_span(1, 0), AST::Edition::Rust2018) );
    EXPECT_TRUE(a.has_expn_data());
    EXPECT_EQ(a.expn_data().edition, AST::Edition::Rust2018);
    EXPECT_EQ(a.expn_data().kind.descr(), "#[test]");
}

TEST(Hygiene, ExpnDataCannotBeReset)
{
    auto a = fresh_macro("m", ExpnId::root(), test_span(1, 0));
    EXPECT_THROW(
        a.set_expn_data( ExpnData::default_(ExpnKind::make_macro(MacroKind::Bang, "m"), test_span(1, 0), AST::Edition::Rust2015) ),
        CompileError::BugCheck
        );
}

TEST(Hygiene, Descendants)
{
    auto outer = fresh_macro("outer", ExpnId::root(), test_span(1, 0));
    auto inner = fresh_macro("inner", outer, test_span(2, 0));
    EXPECT_TRUE(inner.is_descendant_of(outer));
    EXPECT_TRUE(inner.is_descendant_of(ExpnId::root()));
    EXPECT_TRUE(outer.is_descendant_of(outer));
    EXPECT_FALSE(outer.is_descendant_of(inner));
    EXPECT_EQ(inner.parent(), outer);
}

TEST(Hygiene, KindDescriptions)
{
    EXPECT_EQ(ExpnKind::make_macro(MacroKind::Bang, "vec").descr(), "vec!");
    EXPECT_EQ(ExpnKind::make_macro(MacroKind::Derive, "Clone").descr(), "#[derive(Clone)]");
    EXPECT_STREQ(MacroKind_descr(MacroKind::Attr), "attribute macro");
    EXPECT_STREQ(MacroKind_descr_expected(MacroKind::Attr), "attribute");
    EXPECT_STREQ(MacroKind_descr_expected(MacroKind::Derive), "derive macro");
}

TEST(Hygiene, MarksAreInterned)
{
    auto e = fresh_macro("m", ExpnId::root(), test_span(1, 0));
    auto c1 = SyntaxContext::root().apply_mark(e, Transparency::Opaque);
    auto c2 = SyntaxContext::root().apply_mark(e, Transparency::Opaque);
    EXPECT_EQ(c1, c2);
    EXPECT_FALSE(c1.is_root());
    EXPECT_EQ(c1.outer_expn(), e);
    EXPECT_EQ(c1.outer_transparency(), Transparency::Opaque);

    // The root expansion adds nothing
    EXPECT_EQ(c1.apply_mark(ExpnId::root(), Transparency::Opaque), c1);
}

TEST(Hygiene, MarkChainOrder)
{
    auto a = fresh_macro("a", ExpnId::root(), test_span(1, 0));
    auto b = fresh_macro("b", a, test_span(2, 0));
    auto ctxt = SyntaxContext::root()
        .apply_mark(a, Transparency::Opaque)
        .apply_mark(b, Transparency::Opaque);
    auto marks = ctxt.marks();
    ASSERT_EQ(marks.size(), 2u);
    EXPECT_EQ(marks[0].first, a);
    EXPECT_EQ(marks[1].first, b);

    auto removed = ctxt.remove_mark();
    EXPECT_EQ(removed, b);
    EXPECT_EQ(ctxt.outer_expn(), a);
}

TEST(Hygiene, Normalisation)
{
    auto e_opaque = fresh_macro("o", ExpnId::root(), test_span(1, 0));
    auto e_transparent = fresh_macro("t", ExpnId::root(), test_span(2, 0));
    auto e_semi = fresh_macro("s", ExpnId::root(), test_span(3, 0));

    auto transparent = SyntaxContext::root().apply_mark(e_transparent, Transparency::Transparent);
    EXPECT_TRUE(transparent.normalize_to_macros_2_0().is_root());
    EXPECT_TRUE(transparent.normalize_to_macro_rules().is_root());

    auto semi = SyntaxContext::root().apply_mark(e_semi, Transparency::SemiTransparent);
    EXPECT_TRUE(semi.normalize_to_macros_2_0().is_root());
    EXPECT_EQ(semi.normalize_to_macro_rules(), semi);

    auto opaque = SyntaxContext::root().apply_mark(e_opaque, Transparency::Opaque);
    EXPECT_EQ(opaque.normalize_to_macros_2_0(), opaque);
    EXPECT_EQ(opaque.normalize_to_macro_rules(), opaque);
}

TEST(Hygiene, SourceCallsite)
{
    auto user = test_span(3, 4);
    auto outer = fresh_macro("outer", ExpnId::root(), user);
    auto inner_call = test_span(10, 2).with_def_site_ctxt(outer);
    auto inner = fresh_macro("inner", outer, inner_call);
    auto generated = test_span(20, 0).with_def_site_ctxt(inner);

    auto sc = generated.source_callsite();
    EXPECT_TRUE(sc.same_location(user));
    EXPECT_TRUE(sc.ctxt().is_root());
    // Spans outside any expansion are their own call site
    EXPECT_EQ(user.source_callsite(), user);
}

TEST(Hygiene, AllowsUnstable)
{
    auto data = ExpnData::default_(ExpnKind::make_macro(MacroKind::Bang, "m"), Span(), AST::Edition::Rust2015);
    EXPECT_FALSE(data.allows_unstable("core_intrinsics"));
    data.allow_internal_unstable = make_vec1(RcString::new_interned("core_intrinsics"));
    EXPECT_TRUE(data.allows_unstable(RcString::new_interned("core_intrinsics")));
    EXPECT_FALSE(data.allows_unstable(RcString::new_interned("fmt_internals")));
    data.allow_internal_unstable = make_vec1(RcString::new_interned(ALLOW_INTERNAL_UNSTABLE_BACKCOMPAT));
    EXPECT_TRUE(data.allows_unstable(RcString::new_interned("fmt_internals")));
}
