/*
 * synext - Syntax extension expansion core
 *
 * tests/test_expander.cpp
 * - Fixed-point expansion of fragments
 */
#include "test_common.hpp"

using AST::AstFragmentKind;

namespace {
    /// Bang macro that always produces the given source
    SyntaxExtension make_const_bang(const char* output)
    {
        ::std::string   out = output;
        return make_bang([out](ExtCtxt& , const Span& , const TokenTree& ) { return lex(out); });
    }

    struct ExpanderTest:
        public ExpandTest
    {
    };
}

// --------------------------------------------------------------------
// Bang macros in each position
// --------------------------------------------------------------------
TEST_F(ExpanderTest, ExprPosition)
{
    resolver.add("answer", make_const_bang("42"));
    EXPECT_EQ(to_str(*expand_expr("answer!()")), "42");
    EXPECT_EQ(to_str(*expand_expr("(answer!(), [answer![]])")), "(42, [42])");
    EXPECT_EQ(emitter->error_count(), 0u);
}

TEST_F(ExpanderTest, ItemPosition)
{
    resolver.add("gen", make_const_bang("struct Gen; struct Gen2;"));
    auto items = expand_items("struct A; gen!(); struct B;");
    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[0].name.name, "A");
    EXPECT_EQ(items[1].name.name, "Gen");
    EXPECT_EQ(items[2].name.name, "Gen2");
    EXPECT_EQ(items[3].name.name, "B");
}

TEST_F(ExpanderTest, ItemInsideModAndImpl)
{
    resolver.add("gen", make_const_bang("struct Gen;"));
    resolver.add("assoc", make_const_bang("const A: u32 = 1; type T = u8;"));
    auto items = expand_items("mod m { gen!(); } impl S { assoc!(); }");
    ASSERT_EQ(items.size(), 2u);
    const auto& m = items[0].data.as_Mod();
    ASSERT_EQ(m.items.size(), 1u);
    EXPECT_EQ(m.items[0].name.name, "Gen");

    const auto& imp = items[1].data.as_Impl();
    ASSERT_EQ(imp.items.size(), 2u);
    EXPECT_TRUE(imp.items[0].data.is_Const());
    EXPECT_TRUE(imp.items[1].data.is_Type());
}

TEST_F(ExpanderTest, TraitItemPosition)
{
    resolver.add("assoc", make_const_bang("type T;"));
    auto items = expand_items("trait Tr { const A: u32; assoc!(); }");
    const auto& tr = items[0].data.as_Trait();
    ASSERT_EQ(tr.items.size(), 2u);
    EXPECT_TRUE(tr.items[1].data.is_Type());
}

TEST_F(ExpanderTest, PatAndTyPositions)
{
    resolver.add("p", make_const_bang("(a, _)"));
    resolver.add("t", make_const_bang("u8"));
    auto frag = expand("let p!(): t!() = 1;", AstFragmentKind::Stmts);
    const auto& stmts = frag.as_Stmts();
    ASSERT_EQ(stmts.size(), 1u);
    const auto& local = stmts[0].data.as_Local();
    EXPECT_EQ(to_str(local.pat), "(a, _)");
    ASSERT_TRUE(local.ty);
    EXPECT_EQ(to_str(*local.ty), "u8");
}

TEST_F(ExpanderTest, SemicolonStatementMacro)
{
    resolver.add("m", make_const_bang("let x = 1; x"));

    // `m!();` makes the trailing expression a statement
    auto semi = expand("m!();", AstFragmentKind::Stmts);
    const auto& s1 = semi.as_Stmts();
    ASSERT_EQ(s1.size(), 2u);
    EXPECT_TRUE(s1[0].data.is_Local());
    EXPECT_TRUE(s1[1].data.is_Semi());

    // `m!()` in tail position leaves it as the value
    auto tail = expand("m!()", AstFragmentKind::Stmts);
    const auto& s2 = tail.as_Stmts();
    ASSERT_EQ(s2.size(), 2u);
    EXPECT_TRUE(s2[1].data.is_Expr());
}

TEST_F(ExpanderTest, ItemsInStatementPosition)
{
    resolver.add("gen", make_const_bang("struct Gen;"));
    auto frag = expand("let a = 1; gen!(); #[wrap] struct W;", AstFragmentKind::Stmts);
    (void)frag;
    // `wrap` is never defined
    EXPECT_TRUE(emitter->has_error("cannot determine resolution for the attribute macro `wrap`"));

    resolver.add("wrap", SyntaxExtension::non_macro_attr(false, AST::Edition::Rust2015));
    auto frag2 = expand("let a = 1; gen!(); #[wrap] struct W;", AstFragmentKind::Stmts);
    const auto& stmts = frag2.as_Stmts();
    ASSERT_EQ(stmts.size(), 3u);
    ASSERT_TRUE(stmts[1].data.is_Item());
    EXPECT_EQ(stmts[1].data.as_Item()->name.name, "Gen");
    ASSERT_TRUE(stmts[2].data.is_Item());
    EXPECT_EQ(stmts[2].data.as_Item()->name.name, "W");
}

// --------------------------------------------------------------------
// Nesting and hygiene data
// --------------------------------------------------------------------
TEST_F(ExpanderTest, NestedExpansion)
{
    ExpnId  inner_id;
    unsigned int    inner_depth = 0;
    resolver.add("outer", make_const_bang("inner!()"));
    resolver.add("inner", make_bang([&](ExtCtxt& cx, const Span& , const TokenTree& ) {
        inner_id = cx.current_expansion.id;
        inner_depth = cx.current_expansion.depth;
        return lex("7");
        }));

    EXPECT_EQ(to_str(*expand_expr("outer!()")), "7");
    EXPECT_EQ(inner_depth, 2u);
    ASSERT_TRUE(inner_id.has_expn_data());
    const auto& data = inner_id.expn_data();
    EXPECT_EQ(data.kind.descr(), "inner!");
    auto parent = data.parent;
    ASSERT_FALSE(parent.is_root());
    EXPECT_EQ(parent.expn_data().kind.descr(), "outer!");
    EXPECT_TRUE(parent.expn_data().parent.is_root());
    EXPECT_TRUE(inner_id.is_descendant_of(parent));
}

TEST_F(ExpanderTest, ModulePathFollowsMods)
{
    ::std::vector< ::std::string>   seen;
    resolver.add("where_am_i", make_bang([&](ExtCtxt& cx, const Span& , const TokenTree& ) {
        ::std::string   p;
        for(const auto& i : cx.current_expansion.module_path)
            p += ::std::string(i.name.c_str()) + "::";
        seen.push_back(p);
        return lex("");
        }));
    expand_items("where_am_i!(); mod a { mod b { where_am_i!(); } where_am_i!(); }");
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "test_crate::");
    EXPECT_EQ(seen[1], "test_crate::a::b::");
    EXPECT_EQ(seen[2], "test_crate::a::");
    // Restored once expansion is done
    EXPECT_EQ(cx.current_expansion.module_path.size(), 1u);
}

TEST_F(ExpanderTest, NodeIdsAssigned)
{
    resolver.add("gen", make_const_bang("struct G;"));
    auto items = expand_items("struct A; gen!();");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_NE(items[0].id, AST::DUMMY_NODE_ID);
    EXPECT_NE(items[1].id, AST::DUMMY_NODE_ID);
    EXPECT_NE(items[0].id, items[1].id);
    EXPECT_GT(resolver.fragments_visited, 1u);
}

TEST_F(ExpanderTest, EagerExpansionLeavesIds)
{
    auto frag = cx.expander().fully_expand_fragment( parse_fragment("struct A;", AstFragmentKind::Items) );
    EXPECT_EQ(frag.as_Items()[0].id, AST::DUMMY_NODE_ID);
}

// --------------------------------------------------------------------
// Resolution passes
// --------------------------------------------------------------------
TEST_F(ExpanderTest, IndeterminateIsRetried)
{
    resolver.add("late", make_const_bang("1"));
    resolver.add("now", make_const_bang("2"));
    resolver.indeterminate_passes["late"] = 1;

    EXPECT_EQ(to_str(*expand_expr("(late!(), now!())")), "(1, 2)");
    EXPECT_EQ(emitter->error_count(), 0u);

    ::std::vector<bool> late_forces;
    for(const auto& e : resolver.resolve_log)
        if( e.first == "late" )
            late_forces.push_back(e.second);
    ASSERT_GE(late_forces.size(), 2u);
    EXPECT_FALSE(late_forces[0]);
}

TEST_F(ExpanderTest, StuckResolutionIsForced)
{
    resolver.add("late", make_const_bang("1"));
    resolver.indeterminate_passes["late"] = 100;

    EXPECT_EQ(to_str(*expand_expr("late!()")), "1");
    ASSERT_FALSE(resolver.resolve_log.empty());
    EXPECT_TRUE(resolver.resolve_log.back().second);
}

TEST_F(ExpanderTest, NoForcingWhileProgressing)
{
    // `chain!` re-expands itself for ten passes
    unsigned int    remaining = 10;
    resolver.add("chain", make_bang([&](ExtCtxt& , const Span& , const TokenTree& ) {
        if( remaining == 0 )
            return lex("0");
        remaining --;
        return lex("chain!()");
        }));
    resolver.add("late", make_const_bang("1"));
    resolver.indeterminate_passes["late"] = 100;

    EXPECT_EQ(to_str(*expand_expr("(chain!(), late!())")), "(0, 1)");
    EXPECT_EQ(emitter->error_count(), 0u);

    size_t  last_chain = 0;
    size_t  first_forced_late = resolver.resolve_log.size();
    for(size_t i = 0; i < resolver.resolve_log.size(); i ++)
    {
        const auto& e = resolver.resolve_log[i];
        if( e.first == "chain" ) {
            EXPECT_FALSE(e.second) << "pass " << i;
            last_chain = i;
        }
        if( e.first == "late" && e.second && first_forced_late == resolver.resolve_log.size() )
            first_forced_late = i;
    }
    ASSERT_LT(first_forced_late, resolver.resolve_log.size());
    EXPECT_GT(first_forced_late, last_chain);
}

TEST_F(ExpanderTest, UnresolvableMacro)
{
    auto e = expand_expr("missing!()");
    EXPECT_TRUE( dynamic_cast<const AST::ExprNode_Error*>(e.get()) );
    EXPECT_EQ(emitter->error_count(), 1u);
    EXPECT_TRUE(emitter->has_error("cannot determine resolution for the macro `missing`"));
}

// --------------------------------------------------------------------
// Errors in expansion
// --------------------------------------------------------------------
TEST_F(ExpanderTest, KindMismatch)
{
    resolver.add("an_attr", make_attr([](ExtCtxt& , const Span& , const TokenTree& , const TokenTree& item) { return item.clone(); }));
    resolver.add("a_bang", make_const_bang("1"));

    auto e = expand_expr("an_attr!()");
    EXPECT_TRUE( dynamic_cast<const AST::ExprNode_Error*>(e.get()) );
    EXPECT_TRUE(emitter->has_error("expected macro, found attribute macro `an_attr`"));

    // The item survives without the attribute
    auto items = expand_items("#[a_bang] struct S;");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].name.name, "S");
    EXPECT_TRUE(items[0].attrs.m_items.empty());
    EXPECT_TRUE(emitter->has_error("expected attribute, found macro `a_bang`"));
}

TEST_F(ExpanderTest, LegacyResultInWrongPosition)
{
    resolver.add("num", make_legacy_bang([](ExtCtxt& cx, const Span& sp, const TokenTree& ) {
        return MacEager::new_expr(cx.expr_u32(sp, 1));
        }));
    EXPECT_EQ(to_str(*expand_expr("num!()")), "1u32");

    auto items = expand_items("num!();");
    EXPECT_TRUE(items.empty());
    EXPECT_TRUE(emitter->has_error("non-item macro in item position: num"));
}

TEST_F(ExpanderTest, UnparseableOutput)
{
    resolver.add("bad", make_const_bang("1 2"));
    auto e = expand_expr("bad!()");
    EXPECT_TRUE( dynamic_cast<const AST::ExprNode_Error*>(e.get()) );
    ASSERT_EQ(emitter->error_count(), 1u);
    const auto& d = emitter->diags[0];
    ASSERT_EQ(d.children.size(), 1u);
    EXPECT_EQ(d.children[0].message, "while parsing the output of `bad!` as expression");
}

TEST_F(ExpanderTest, RecursionLimit)
{
    cx.ecfg.recursion_limit = 4;
    resolver.add("rec", make_const_bang("rec!()"));
    EXPECT_THROW(expand_expr("rec!()"), CompileError::Fatal);
    EXPECT_EQ(emitter->count(Diagnostics::Level::Fatal, "recursion limit reached while expanding `rec!`"), 1u);
    const auto& d = emitter->diags.back();
    ASSERT_EQ(d.children.size(), 1u);
    EXPECT_EQ(d.children[0].level, Diagnostics::Level::Help);
    EXPECT_NE(d.children[0].message.find("#![recursion_limit=\"8\"]"), ::std::string::npos);
    // The frame is restored on unwind
    EXPECT_EQ(cx.current_expansion.depth, 0u);
}

TEST_F(ExpanderTest, EagerRecursionIsLimited)
{
    cx.ecfg.recursion_limit = 4;
    // `first!(e)` eagerly expands `e` before returning it
    resolver.add("first", make_legacy_bang([](ExtCtxt& cx, const Span& sp, const TokenTree& tts)->::std::unique_ptr<MacResult> {
        auto exprs = get_exprs_from_tts(cx, sp, tts);
        if( !exprs.is_some() || exprs.unwrap().empty() )
            return DummyResult::any(sp);
        return MacEager::new_expr( mv$(exprs.unwrap()[0]) );
        }));
    resolver.add("rec", make_const_bang("first!(rec!())"));
    EXPECT_THROW(expand_expr("rec!()"), CompileError::Fatal);
    EXPECT_EQ(cx.current_expansion.depth, 0u);
}

// --------------------------------------------------------------------
// Attribute macros
// --------------------------------------------------------------------
TEST_F(ExpanderTest, TokenAttribute)
{
    ::std::string   seen_args, seen_item;
    resolver.add("wrap", make_attr([&](ExtCtxt& , const Span& , const TokenTree& args, const TokenTree& item) {
        seen_args = args.to_source();
        seen_item = item.to_source();
        return lex(item.to_source() + " struct Extra;");
        }));
    auto items = expand_items("#[wrap(x)] struct S;");
    EXPECT_EQ(seen_args, "x");
    EXPECT_EQ(seen_item, "struct S;");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].name.name, "S");
    EXPECT_EQ(items[1].name.name, "Extra");
}

TEST_F(ExpanderTest, LegacyAttribute)
{
    resolver.add("legacy", make_legacy_attr([](ExtCtxt& , const Span& , const AST::Attribute& a, AST::Annotatable item) {
        EXPECT_TRUE(a.has_name("legacy"));
        ::std::vector<AST::Annotatable> rv;
        rv.push_back( mv$(item) );
        auto extra = parse_items("struct Extra;");
        rv.push_back( AST::Annotatable::from_item(mv$(extra[0])) );
        return rv;
        }));
    auto items = expand_items("#[legacy] struct S;");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[1].name.name, "Extra");
}

TEST_F(ExpanderTest, AttributeOnImplItem)
{
    resolver.add("dup", make_attr([](ExtCtxt& , const Span& , const TokenTree& , const TokenTree& item) {
        return lex(item.to_source() + " const B: u32 = 2;");
        }));
    auto items = expand_items("impl S { #[dup] const A: u32 = 1; }");
    const auto& imp = items[0].data.as_Impl();
    ASSERT_EQ(imp.items.size(), 2u);
    EXPECT_EQ(imp.items[0].name.name, "A");
    EXPECT_EQ(imp.items[1].name.name, "B");
}

TEST_F(ExpanderTest, NonMacroAttributeStays)
{
    resolver.add("inert", SyntaxExtension::non_macro_attr(true, AST::Edition::Rust2015));
    auto items = expand_items("#[doc = \"x\"] #[inert] #[allow(dead_code)] struct S;");
    ASSERT_EQ(items.size(), 1u);
    const auto& attrs = items[0].attrs.m_items;
    ASSERT_EQ(attrs.size(), 3u);
    EXPECT_TRUE(attrs[0].has_name("doc"));
    EXPECT_TRUE(attrs[1].has_name("inert"));
    EXPECT_TRUE(attrs[1].is_known());
    EXPECT_TRUE(attrs[1].is_used());
    EXPECT_TRUE(attrs[2].has_name("allow"));
    EXPECT_EQ(emitter->error_count(), 0u);
}

// --------------------------------------------------------------------
// Derives
// --------------------------------------------------------------------
TEST_F(ExpanderTest, DeriveOutputFollowsItem)
{
    ::std::string   seen_item;
    resolver.add("Tr", make_derive([&](ExtCtxt& , const Span& , const TokenTree& item) {
        seen_item = item.to_source();
        return lex("impl Tr for S {}");
        }, { RcString::new_interned("helper") }));
    resolver.add("Gen", make_legacy_derive([](ExtCtxt& , const Span& , const AST::Path& , const AST::Annotatable& ) {
        ::std::vector<AST::Annotatable> rv;
        auto extra = parse_items("struct Generated;");
        rv.push_back( AST::Annotatable::from_item(mv$(extra[0])) );
        return rv;
        }));

    auto items = expand_items("#[derive(Tr)] #[derive(Gen)] #[helper] struct S;");
    EXPECT_EQ(emitter->error_count(), 0u);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].name.name, "S");
    EXPECT_TRUE(items[1].data.is_Impl());
    EXPECT_EQ(items[2].name.name, "Generated");

    // The derive attributes are consumed, the helper is left and is inert
    const auto& attrs = items[0].attrs.m_items;
    ASSERT_EQ(attrs.size(), 1u);
    EXPECT_TRUE(attrs[0].has_name("helper"));
    EXPECT_TRUE(attrs[0].is_known());
    EXPECT_NE(seen_item.find("struct S"), ::std::string::npos);
}

TEST_F(ExpanderTest, AttributeMacroRunsBeforeDerives)
{
    ::std::vector< ::std::string>   order;
    bool    wrap_saw_derive = false;
    resolver.add("wrap", make_legacy_attr([&](ExtCtxt& , const Span& , const AST::Attribute& , AST::Annotatable item) {
        order.push_back("wrap");
        for(const auto& a : item.attrs().m_items)
            if( a.has_name("derive") )
                wrap_saw_derive = true;
        ::std::vector<AST::Annotatable> rv;
        rv.push_back( mv$(item) );
        return rv;
        }));
    resolver.add("Gen", make_legacy_derive([&](ExtCtxt& , const Span& , const AST::Path& , const AST::Annotatable& ) {
        order.push_back("Gen");
        ::std::vector<AST::Annotatable> rv;
        auto extra = parse_items("struct Generated;");
        rv.push_back( AST::Annotatable::from_item(mv$(extra[0])) );
        return rv;
        }));

    auto items = expand_items("#[derive(Gen)] #[wrap] struct S;");
    EXPECT_EQ(emitter->error_count(), 0u);
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "wrap");
    EXPECT_EQ(order[1], "Gen");
    EXPECT_TRUE(wrap_saw_derive);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].name.name, "S");
    EXPECT_EQ(items[1].name.name, "Generated");
}

TEST_F(ExpanderTest, DeriveOnNonAdt)
{
    resolver.add("Tr", make_derive([](ExtCtxt& , const Span& , const TokenTree& ) { return lex(""); }));
    auto items = expand_items("#[derive(Tr)] mod m { }");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_TRUE(items[0].data.is_Mod());
    EXPECT_TRUE(emitter->has_error("`derive` may only be applied to structs, enums and unions"));
}

TEST_F(ExpanderTest, DeriveOfNonDerive)
{
    resolver.add("answer", make_const_bang("42"));
    auto items = expand_items("#[derive(answer)] struct S;");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_TRUE(emitter->has_error("expected derive macro, found macro `answer`"));
}

TEST_F(ExpanderTest, MalformedDerives)
{
    resolver.add("Tr", make_derive([](ExtCtxt& , const Span& , const TokenTree& ) { return lex("struct FromTr;"); }));

    auto empty = expand_items("#[derive()] struct S;");
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_TRUE(empty[0].attrs.m_items.empty());
    EXPECT_EQ(emitter->error_count(), 0u);
    EXPECT_TRUE(resolver.resolve_log.empty());

    auto bare = expand_items("#[derive] struct S;");
    ASSERT_EQ(bare.size(), 1u);
    EXPECT_TRUE(emitter->has_error("malformed `derive` attribute input"));

    auto lit = expand_items("#[derive(\"Tr\", Tr)] struct S;");
    EXPECT_TRUE(emitter->has_error("expected path to a trait, found literal"));
    ASSERT_EQ(lit.size(), 2u);
    EXPECT_EQ(lit[1].name.name, "FromTr");
}

// --------------------------------------------------------------------
// trace_macros
// --------------------------------------------------------------------
TEST_F(ExpanderTest, TraceNotes)
{
    resolver.add("answer", make_const_bang("42"));
    cx.set_trace_macros(true);
    expand_expr("answer!(x y)");
    ASSERT_EQ(cx.expansions.size(), 1u);
    const auto& notes = cx.expansions.begin()->second;
    ASSERT_EQ(notes.size(), 2u);
    EXPECT_EQ(notes[0], "expanding `answer! { x y }`");
    EXPECT_EQ(notes[1], "to `42`");

    cx.trace_macros_diag();
    EXPECT_EQ(emitter->count(Diagnostics::Level::Note, "trace_macro"), 1u);
}

TEST_F(ExpanderTest, NoTraceByDefault)
{
    resolver.add("answer", make_const_bang("42"));
    expand_expr("answer!()");
    EXPECT_TRUE(cx.expansions.empty());
}
