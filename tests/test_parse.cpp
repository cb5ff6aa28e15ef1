/*
 * synext - Syntax extension expansion core
 *
 * tests/test_parse.cpp
 * - Lexer, token trees and fragment parsing
 */
#include "test_common.hpp"
#include <ast/attrs.hpp>

TEST(Lex, TokenSpans)
{
    auto tt = lex("foo\n  bar");
    ASSERT_EQ(tt.size(), 2u);
    const auto* first = tt[0].tok().span().get_source();
    const auto* second = tt[1].tok().span().get_source();
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->filename, "test.rs");
    EXPECT_EQ(first->start_line, 1u);
    EXPECT_EQ(first->start_ofs, 0u);
    EXPECT_EQ(second->start_line, 2u);
    EXPECT_EQ(second->start_ofs, 2u);
}

TEST(Lex, Literals)
{
    auto tt = lex("\"a\\nb\" 42u32 'x' true");
    ASSERT_EQ(tt.size(), 4u);
    EXPECT_EQ(tt[0].tok().type(), TOK_STRING);
    EXPECT_EQ(tt[0].tok().str(), "a\nb");
    EXPECT_EQ(tt[1].tok().type(), TOK_INTEGER);
    EXPECT_EQ(tt[1].tok().intval(), 42u);
    EXPECT_EQ(tt[1].tok().datatype(), CORETYPE_U32);
    EXPECT_EQ(tt[2].tok().type(), TOK_CHAR);
    EXPECT_EQ(tt[2].tok().intval(), static_cast<uint64_t>('x'));
    EXPECT_EQ(tt[3].tok().type(), TOK_RWORD_TRUE);
}

TEST(Lex, GroupsKeepDelimiters)
{
    auto tt = lex("f(a, [b])");
    ASSERT_EQ(tt.size(), 2u);
    EXPECT_TRUE(tt[0].is_token());
    const auto& group = tt[1];
    EXPECT_FALSE(group.is_token());
    ASSERT_GE(group.size(), 2u);
    EXPECT_EQ(group[0].tok().type(), TOK_PAREN_OPEN);
    EXPECT_EQ(group[group.size()-1].tok().type(), TOK_PAREN_CLOSE);
    EXPECT_EQ(tt.token_count(), 8u);
}

TEST(Lex, UnbalancedGroup)
{
    EXPECT_THROW(lex("(a, b"), ParseError::Base);
}

TEST(TokenTree, ToSource)
{
    EXPECT_EQ(lex("a   +   b").to_source(), "a + b");
    EXPECT_EQ(lex("( a , b )").to_source(), "(a, b)");
    EXPECT_EQ(lex("foo ! ( 1 )").to_source(), "foo!(1)");
    EXPECT_EQ(lex("a :: b").to_source(), "a::b");
    EXPECT_EQ(lex("\"q\\\"\"").to_source(), "\"q\\\"\"");
    EXPECT_EQ(TokenTree().to_source(), "");
}

TEST(Parse, Items)
{
    auto items = parse_items(
        "struct Unit;\n"
        "pub struct Tuple(u32, bool);\n"
        "enum E { A, B(u8) }\n"
        "union U { a: u32 }\n"
        "const C: u32 = 1;\n"
        "static mut S: bool = true;\n"
        "mod m { struct Inner; }\n"
        );
    ASSERT_EQ(items.size(), 7u);
    EXPECT_TRUE(items[0].data.is_Struct());
    EXPECT_EQ(items[0].data.as_Struct().kind, AST::StructKind::Unit);
    EXPECT_TRUE(items[1].is_pub);
    EXPECT_EQ(items[1].data.as_Struct().fields.size(), 2u);
    EXPECT_EQ(items[2].data.as_Enum().variants.size(), 2u);
    EXPECT_TRUE(items[3].data.is_Union());
    EXPECT_TRUE(items[3].is_adt());
    EXPECT_EQ(items[4].data.as_Static().cls, AST::StaticClass::Const);
    EXPECT_EQ(items[5].data.as_Static().cls, AST::StaticClass::MutStatic);
    ASSERT_TRUE(items[6].data.is_Mod());
    EXPECT_EQ(items[6].name.name, "m");
    EXPECT_EQ(items[6].data.as_Mod().items.size(), 1u);
    EXPECT_FALSE(items[6].is_adt());
}

TEST(Parse, ItemMacros)
{
    auto items = parse_items("foo!(a b);\nbar! { c }\n");
    ASSERT_EQ(items.size(), 2u);
    ASSERT_TRUE(items[0].data.is_MacroInv());
    const auto& inv = items[0].data.as_MacroInv();
    EXPECT_TRUE(inv.path() == "foo");
    EXPECT_EQ(inv.input_tt().to_source(), "a b");
    EXPECT_EQ(inv.delim(), AST::MacDelimiter::Parenthesis);
    EXPECT_FALSE(inv.is_placeholder());
    EXPECT_EQ(items[1].data.as_MacroInv().delim(), AST::MacDelimiter::Brace);
}

TEST(Parse, ImplAndTraitItems)
{
    auto items = parse_items(
        "impl Tr for S { const A: u32 = 1; type T = u8; m!(); }\n"
        "trait Tr { const A: u32; type T; }\n"
        "extern \"C\" { static X: u32; }\n"
        );
    ASSERT_EQ(items.size(), 3u);
    const auto& imp = items[0].data.as_Impl();
    ASSERT_TRUE(imp.trait_path.is_some());
    EXPECT_TRUE(imp.trait_path.unwrap() == "Tr");
    ASSERT_EQ(imp.items.size(), 3u);
    EXPECT_TRUE(imp.items[0].data.is_Const());
    EXPECT_TRUE(imp.items[1].data.is_Type());
    EXPECT_TRUE(imp.items[2].is_macro());

    const auto& tr = items[1].data.as_Trait();
    ASSERT_EQ(tr.items.size(), 2u);
    EXPECT_FALSE(tr.items[0].data.as_Const().value);
    EXPECT_FALSE(tr.items[1].data.as_Type().type);

    ASSERT_EQ(items[2].data.as_ForeignMod().items.size(), 1u);
    EXPECT_TRUE(items[2].data.as_ForeignMod().items[0].data.is_Static());
}

TEST(Parse, Exprs)
{
    EXPECT_EQ(to_str(*parse_expr("(1, \"a\", true)")), "(1, \"a\", true)");
    EXPECT_EQ(to_str(*parse_expr("[a::b, &mut c]")), "[a::b, &mut c]");
    EXPECT_EQ(to_str(*parse_expr("(x,)")), "(x,)");
    EXPECT_TRUE( dynamic_cast<const AST::ExprNode_Paren*>(parse_expr("(x)").get()) );
    auto m = parse_expr("vec![1, 2]");
    const auto* mac = dynamic_cast<const AST::ExprNode_Macro*>(m.get());
    ASSERT_TRUE(mac);
    EXPECT_EQ(mac->m_inv.delim(), AST::MacDelimiter::Bracket);
    EXPECT_EQ(mac->m_inv.input_tt().to_source(), "1, 2");
}

TEST(Parse, Stmts)
{
    auto frag = parse_fragment("let x: u32 = 1; ; a!(); b! { } c; d!()", AST::AstFragmentKind::Stmts);
    const auto& stmts = frag.as_Stmts();
    ASSERT_EQ(stmts.size(), 6u);
    EXPECT_TRUE(stmts[0].data.is_Local());
    EXPECT_TRUE(stmts[1].data.is_Empty());
    EXPECT_EQ(stmts[2].data.as_Macro().style, AST::MacStmtStyle::Semicolon);
    EXPECT_EQ(stmts[3].data.as_Macro().style, AST::MacStmtStyle::Braces);
    ASSERT_TRUE(stmts[4].data.is_Semi());
    EXPECT_EQ(to_str(*stmts[4].data.as_Semi().expr), "c");
    EXPECT_EQ(stmts[5].data.as_Macro().style, AST::MacStmtStyle::NoBraces);
}

TEST(Parse, TrailingTokensAreAnError)
{
    EXPECT_THROW(parse_fragment("1 2", AST::AstFragmentKind::Expr), ParseError::Base);
    EXPECT_THROW(parse_items("struct S"), ParseError::Base);
}

TEST(Attrs, MetaItemList)
{
    auto items = parse_items("#[foo(a, b = \"x\", c(d), 3)] struct S;");
    ASSERT_EQ(items.size(), 1u);
    const auto* a = items[0].attrs.get("foo");
    ASSERT_TRUE(a);
    auto list = a->meta_item_list();
    ASSERT_TRUE(list.is_some());
    const auto& l = list.unwrap();
    ASSERT_EQ(l.size(), 4u);
    EXPECT_TRUE(l[0].is_word());
    EXPECT_EQ(l[1].value_str().unwrap(), "x");
    EXPECT_TRUE(l[2].data.is_List());
    EXPECT_TRUE(l[3].data.is_Literal());
    EXPECT_TRUE(AST::list_contains_name(l, "a"));
    EXPECT_FALSE(AST::list_contains_name(l, "d"));
}

TEST(Attrs, ValueAndInnerTokens)
{
    auto items = parse_items("#[doc = \"text\"] #[bar(x y)] #[baz] struct S;");
    const auto& attrs = items[0].attrs;
    EXPECT_EQ(attrs.get("doc")->value_str().unwrap(), "text");
    EXPECT_TRUE(attrs.get("baz")->is_word());
    EXPECT_TRUE(attrs.get("bar")->value_str().is_none());
    EXPECT_EQ(attrs.get("bar")->inner_tokens().to_source(), "x y");
    EXPECT_TRUE(attrs.get("baz")->meta_item_list().is_none());
}

TEST(Attrs, BuiltinNames)
{
    EXPECT_TRUE(AST::is_builtin_attr_name("derive"));
    EXPECT_TRUE(AST::is_builtin_attr_name("repr"));
    EXPECT_FALSE(AST::is_builtin_attr_name("my_attr"));
}
