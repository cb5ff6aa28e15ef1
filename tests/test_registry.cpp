/*
 * synext - Syntax extension expansion core
 *
 * tests/test_registry.cpp
 * - Error code registry
 */
#include "test_common.hpp"

using Diagnostics::ErrorRegistry;

TEST(ErrorRegistry, RegisterOnce)
{
    ErrorRegistry   reg;
    EXPECT_TRUE(reg.register_code("E0001", rust::Some<::std::string>("\nfirst\n")));
    EXPECT_FALSE(reg.register_code("E0001", rust::Some<::std::string>("\nsecond\n")));
    EXPECT_EQ(reg.size(), 1u);
    // The original entry is kept
    EXPECT_EQ(reg.get("E0001").unwrap().description.unwrap(), "\nfirst\n");
    EXPECT_TRUE(reg.is_registered("E0001"));
    EXPECT_FALSE(reg.is_registered("E0002"));
    EXPECT_TRUE(reg.get("E0002").is_none());
}

TEST(ErrorRegistry, RenderIsSortedAndSkipsUndescribed)
{
    ErrorRegistry   reg;
    reg.register_code("E0003", rust::Some<::std::string>("\nthree\n"));
    reg.register_code("E0001", rust::Some<::std::string>("\none\n"));
    reg.register_code("E0002", rust::None<::std::string>());

    auto r = reg.render();
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r[0].first, "E0001");
    EXPECT_EQ(r[0].second, "\none\n");
    EXPECT_EQ(r[1].first, "E0003");
}

TEST(ErrorRegistry, MarkUsed)
{
    ErrorRegistry   reg;
    reg.register_code("E0001", rust::None<::std::string>());

    auto first = test_span(1, 0);
    auto again = test_span(1, 0);
    auto other = test_span(5, 3);

    EXPECT_EQ(reg.mark_used("E0001", first).kind, ErrorRegistry::UseResult::Kind::First);
    EXPECT_TRUE(reg.get("E0001").unwrap().use_site.is_some());
    // Same location (a distinct span object) is not a reuse
    EXPECT_EQ(reg.mark_used("E0001", again).kind, ErrorRegistry::UseResult::Kind::Repeat);

    auto res = reg.mark_used("E0001", other);
    EXPECT_EQ(res.kind, ErrorRegistry::UseResult::Kind::Reused);
    EXPECT_TRUE(res.previous.same_location(first));

    EXPECT_EQ(reg.mark_used("E9999", other).kind, ErrorRegistry::UseResult::Kind::Unregistered);
}

TEST(ErrorRegistry, DescriptionChecks)
{
    EXPECT_TRUE(ErrorRegistry::check_description("E0001", "\nfine\n").empty());

    auto no_newlines = ErrorRegistry::check_description("E0001", "text");
    ASSERT_EQ(no_newlines.size(), 1u);
    EXPECT_NE(no_newlines[0].find("doesn't start and end with a newline"), ::std::string::npos);

    ::std::string   long_line(81, 'x');
    auto too_long = ErrorRegistry::check_description("E0002", "\n" + long_line + "\n");
    ASSERT_EQ(too_long.size(), 1u);
    EXPECT_NE(too_long[0].find("longer than 80 characters"), ::std::string::npos);

    // Exactly 80 is accepted
    EXPECT_TRUE(ErrorRegistry::check_description("E0003", "\n" + ::std::string(80, 'y') + "\n").empty());

    // Footnote links may be long
    auto footnote = "[link]: https://example.com/" + ::std::string(100, 'z');
    EXPECT_TRUE(ErrorRegistry::check_description("E0004", "\n" + footnote + "\n").empty());
}

TEST(ErrorRegistry, WidthCountsCharacters)
{
    // 80 two-byte characters are 80 columns wide
    ::std::string   line;
    for(int i = 0; i < 80; i ++)
        line += "\xC3\xA9";
    EXPECT_TRUE(ErrorRegistry::check_description("E0005", "\n" + line + "\n").empty());
}

TEST(ErrorRegistry, UrlFootnotes)
{
    EXPECT_TRUE(ErrorRegistry::is_url_footnote("[a]: http://x"));
    EXPECT_TRUE(ErrorRegistry::is_url_footnote("[rfc]:   https://x"));
    EXPECT_FALSE(ErrorRegistry::is_url_footnote("[a] http://x"));
    EXPECT_FALSE(ErrorRegistry::is_url_footnote("see http://x"));
    EXPECT_FALSE(ErrorRegistry::is_url_footnote("[a]: ftp://x"));
}
