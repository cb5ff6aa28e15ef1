/*
 * synext - Syntax extension expansion core
 *
 * tests/test_handler.cpp
 * - Diagnostic handler and builders
 */
#include "test_common.hpp"

namespace {
    struct HandlerTest:
        public ::testing::Test
    {
        CapturingEmitter*   emitter;
        Diagnostics::Handler    handler;

        HandlerTest():
            emitter(new CapturingEmitter()),
            handler(::std::unique_ptr<Diagnostics::Emitter>(emitter))
        {}
    };
}

TEST_F(HandlerTest, CountsByLevel)
{
    handler.span_warn(test_span(1, 0), "w");
    handler.span_err(test_span(2, 0), "e1");
    handler.span_err_with_code(test_span(3, 0), "e2", "E0001");
    handler.span_note(test_span(4, 0), "n");
    handler.note("unspanned");

    EXPECT_EQ(handler.err_count(), 2u);
    EXPECT_EQ(handler.warn_count(), 1u);
    EXPECT_TRUE(handler.has_errors());
    ASSERT_EQ(emitter->diags.size(), 5u);
    EXPECT_EQ(emitter->diags[2].code, "E0001");
    EXPECT_FALSE(emitter->diags[4].span);
}

TEST_F(HandlerTest, BuilderEmitsOnce)
{
    {
        auto db = handler.struct_span_err(test_span(1, 0), "main");
        db.span_note(test_span(2, 0), "here").note("unspanned note").help("try this");
        db.emit();
        db.emit();
    }
    ASSERT_EQ(emitter->diags.size(), 1u);
    const auto& d = emitter->diags[0];
    EXPECT_EQ(d.message, "main");
    ASSERT_EQ(d.children.size(), 3u);
    EXPECT_EQ(d.children[0].level, Diagnostics::Level::Note);
    EXPECT_TRUE(d.children[0].span);
    EXPECT_FALSE(d.children[1].span);
    EXPECT_EQ(d.children[2].level, Diagnostics::Level::Help);
}

TEST_F(HandlerTest, BuilderEmitsOnDrop)
{
    {
        auto db = handler.struct_span_warn(test_span(1, 0), "dropped");
    }
    EXPECT_EQ(handler.warn_count(), 1u);
    EXPECT_TRUE(emitter->has_warning("dropped"));
}

TEST_F(HandlerTest, CancelledBuilderIsSilent)
{
    {
        auto db = handler.struct_span_err(test_span(1, 0), "cancelled");
        db.cancel();
    }
    EXPECT_EQ(handler.err_count(), 0u);
    EXPECT_TRUE(emitter->diags.empty());
}

TEST_F(HandlerTest, MovedBuilderEmitsOnce)
{
    {
        auto db = handler.struct_span_err(test_span(1, 0), "moved");
        auto db2 = mv$(db);
    }
    EXPECT_EQ(handler.err_count(), 1u);
}

TEST_F(HandlerTest, FatalAndBugUnwind)
{
    EXPECT_THROW(handler.span_fatal(test_span(1, 0), "fatal"), CompileError::Fatal);
    EXPECT_THROW(handler.span_bug(test_span(1, 0), "bug"), CompileError::BugCheck);
    EXPECT_THROW(handler.span_unimpl(test_span(1, 0), "thing"), CompileError::Todo);
    EXPECT_EQ(handler.err_count(), 3u);
    EXPECT_EQ(emitter->count(Diagnostics::Level::Bug, "unimplemented thing"), 1u);
}

TEST_F(HandlerTest, AbortIfErrors)
{
    EXPECT_NO_THROW(handler.abort_if_errors());
    handler.span_warn(test_span(1, 0), "only a warning");
    EXPECT_NO_THROW(handler.abort_if_errors());
    handler.span_err(test_span(1, 0), "an error");
    EXPECT_THROW(handler.abort_if_errors(), CompileError::Fatal);
}
