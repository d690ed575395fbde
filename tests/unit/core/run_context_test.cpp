#include <gtest/gtest.h>
#include <evalforge/core/run_context.h>

#include <thread>

using namespace evalforge;
using namespace std::chrono_literals;

TEST(RunContextTest, BackgroundNeverStops) {
    auto ctx = RunContext::background();
    EXPECT_FALSE(ctx.cancelled());
    EXPECT_FALSE(ctx.expired());
    EXPECT_FALSE(ctx.remaining().has_value());
    EXPECT_TRUE(ctx.checkpoint("stage").has_value());
}

TEST(RunContextTest, StopRequestCancels) {
    std::stop_source source;
    RunContext ctx{source.get_token()};
    ASSERT_TRUE(ctx.checkpoint("analyze").has_value());

    source.request_stop();
    EXPECT_TRUE(ctx.cancelled());
    auto r = ctx.checkpoint("analyze");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
    EXPECT_NE(r.error().message.find("analyze"), std::string::npos);
}

TEST(RunContextTest, DeadlineExpires) {
    auto ctx = RunContext::background().withTimeout(1ms);
    std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(ctx.expired());
    auto r = ctx.checkpoint("execute");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_EQ(ctx.remaining().value(), 0ms);
}

TEST(RunContextTest, ChildTimeoutNeverExtendsParent) {
    auto parent = RunContext::background().withTimeout(50ms);
    auto child = parent.withTimeout(10s);
    ASSERT_TRUE(parent.deadline().has_value());
    ASSERT_TRUE(child.deadline().has_value());
    EXPECT_EQ(*child.deadline(), *parent.deadline());

    auto tighter = parent.withTimeout(1ms);
    EXPECT_LT(*tighter.deadline(), *parent.deadline());
}

TEST(RunContextTest, ChildSharesStopToken) {
    std::stop_source source;
    RunContext parent{source.get_token()};
    auto child = parent.withTimeout(1s);
    source.request_stop();
    EXPECT_TRUE(child.cancelled());
}

TEST(RunContextTest, ZeroTimeoutKeepsParent) {
    auto parent = RunContext::background();
    auto child = parent.withTimeout(0ms);
    EXPECT_FALSE(child.deadline().has_value());
}
