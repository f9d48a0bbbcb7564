/**
 * @file test_call_executor.cpp
 * @brief Unit tests for deadline-bounded runtime calls.
 */

#include "executor/call_executor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace node_agent;
using namespace std::chrono_literals;

namespace {

/// Sleeps in small steps until @p total elapses or @p stop fires.
bool cooperative_sleep(std::stop_token stop, Duration total) {
    const auto deadline = std::chrono::steady_clock::now() + total;
    while (std::chrono::steady_clock::now() < deadline) {
        if (stop.stop_requested()) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

}  // namespace

TEST(CallExecutorTest, ReturnsCallResult) {
    CallExecutor executor(2);
    auto result = executor.run_bounded(
        [](std::stop_token) -> Result<int> { return 7; }, 1000ms, {}, "RUNNING");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);
}

TEST(CallExecutorTest, PropagatesCallError) {
    CallExecutor executor(2);
    auto result = executor.run_bounded(
        [](std::stop_token) -> Result<void> { return Error{ErrorKind::Transient, "busy"}; },
        1000ms, {}, "CREATED");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Transient);
    EXPECT_EQ(result.error().message, "busy");
}

TEST(CallExecutorTest, TimeoutCancelsCall) {
    CallExecutor executor(2);
    std::atomic<bool> observed_stop{false};

    auto result = executor.run_bounded(
        [&observed_stop](std::stop_token stop) -> Result<void> {
            if (!cooperative_sleep(stop, 2000ms)) observed_stop = true;
            return {};
        },
        50ms, {}, "PULLED");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
    EXPECT_EQ(result.error().message, "could not transition to PULLED; timed out after 50ms");
    EXPECT_TRUE(result.error().retryable());

    for (int i = 0; i < 200 && !observed_stop; ++i) std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(observed_stop);
}

TEST(CallExecutorTest, NonPositiveTimeoutFailsWithoutRunning) {
    CallExecutor executor(1);
    std::atomic<bool> ran{false};
    auto result = executor.run_bounded(
        [&ran](std::stop_token) -> Result<void> {
            ran = true;
            return {};
        },
        0ms, {}, "MANIFEST_PULLED");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
    EXPECT_FALSE(ran);
}

TEST(CallExecutorTest, CallerStopCancelsWait) {
    CallExecutor executor(1);
    std::stop_source caller;

    std::jthread canceller([&caller] {
        std::this_thread::sleep_for(30ms);
        caller.request_stop();
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = executor.run_bounded(
        [](std::stop_token stop) -> Result<void> {
            cooperative_sleep(stop, 5000ms);
            return {};
        },
        5000ms, caller.get_token(), "RUNNING");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_FALSE(result.error().retryable());
    EXPECT_LT(elapsed, 2000ms);
}

TEST(CallExecutorTest, CallerStopWakesWaitImmediately) {
    CallExecutor executor(1);
    std::stop_source caller;
    std::atomic<bool> call_saw_stop{false};
    std::atomic<bool> release{false};
    std::atomic<bool> entered{false};

    std::chrono::steady_clock::time_point requested_at;
    std::jthread canceller([&] {
        while (!entered) std::this_thread::sleep_for(1ms);
        requested_at = std::chrono::steady_clock::now();
        caller.request_stop();
    });

    // The call ignores its token until released, so only the wait can end early.
    auto result = executor.run_bounded(
        [&](std::stop_token stop) -> Result<void> {
            entered = true;
            while (!release) std::this_thread::sleep_for(1ms);
            call_saw_stop = stop.stop_requested();
            return {};
        },
        10000ms, caller.get_token(), "CREATED");
    const auto returned_at = std::chrono::steady_clock::now();
    canceller.join();
    release = true;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_LT(returned_at - requested_at, 50ms);

    // Once released, the call observes that its own token was signalled.
    auto follow_up = executor.run_bounded(
        [](std::stop_token) -> Result<void> { return {}; }, 2000ms, {}, "RUNNING");
    EXPECT_TRUE(follow_up.has_value());
    EXPECT_TRUE(call_saw_stop.load());
}

TEST(CallExecutorTest, AlreadyCancelledCallerDoesNotRun) {
    CallExecutor executor(1);
    std::stop_source caller;
    caller.request_stop();
    std::atomic<bool> ran{false};
    auto result = executor.run_bounded(
        [&ran](std::stop_token) -> Result<void> {
            ran = true;
            return {};
        },
        1000ms, caller.get_token(), "STOPPED");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_FALSE(ran);
}

TEST(CallExecutorTest, ThreadCount) {
    CallExecutor executor(3);
    EXPECT_EQ(executor.thread_count(), 3u);
}

TEST(CallExecutorTest, TimeoutMessageFormat) {
    EXPECT_EQ(timeout_message("RUNNING", Duration{250}),
              "could not transition to RUNNING; timed out after 250ms");
}
