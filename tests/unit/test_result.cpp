/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace node_agent;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().kind, ErrorKind::Internal);
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{ErrorKind::Terminal, "boom"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnErrorKeepsKind) {
    Result<int> r = Error{ErrorKind::Timeout, "slow"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().kind, ErrorKind::Timeout);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 4;
    auto halved = r.and_then([](int v) -> Result<int> {
        if (v % 2 != 0) return Error{ErrorKind::Configuration, "odd"};
        return v / 2;
    });
    ASSERT_TRUE(halved.has_value());
    EXPECT_EQ(*halved, 2);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{ErrorKind::NotFound, "missing"};
    EXPECT_TRUE(ok.has_value());
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, ErrorKind::NotFound);
    EXPECT_THROW((void)ok.error(), std::runtime_error);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<std::string>(ErrorKind::Cancelled, "stopped");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Cancelled);
}

TEST(ErrorKindTest, OnlyTransientAndTimeoutRetry) {
    EXPECT_TRUE(Error(ErrorKind::Transient, "").retryable());
    EXPECT_TRUE(Error(ErrorKind::Timeout, "").retryable());
    EXPECT_FALSE(Error(ErrorKind::Terminal, "").retryable());
    EXPECT_FALSE(Error(ErrorKind::Configuration, "").retryable());
    EXPECT_FALSE(Error(ErrorKind::Cancelled, "").retryable());
    EXPECT_FALSE(Error(ErrorKind::ShouldNotSend, "").retryable());
}

TEST(ErrorKindTest, Names) {
    EXPECT_EQ(to_string(ErrorKind::ShouldNotSend), "should_not_send");
    EXPECT_EQ(to_string(ErrorKind::NotFound), "not_found");
}
