/**
 * @file test_result.cpp
 * @brief Unit tests for the Result<T> error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace kernel_orchestrator;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, ErrorCodeIsKept) {
    auto r = make_error<int>(ErrorCode::NotFound, "no such job");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(to_string(r.error().code), "not_found");
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> failure = Error{"fail"};
    EXPECT_THROW((void)failure.value(), std::runtime_error);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{"fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 4;
    auto half = [](int v) -> Result<int> {
        if (v % 2 != 0) return Error{ErrorCode::InvalidArgument, "odd"};
        return v / 2;
    };
    auto once = r.and_then(half);
    ASSERT_TRUE(once);
    EXPECT_EQ(*once, 2);
    auto twice = once.and_then(half).and_then(half);
    ASSERT_FALSE(twice);
    EXPECT_EQ(twice.error().code, ErrorCode::InvalidArgument);
}

TEST(ResultVoidTest, SuccessAndError) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    Result<void> bad = Error{ErrorCode::Unavailable, "stopped"};
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::Unavailable);
    EXPECT_THROW((void)ok.error(), std::runtime_error);
}
