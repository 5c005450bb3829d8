/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "cluster/cluster.hpp"
#include "core/result.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace kube_balance;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
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
    EXPECT_THROW((void)failure.value(), std::logic_error);
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

TEST(ResultTest, MapErrorTranslatesApiError) {
    ApiResult<int> r = ApiError{ApiError::Code::TooManyRequests, "slow down"};
    auto translated = r.map_error([](const ApiError& e) {
        return Error{std::string{to_string(e.code)} + ": " + e.message};
    });
    ASSERT_FALSE(translated.has_value());
    EXPECT_EQ(translated.error().message, "TooManyRequests: slow down");
}

TEST(ResultTest, VoidSuccessAndError) {
    Result<void> ok;
    Result<void> failed = Error{"nope"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "nope");
}

TEST(ApiErrorTest, Classification) {
    EXPECT_TRUE(ApiError(ApiError::Code::TooManyRequests, "").is_too_many_requests());
    EXPECT_TRUE(ApiError(ApiError::Code::NotFound, "").is_not_found());
    EXPECT_TRUE(ApiError(ApiError::Code::Cancelled, "").is_cancelled());
    EXPECT_FALSE(ApiError(ApiError::Code::Internal, "").is_too_many_requests());
}
