/**
 * @file test_time_format.cpp
 * @brief Unit tests for RFC 3339 formatting and parsing.
 */

#include "core/time_format.hpp"

#include <gtest/gtest.h>

using namespace kube_balance;
using namespace std::chrono;

namespace {

Timestamp at(year_month_day ymd, hours h, minutes m, seconds s) {
    return Timestamp{sys_days{ymd} + h + m + s};
}

}  // namespace

TEST(TimeFormatTest, FormatsUtcWholeSeconds) {
    auto ts = at(2024y / March / 15, hours{10}, minutes{5}, seconds{7});
    EXPECT_EQ(format_rfc3339(ts), "2024-03-15T10:05:07Z");
    EXPECT_EQ(format_rfc3339(ts + milliseconds{999}), "2024-03-15T10:05:07Z");
}

TEST(TimeFormatTest, ParsesZulu) {
    auto parsed = parse_rfc3339("2024-03-15T10:05:07Z");
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(*parsed, at(2024y / March / 15, hours{10}, minutes{5}, seconds{7}));
}

TEST(TimeFormatTest, ParsesNumericOffset) {
    auto plus = parse_rfc3339("2024-03-15T12:05:07+02:00");
    auto minus = parse_rfc3339("2024-03-15T05:35:07-04:30");
    ASSERT_TRUE(plus.has_value());
    ASSERT_TRUE(minus.has_value());
    auto expected = at(2024y / March / 15, hours{10}, minutes{5}, seconds{7});
    EXPECT_EQ(*plus, expected);
    EXPECT_EQ(*minus, expected);
}

TEST(TimeFormatTest, ParsesFractionalSeconds) {
    auto parsed = parse_rfc3339("2024-03-15T10:05:07.5Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, at(2024y / March / 15, hours{10}, minutes{5}, seconds{7}) + milliseconds{500});
}

TEST(TimeFormatTest, FormatThenParseIsStable) {
    auto ts = at(2031y / December / 31, hours{23}, minutes{59}, seconds{59});
    auto parsed = parse_rfc3339(format_rfc3339(ts));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, ts);
}

TEST(TimeFormatTest, RejectsMalformedInput) {
    EXPECT_FALSE(parse_rfc3339("").has_value());
    EXPECT_FALSE(parse_rfc3339("not-a-time").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-03-15 10:05:07Z").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-03-15T10:05:07").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-02-30T00:00:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-03-15T25:00:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-03-15T10:05:07Zjunk").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-03-15T10:05:07.Z").has_value());
}
