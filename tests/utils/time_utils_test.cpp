/**
 * @file time_utils_test.cpp
 * @brief Unit tests for RFC 3339 timestamps
 */

#include "utils/time_utils.h"

#include <gtest/gtest.h>

using namespace memex::utils;

TEST(TimeUtilsTest, FormatKeepsNanoseconds) {
  Timestamp timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(1) +
                                                                      std::chrono::nanoseconds(5)));
  EXPECT_EQ(FormatTimestamp(timestamp), "1970-01-01T00:00:01.000000005Z");
}

TEST(TimeUtilsTest, FormatKnownDate) {
  Timestamp timestamp(std::chrono::seconds(1714558830));  // 2024-05-01T10:20:30Z
  EXPECT_EQ(FormatTimestamp(timestamp), "2024-05-01T10:20:30.000000000Z");
  EXPECT_EQ(ToUnixSeconds(timestamp), 1714558830);
}

TEST(TimeUtilsTest, ParseFormattedValue) {
  auto now = std::chrono::system_clock::now();
  auto parsed = ParseTimestamp(FormatTimestamp(now));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, now);
}

TEST(TimeUtilsTest, ParseOffsets) {
  auto utc = ParseTimestamp("2024-05-01T08:20:30Z");
  auto plus_two = ParseTimestamp("2024-05-01T10:20:30+02:00");
  auto minus_one = ParseTimestamp("2024-05-01T07:20:30-01:00");
  ASSERT_TRUE(utc.has_value());
  ASSERT_TRUE(plus_two.has_value());
  ASSERT_TRUE(minus_one.has_value());
  EXPECT_EQ(*utc, *plus_two);
  EXPECT_EQ(*utc, *minus_one);
}

TEST(TimeUtilsTest, ParseShortFraction) {
  auto parsed = ParseTimestamp("1970-01-01T00:00:00.5Z");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->time_since_epoch(),
            std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(500)));
}

TEST(TimeUtilsTest, ParseRejectsMalformed) {
  EXPECT_FALSE(ParseTimestamp("").has_value());
  EXPECT_FALSE(ParseTimestamp("2024-05-01").has_value());
  EXPECT_FALSE(ParseTimestamp("2024-05-01T10:20:30").has_value());  // no zone
  EXPECT_FALSE(ParseTimestamp("2024-05-01T10:20:30.Z").has_value());
  EXPECT_FALSE(ParseTimestamp("2024/05/01T10:20:30Z").has_value());
  EXPECT_FALSE(ParseTimestamp("2024-05-01T10:20:30Zjunk").has_value());
}
