#include <gtest/gtest.h>
#include <stdexcept>
#include "utils/timestamp.hpp"

using namespace pastebox::utils;
using namespace std::chrono;

TEST(TimestampTest, FormatsEpoch) {
  EXPECT_EQ(format_timestamp(TimePoint{}), "1970-01-01 00:00:00");
}

TEST(TimestampTest, FormatsUtcAndDropsFraction) {
  TimePoint time = TimePoint{} + seconds(1700000000) + milliseconds(999);
  EXPECT_EQ(format_timestamp(time), "2023-11-14 22:13:20");
}

TEST(TimestampTest, ParsesFormattedValueExactly) {
  TimePoint time = TimePoint{} + seconds(1700000000);
  EXPECT_EQ(parse_timestamp("2023-11-14 22:13:20"), time);
  EXPECT_EQ(parse_timestamp(format_timestamp(time)), time);
}

TEST(TimestampTest, RejectsMalformedValues) {
  EXPECT_THROW(parse_timestamp(""), std::invalid_argument);
  EXPECT_THROW(parse_timestamp("2023-11-14T22:13:20"), std::invalid_argument);
  EXPECT_THROW(parse_timestamp("2023-11-14 22:13"), std::invalid_argument);
  EXPECT_THROW(parse_timestamp("2023-11-14 22:13:20Z"), std::invalid_argument);
  EXPECT_THROW(parse_timestamp("not a timestamp"), std::invalid_argument);
}

TEST(TimestampTest, RoundsHalfUp) {
  TimePoint base = TimePoint{} + seconds(1000);
  EXPECT_EQ(round_to_seconds(base), base);
  EXPECT_EQ(round_to_seconds(base + milliseconds(499)), base);
  EXPECT_EQ(round_to_seconds(base + milliseconds(500)), base + seconds(1));
  EXPECT_EQ(round_to_seconds(base + milliseconds(999)), base + seconds(1));
}
