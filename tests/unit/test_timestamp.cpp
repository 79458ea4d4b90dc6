#include <gtest/gtest.h>

#include "util/timestamp.hpp"

#include <limits>
#include <string>

using namespace tfs::util;

TEST(TimestampTest, FormatsIsoUtc) {
    EXPECT_EQ(timestampToString(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(timestampToString(1700000000), "2023-11-14T22:13:20Z");
}

TEST(TimestampTest, OutOfRangeFallsBackToSeconds) {
    const auto huge = std::numeric_limits<std::time_t>::max();
    EXPECT_EQ(timestampToString(huge), std::to_string(huge));
}
