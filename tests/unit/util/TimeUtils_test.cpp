#include "gtest/gtest.h"
#include "core/util/TimeUtils.h"

namespace planrunner::core::util {

TEST(TimeUtilsTest, FormatsMillisecondUtc) {
    auto epoch = std::chrono::system_clock::from_time_t(0) + std::chrono::milliseconds(1234);
    EXPECT_EQ(TimeUtils::toIso8601(epoch), "1970-01-01T00:00:01.234Z");
}

TEST(TimeUtilsTest, ParseInvertsFormat) {
    auto parsed = TimeUtils::parseIso8601("2026-01-02T03:04:05.678Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(TimeUtils::toIso8601(*parsed), "2026-01-02T03:04:05.678Z");
}

TEST(TimeUtilsTest, ParseAcceptsMissingFraction) {
    auto parsed = TimeUtils::parseIso8601("2026-01-02T03:04:05Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(TimeUtils::toIso8601(*parsed), "2026-01-02T03:04:05.000Z");
}

TEST(TimeUtilsTest, ParseRejectsGarbage) {
    EXPECT_FALSE(TimeUtils::parseIso8601("").has_value());
    EXPECT_FALSE(TimeUtils::parseIso8601("yesterday").has_value());
    EXPECT_FALSE(TimeUtils::parseIso8601("2026-01-02T03:04:05+02:00").has_value());
}

TEST(TimeUtilsTest, NowSortsAfterOlderTimestamps) {
    EXPECT_GT(TimeUtils::nowIso8601(), std::string("2020-01-01T00:00:00.000Z"));
}

} // namespace planrunner::core::util
