#include "fastdocx/utils/Logger.hpp"
#include "fastdocx/utils/TimeUtils.hpp"

#include <gtest/gtest.h>

namespace fastdocx {
namespace utils {

class TimeUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastdocx::Logger::getInstance().initialize("logs/TimeUtils_test.log",
                                                   fastdocx::Logger::Level::DEBUG,
                                                   false);
    }

    void TearDown() override {
        fastdocx::Logger::getInstance().shutdown();
    }
};

TEST_F(TimeUtilsTest, FormatsW3CDTF) {
    std::tm time{};
    time.tm_year = 2024 - 1900;
    time.tm_mon = 0;
    time.tm_mday = 5;
    time.tm_hour = 9;
    time.tm_min = 3;
    time.tm_sec = 7;
    EXPECT_EQ(TimeUtils::formatW3CDTF(time), "2024-01-05T09:03:07Z");
}

TEST_F(TimeUtilsTest, ParsesReducedPrecisionForms) {
    auto year = TimeUtils::parseW3CDTF("2013");
    ASSERT_TRUE(year.has_value());
    EXPECT_EQ(year->tm_year, 113);
    EXPECT_EQ(year->tm_mon, 0);
    EXPECT_EQ(year->tm_mday, 1);

    auto month = TimeUtils::parseW3CDTF("2013-06");
    ASSERT_TRUE(month.has_value());
    EXPECT_EQ(month->tm_mon, 5);

    auto day = TimeUtils::parseW3CDTF("2013-06-15");
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(day->tm_mday, 15);
}

TEST_F(TimeUtilsTest, OffsetIsConvertedToUTC) {
    auto time = TimeUtils::parseW3CDTF("2013-06-15T23:30:00+02:00");
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(TimeUtils::formatW3CDTF(*time), "2013-06-15T21:30:00Z");

    auto behind = TimeUtils::parseW3CDTF("2013-06-15T23:30:00-01:00");
    ASSERT_TRUE(behind.has_value());
    EXPECT_EQ(TimeUtils::formatW3CDTF(*behind), "2013-06-16T00:30:00Z");
}

TEST_F(TimeUtilsTest, FractionalSecondsAccepted) {
    EXPECT_TRUE(TimeUtils::isValidW3CDTF("2013-06-15T10:00:00.123Z"));
    EXPECT_TRUE(TimeUtils::isValidW3CDTF("2013-06-15T10:00Z"));
}

TEST_F(TimeUtilsTest, RejectsMalformedValues) {
    EXPECT_FALSE(TimeUtils::isValidW3CDTF(""));
    EXPECT_FALSE(TimeUtils::isValidW3CDTF("yesterday"));
    EXPECT_FALSE(TimeUtils::isValidW3CDTF("2013-13-01"));
    EXPECT_FALSE(TimeUtils::isValidW3CDTF("2013-06-15T10:00:00"));   // 缺少时区
    EXPECT_FALSE(TimeUtils::isValidW3CDTF("2013-06-15 10:00:00Z"));
    EXPECT_FALSE(TimeUtils::isValidW3CDTF("2013-06-15T25:00:00Z"));
}

TEST_F(TimeUtilsTest, NowRoundTrips) {
    std::string now = TimeUtils::nowW3CDTF();
    auto parsed = TimeUtils::parseW3CDTF(now);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(TimeUtils::formatW3CDTF(*parsed), now);
}

}} // namespace fastdocx::utils
