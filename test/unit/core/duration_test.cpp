#include <gtest/gtest.h>
#include "querygen/core/duration.h"

namespace querygen {
namespace core {
namespace {

Duration Parse(const std::string& text) {
    auto result = ParseDuration(text);
    EXPECT_TRUE(result.ok()) << text << ": " << (result.ok() ? "" : result.error());
    return result.ok() ? result.value() : Duration(-1);
}

TEST(DurationTest, SimpleUnits) {
    EXPECT_EQ(Parse("300ms"), Duration(300));
    EXPECT_EQ(Parse("45s"), std::chrono::seconds(45));
    EXPECT_EQ(Parse("10m"), std::chrono::minutes(10));
    EXPECT_EQ(Parse("2h"), std::chrono::hours(2));
}

TEST(DurationTest, CompoundAndFractional) {
    EXPECT_EQ(Parse("1m30s"), std::chrono::seconds(90));
    EXPECT_EQ(Parse("1h5m"), std::chrono::minutes(65));
    EXPECT_EQ(Parse("1.5s"), Duration(1500));
    EXPECT_EQ(Parse("1.5h"), std::chrono::minutes(90));
}

TEST(DurationTest, SubMillisecondUnitsTruncate) {
    EXPECT_EQ(Parse("2500us"), Duration(2));
    EXPECT_EQ(Parse("999999ns"), Duration(0));
    EXPECT_EQ(Parse("3000\xC2\xB5s"), Duration(3));
}

TEST(DurationTest, ZeroAndSign) {
    EXPECT_EQ(Parse("0"), Duration(0));
    EXPECT_EQ(Parse("0s"), Duration(0));
    EXPECT_EQ(Parse("-2s"), Duration(-2000));
    EXPECT_EQ(Parse("+2s"), Duration(2000));
}

TEST(DurationTest, RejectsMalformedInput) {
    EXPECT_FALSE(ParseDuration("").ok());
    EXPECT_FALSE(ParseDuration("10").ok());
    EXPECT_FALSE(ParseDuration("s").ok());
    EXPECT_FALSE(ParseDuration("5d").ok());
    EXPECT_FALSE(ParseDuration("1..5s").ok());
    EXPECT_FALSE(ParseDuration("-").ok());

    auto result = ParseDuration("5x");
    ASSERT_FALSE(result.ok());
    EXPECT_NE(result.error().find("unknown unit"), std::string::npos);
}

TEST(DurationTest, Format) {
    EXPECT_EQ(FormatDuration(Duration(0)), "0s");
    EXPECT_EQ(FormatDuration(Duration(250)), "250ms");
    EXPECT_EQ(FormatDuration(Duration(1500)), "1.5s");
    EXPECT_EQ(FormatDuration(std::chrono::minutes(65)), "1h5m");
    EXPECT_EQ(FormatDuration(std::chrono::seconds(90)), "1m30s");
    EXPECT_EQ(FormatDuration(Duration(-2000)), "-2s");
}

} // namespace
} // namespace core
} // namespace querygen
