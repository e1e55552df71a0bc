#include <gtest/gtest.h>

#include "infra/duration/duration.hpp"

using namespace std::chrono_literals;
using objcp::infra::AgeFilter;
using objcp::infra::ErrorCode;
using objcp::infra::parse_duration;

TEST(DurationTest, ParsesCombinedUnits)
{
    auto parsed = parse_duration("7d10h31s");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, std::chrono::days(7) + 10h + 31s);
}

TEST(DurationTest, ParsesWeeksAndMinutes)
{
    EXPECT_EQ(parse_duration("1w").value(), std::chrono::weeks(1));
    EXPECT_EQ(parse_duration("90m").value(), 90min);
    EXPECT_EQ(parse_duration("2H").value(), 2h);
}

TEST(DurationTest, RejectsMalformedInput)
{
    for (auto text : {"", "7", "d", "7x", "1d-2h", "abc"}) {
        auto parsed = parse_duration(text);
        ASSERT_FALSE(parsed.has_value()) << text;
        EXPECT_EQ(parsed.error().code, ErrorCode::InvalidDuration) << text;
    }
}

TEST(AgeFilterTest, EmptyFilterKeepsEverything)
{
    auto filter = AgeFilter::create("", "");
    ASSERT_TRUE(filter.has_value());
    EXPECT_FALSE(filter->active());

    const auto now = std::chrono::system_clock::now();
    EXPECT_FALSE(filter->skip(now, now));
    EXPECT_FALSE(filter->skip(now - std::chrono::days(400), now));
}

TEST(AgeFilterTest, OlderThanSkipsYoungObjects)
{
    auto filter = AgeFilter::create("1d", "");
    ASSERT_TRUE(filter.has_value());

    const auto now = std::chrono::system_clock::now();
    EXPECT_TRUE(filter->skip(now - 1h, now));
    EXPECT_FALSE(filter->skip(now - std::chrono::days(2), now));
}

TEST(AgeFilterTest, NewerThanSkipsOldObjects)
{
    auto filter = AgeFilter::create("", "1d");
    ASSERT_TRUE(filter.has_value());

    const auto now = std::chrono::system_clock::now();
    EXPECT_FALSE(filter->skip(now - 1h, now));
    EXPECT_TRUE(filter->skip(now - std::chrono::days(2), now));
}

// Чем старше объект, тем меньше шансов быть отброшенным --older-than
TEST(AgeFilterTest, OlderThanIsMonotonic)
{
    auto filter = AgeFilter::create("3h", "");
    ASSERT_TRUE(filter.has_value());

    const auto now = std::chrono::system_clock::now();
    bool kept = false;
    for (int hours = 0; hours < 10; ++hours) {
        const bool skipped = filter->skip(now - std::chrono::hours(hours), now);
        if (kept) {
            EXPECT_FALSE(skipped) << hours;
        }
        kept = kept || !skipped;
    }
    EXPECT_TRUE(kept);
}

TEST(AgeFilterTest, InvalidDurationIsReported)
{
    auto filter = AgeFilter::create("ten days", "");
    ASSERT_FALSE(filter.has_value());
    EXPECT_EQ(filter.error().code, ErrorCode::InvalidDuration);
}
