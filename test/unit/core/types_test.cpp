#include <gtest/gtest.h>
#include "geoinsight/core/types.h"
#include "geoinsight/core/call_options.h"

#include <chrono>
#include <memory>
#include <thread>

namespace geoinsight {
namespace core {
namespace {

TEST(DateTest, ParseStrictIso) {
    auto date = Date::Parse("2024-02-29");
    ASSERT_TRUE(date.ok()) << date.error();
    EXPECT_EQ(date.value().year(), 2024);
    EXPECT_EQ(date.value().month(), 2);
    EXPECT_EQ(date.value().day(), 29);
    EXPECT_EQ(date.value().to_string(), "2024-02-29");

    EXPECT_FALSE(Date::Parse("2023-02-29").ok());
    EXPECT_FALSE(Date::Parse("2024-13-01").ok());
    EXPECT_FALSE(Date::Parse("2024/01/01").ok());
    EXPECT_FALSE(Date::Parse("24-01-01").ok());
}

TEST(DateTest, Ordering) {
    Date a(2023, 12, 31);
    Date b(2024, 1, 1);
    EXPECT_LT(a, b);
    EXPECT_GT(b, a);
    EXPECT_NE(a, b);
    EXPECT_EQ(b.last_of_month(), Date(2024, 1, 31));
    EXPECT_EQ(Date(2024, 1, 17).first_of_month(), b);
}

TEST(DateTest, InvalidConstructionThrows) {
    EXPECT_THROW(Date(2024, 4, 31), InvalidArgumentError);
}

TEST(PeriodTest, YearMonthAndDayForms) {
    auto year = ParsePeriod("2024");
    ASSERT_TRUE(year.ok());
    EXPECT_EQ(year.value().from, Date(2024, 1, 1));
    EXPECT_EQ(year.value().to, Date(2024, 12, 31));

    auto month = ParsePeriod("2024-02");
    ASSERT_TRUE(month.ok());
    EXPECT_EQ(month.value().from, Date(2024, 2, 1));
    EXPECT_EQ(month.value().to, Date(2024, 2, 29));

    auto day = ParsePeriod("2024-03-15");
    ASSERT_TRUE(day.ok());
    EXPECT_EQ(day.value().from, day.value().to);
    EXPECT_TRUE(day.value().contains(Date(2024, 3, 15)));
}

TEST(PeriodTest, MalformedPeriodIsInvalidArgument) {
    for (const char* text : {"", "2024-1", "20244", "2024-00", "last month", "2024-02-30"}) {
        auto parsed = ParsePeriod(text);
        ASSERT_FALSE(parsed.ok()) << text;
        EXPECT_EQ(parsed.error_code(), Error::Code::INVALID_ARGUMENT) << text;
    }
}

TEST(PeriodTest, BoundsSnapToPeriodEdges) {
    auto bounds = ParsePeriodBounds("2023", "2024-06");
    ASSERT_TRUE(bounds.ok());
    EXPECT_EQ(*bounds.value().first, Date(2023, 1, 1));
    EXPECT_EQ(*bounds.value().second, Date(2024, 6, 30));

    auto open = ParsePeriodBounds("", "2024");
    ASSERT_TRUE(open.ok());
    EXPECT_FALSE(open.value().first.has_value());
    EXPECT_EQ(*open.value().second, Date(2024, 12, 31));
}

TEST(PeriodTest, SwappedBoundsAreReordered) {
    auto bounds = ParsePeriodBounds("2024-06", "2024-01");
    ASSERT_TRUE(bounds.ok());
    EXPECT_EQ(*bounds.value().first, Date(2024, 1, 1));
    EXPECT_EQ(*bounds.value().second, Date(2024, 6, 30));
}

TEST(NamesTest, LevelAliases) {
    EXPECT_EQ(ParseLevel("norm"), Level::FINEST);
    EXPECT_EQ(ParseLevel("EMD"), Level::FINEST);
    EXPECT_EQ(ParseLevel("sig"), Level::INTERMEDIATE);
    EXPECT_EQ(ParseLevel("sido"), Level::COARSEST);
    EXPECT_FALSE(ParseLevel("street").has_value());
    EXPECT_STREQ(LevelName(Level::COARSEST), "coarsest");
}

TEST(NamesTest, MetricAndDomainAliases) {
    EXPECT_EQ(ParseMetric("activity_volume"), Metric::FOOT_TRAFFIC);
    EXPECT_EQ(ParseMetric("sales"), Metric::SALES);
    EXPECT_FALSE(ParseMetric("population").has_value());
    EXPECT_EQ(DomainMetric("population"), Metric::FOOT_TRAFFIC);
    EXPECT_EQ(DomainMetric("sales"), Metric::SALES);
    EXPECT_FALSE(DomainMetric("weather").has_value());
}

TEST(TimestampTest, FormatsIsoUtc) {
    EXPECT_EQ(FormatTimestamp(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(FormatTimestamp(1704067200123), "2024-01-01T00:00:00.123Z");
}

TEST(CallOptionsTest, BoundedByKeepsEarlierDeadline) {
    auto options = CallOptions::WithTimeout(std::chrono::milliseconds(10));
    auto bounded = options.bounded_by(std::chrono::hours(1));
    EXPECT_EQ(bounded.deadline, options.deadline);

    CallOptions unbounded;
    EXPECT_TRUE(unbounded.bounded_by(std::chrono::milliseconds(5)).deadline.has_value());
}

TEST(CallOptionsTest, CheckReportsCancellationAndExpiry) {
    CallOptions options;
    options.cancellation = std::make_shared<CancellationToken>();
    EXPECT_TRUE(options.check("op").ok());

    options.cancellation->cancel();
    auto cancelled = options.check("op");
    ASSERT_FALSE(cancelled.ok());
    EXPECT_EQ(cancelled.error_code(), Error::Code::CANCELLED);

    auto expired = CallOptions::WithTimeout(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto timeout = expired.check("op");
    ASSERT_FALSE(timeout.ok());
    EXPECT_EQ(timeout.error_code(), Error::Code::TIMEOUT);
    EXPECT_TRUE(timeout.error_detail().retryable());
}

} // namespace
} // namespace core
} // namespace geoinsight
