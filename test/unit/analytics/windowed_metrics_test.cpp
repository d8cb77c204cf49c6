#include <gtest/gtest.h>
#include "geoinsight/analytics/windowed_metrics.h"

#include <cmath>

#include "test_util/directory.h"
#include "test_util/facts.h"

namespace geoinsight {
namespace analytics {
namespace test {
namespace {

AggregatedRow Row(const std::string& label, const core::Date& date,
                  core::OptionalValue foot_traffic, core::OptionalValue sales = std::nullopt) {
    AggregatedRow row;
    row.label = label;
    row.date = date;
    row.foot_traffic = foot_traffic;
    row.sales = sales;
    return row;
}

} // namespace

class WindowedMetricsTest : public ::testing::Test {
protected:
    WindowedMetricsEngine engine_;
};

TEST_F(WindowedMetricsTest, MonthOverMonthAndYearOverYear) {
    std::vector<AggregatedRow> rows;
    for (int i = 0; i < 13; ++i) {
        rows.push_back(Row("A", core::Date(2023 + i / 12, i % 12 + 1, 1), 100.0 * (i + 1)));
    }
    auto out = engine_.compute(core::Level::INTERMEDIATE, rows);
    ASSERT_EQ(out.size(), 13u);

    const MetricWindow& first = out.front().foot_traffic;
    EXPECT_FALSE(first.prior.has_value());
    EXPECT_FALSE(first.prior_delta.has_value());
    EXPECT_FALSE(first.prior_year.has_value());

    const MetricWindow& last = out.back().foot_traffic;
    EXPECT_EQ(out.back().date, core::Date(2024, 1, 1));
    EXPECT_DOUBLE_EQ(*last.prior, 1200.0);
    EXPECT_DOUBLE_EQ(*last.prior_delta, 100.0 / 1200.0);
    EXPECT_DOUBLE_EQ(*last.prior_year, 100.0);
    EXPECT_DOUBLE_EQ(*last.prior_year_delta, 12.0);

    // Eleven rows back is still short of a year.
    EXPECT_FALSE(out[11].foot_traffic.prior_year.has_value());
}

TEST_F(WindowedMetricsTest, LagsArePositionalAcrossGaps) {
    auto out = engine_.compute(core::Level::INTERMEDIATE,
                               {Row("A", core::Date(2024, 1, 1), 100.0),
                                Row("A", core::Date(2024, 3, 1), 150.0)});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(*out[1].foot_traffic.prior, 100.0);
    EXPECT_DOUBLE_EQ(*out[1].foot_traffic.prior_delta, 0.5);
}

TEST_F(WindowedMetricsTest, ZeroOrAbsentBaseLeavesDeltaAbsent) {
    auto out = engine_.compute(core::Level::INTERMEDIATE,
                               {Row("A", core::Date(2024, 1, 1), 0.0, std::nullopt),
                                Row("A", core::Date(2024, 2, 1), 50.0, 10.0)});
    EXPECT_DOUBLE_EQ(*out[1].foot_traffic.prior, 0.0);
    EXPECT_FALSE(out[1].foot_traffic.prior_delta.has_value());
    EXPECT_FALSE(out[1].sales.prior.has_value());
    EXPECT_FALSE(out[1].sales.prior_delta.has_value());
}

TEST_F(WindowedMetricsTest, SeriesStatisticsAndZScore) {
    auto out = engine_.compute(core::Level::INTERMEDIATE,
                               {Row("A", core::Date(2024, 1, 1), 1.0),
                                Row("A", core::Date(2024, 2, 1), 2.0),
                                Row("A", core::Date(2024, 3, 1), 3.0),
                                Row("A", core::Date(2024, 4, 1), std::nullopt)});
    ASSERT_EQ(out.size(), 4u);
    EXPECT_DOUBLE_EQ(*out[2].foot_traffic.series_mean, 2.0);
    EXPECT_DOUBLE_EQ(*out[2].foot_traffic.series_stddev, 1.0);
    EXPECT_DOUBLE_EQ(*out[2].foot_traffic.zscore, 1.0);
    EXPECT_DOUBLE_EQ(*out[0].foot_traffic.zscore, -1.0);
    // Statistics describe the series, the row itself has no value.
    EXPECT_DOUBLE_EQ(*out[3].foot_traffic.series_mean, 2.0);
    EXPECT_FALSE(out[3].foot_traffic.zscore.has_value());
}

TEST_F(WindowedMetricsTest, ConstantOrShortSeriesHasNoZScore) {
    auto constant = engine_.compute(core::Level::INTERMEDIATE,
                                    {Row("A", core::Date(2024, 1, 1), 5.0),
                                     Row("A", core::Date(2024, 2, 1), 5.0)});
    EXPECT_DOUBLE_EQ(*constant[0].foot_traffic.series_stddev, 0.0);
    EXPECT_FALSE(constant[0].foot_traffic.zscore.has_value());

    auto single = engine_.compute(core::Level::INTERMEDIATE, {Row("A", core::Date(2024, 1, 1), 5.0)});
    EXPECT_FALSE(single[0].foot_traffic.series_stddev.has_value());
    EXPECT_FALSE(single[0].foot_traffic.zscore.has_value());
}

TEST_F(WindowedMetricsTest, CrossSectionalMeanAndDenseRank) {
    core::Date jan(2024, 1, 1);
    auto out = engine_.compute(core::Level::INTERMEDIATE,
                               {Row("D", jan, std::nullopt), Row("C", jan, 30.0),
                                Row("A", jan, 10.0), Row("B", jan, 30.0)});
    ASSERT_EQ(out.size(), 4u);
    // Output is ordered by label.
    EXPECT_EQ(out[0].label, "A");
    EXPECT_EQ(out[3].label, "D");

    for (const auto& row : out) {
        EXPECT_DOUBLE_EQ(*row.foot_traffic.cross_sectional_mean, 70.0 / 3.0);
    }
    EXPECT_EQ(*out[0].foot_traffic.rank, 2u);
    EXPECT_EQ(*out[1].foot_traffic.rank, 1u);
    EXPECT_EQ(*out[2].foot_traffic.rank, 1u);
    EXPECT_FALSE(out[3].foot_traffic.rank.has_value());
    EXPECT_FALSE(out[0].sales.cross_sectional_mean.has_value());
}

TEST_F(WindowedMetricsTest, PartitionsAreIndependent) {
    auto out = engine_.compute(core::Level::INTERMEDIATE,
                               {Row("B", core::Date(2024, 2, 1), 20.0),
                                Row("A", core::Date(2024, 2, 1), 1.0),
                                Row("B", core::Date(2024, 1, 1), 10.0)});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].label, "A");
    EXPECT_FALSE(out[0].foot_traffic.prior.has_value());
    EXPECT_EQ(out[1].date, core::Date(2024, 1, 1));
    EXPECT_DOUBLE_EQ(*out[2].foot_traffic.prior, 10.0);
}

TEST_F(WindowedMetricsTest, AggregateSumsFactsPerLevelLabel) {
    core::Date jan(2024, 1, 1);
    storage::FactSnapshot snapshot;
    snapshot.activity = {testutil::Activity("k1", jan, 100.0, std::nullopt, "telco"),
                         testutil::Activity("k1", jan, 20.0, std::nullopt, "card"),
                         testutil::Activity("k2", jan, 50.0, 7.0),
                         testutil::Activity("k3", jan, 30.0)};
    storage::ActivityFact weekly = testutil::Activity("k3", jan, 999.0);
    weekly.granularity = "week";
    snapshot.activity.push_back(weekly);

    auto resolver = testutil::SampleResolver();

    auto finest = engine_.aggregate(snapshot, *resolver, core::Level::FINEST);
    ASSERT_EQ(finest.size(), 3u);
    EXPECT_EQ(finest[0].label, "Samseong-dong");
    EXPECT_EQ(finest[2].label, "Yeoksam-dong");
    EXPECT_DOUBLE_EQ(*finest[2].foot_traffic, 120.0);
    EXPECT_FALSE(finest[2].sales.has_value());

    auto districts = engine_.aggregate(snapshot, *resolver, core::Level::INTERMEDIATE);
    ASSERT_EQ(districts.size(), 2u);
    EXPECT_EQ(districts[0].label, "Gangnam-gu");
    EXPECT_DOUBLE_EQ(*districts[0].foot_traffic, 170.0);
    EXPECT_DOUBLE_EQ(*districts[0].sales, 7.0);
    EXPECT_DOUBLE_EQ(*districts[1].foot_traffic, 30.0);

    auto provinces = engine_.run(snapshot, *resolver, core::Level::COARSEST);
    ASSERT_EQ(provinces.size(), 1u);
    EXPECT_EQ(provinces[0].label, "Seoul");
    EXPECT_EQ(provinces[0].level, core::Level::COARSEST);
    EXPECT_DOUBLE_EQ(*provinces[0].foot_traffic.value, 200.0);
}

TEST(WindowedMetricsConfigTest, RejectsZeroLag) {
    core::MetricsConfig config;
    config.prior_period_lag = 0;
    EXPECT_THROW(WindowedMetricsEngine engine(config), core::InvalidArgumentError);
}

} // namespace test
} // namespace analytics
} // namespace geoinsight
