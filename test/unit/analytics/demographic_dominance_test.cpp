#include <gtest/gtest.h>
#include "geoinsight/analytics/demographic_dominance.h"

#include "test_util/directory.h"
#include "test_util/facts.h"

namespace geoinsight {
namespace analytics {
namespace test {

using testutil::Demographic;

class DemographicDominanceTest : public ::testing::Test {
protected:
    std::shared_ptr<const spatial::SpatialResolver> resolver_ = testutil::SampleResolver();
    DemographicDominanceCalculator calculator_;
    core::Date jan_{2024, 1, 1};
};

TEST_F(DemographicDominanceTest, SumsSourcesAndBreaksTiesBySmallestKey) {
    storage::FactSnapshot snapshot;
    snapshot.demographics = {Demographic("k1", jan_, "M", "20", 15.0),
                             Demographic("k1", jan_, "F", "30", 10.0, "telco"),
                             Demographic("k1", jan_, "F", "30", 5.0, "card"),
                             Demographic("k1", jan_, "M", "40", std::nullopt)};
    auto rows = calculator_.compute(snapshot, *resolver_);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].label, "Yeoksam-dong");
    EXPECT_EQ(rows[0].date, jan_);
    EXPECT_EQ(rows[0].group, "F_30");
    EXPECT_DOUBLE_EQ(rows[0].value, 15.0);
    EXPECT_DOUBLE_EQ(*rows[0].total, 30.0);
    EXPECT_DOUBLE_EQ(*rows[0].share, 0.5);
}

TEST_F(DemographicDominanceTest, AllAbsentCellProducesNoRow) {
    storage::FactSnapshot snapshot;
    snapshot.demographics = {Demographic("k2", jan_, "F", "30", std::nullopt),
                             Demographic("k2", jan_, "M", "30", std::nullopt)};
    EXPECT_TRUE(calculator_.compute(snapshot, *resolver_).empty());
}

TEST_F(DemographicDominanceTest, ZeroTotalLeavesShareAbsent) {
    storage::FactSnapshot snapshot;
    snapshot.demographics = {Demographic("k3", jan_, "M", "30", 0.0),
                             Demographic("k3", jan_, "F", "20", 0.0)};
    auto rows = calculator_.compute(snapshot, *resolver_);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].group, "F_20");
    EXPECT_DOUBLE_EQ(*rows[0].total, 0.0);
    EXPECT_FALSE(rows[0].share.has_value());
}

TEST_F(DemographicDominanceTest, OneRowPerLabelAndDate) {
    core::Date feb(2024, 2, 1);
    storage::FactSnapshot snapshot;
    snapshot.demographics = {Demographic("k1", jan_, "F", "30", 10.0),
                             Demographic("k1", feb, "M", "50", 12.0),
                             Demographic("k1", feb, "F", "30", 3.0),
                             Demographic("unmapped", jan_, "F", "60", 1.0)};
    storage::DemographicFact weekly = Demographic("k1", feb, "F", "70", 100.0);
    weekly.granularity = "week";
    snapshot.demographics.push_back(weekly);

    auto rows = calculator_.compute(snapshot, *resolver_);
    ASSERT_EQ(rows.size(), 3u);
    // Ordered by (label, date); an unknown key keeps its raw label.
    EXPECT_EQ(rows[0].label, "Yeoksam-dong");
    EXPECT_EQ(rows[1].label, "Yeoksam-dong");
    EXPECT_EQ(rows[1].group, "M_50");
    EXPECT_DOUBLE_EQ(*rows[1].share, 0.8);
    EXPECT_EQ(rows[2].label, "unmapped");
}

} // namespace test
} // namespace analytics
} // namespace geoinsight
