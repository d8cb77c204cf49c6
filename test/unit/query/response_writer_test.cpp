#include <gtest/gtest.h>
#include "geoinsight/query/response_writer.h"

#include <rapidjson/document.h>

namespace geoinsight {
namespace query {
namespace test {

namespace {

rapidjson::Document Parse(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    EXPECT_FALSE(doc.HasParseError()) << json;
    return doc;
}

ResponseMetadata SampleMetadata() {
    ResponseMetadata metadata;
    metadata.sources = {"card", "telco"};
    metadata.generated_at = 1735689600000;  // 2025-01-01T00:00:00Z
    metadata.period_from = core::Date(2024, 12, 1);
    metadata.period_to = core::Date(2024, 12, 1);
    metadata.warnings = {"Overlapping sources"};
    return metadata;
}

} // namespace

TEST(ResponseWriterTest, CompareDomainsDocument) {
    CompareDomainsResult result;
    result.region = "Gangnam-gu";
    result.date = core::Date(2024, 12, 1);
    DomainComparison comparison;
    comparison.domain = "sales";
    comparison.metric = core::Metric::SALES;
    comparison.value = 120.0;
    comparison.change_rate = 0.25;
    comparison.trend = "up";
    comparison.signal = "strong_change";
    result.comparisons.push_back(comparison);
    result.metadata = SampleMetadata();

    auto doc = Parse(ResponseWriter::Write(result));
    EXPECT_STREQ(doc["operation"].GetString(), "compare_domains");
    const auto& data = doc["data"];
    EXPECT_STREQ(data["region"].GetString(), "Gangnam-gu");
    EXPECT_STREQ(data["date"].GetString(), "2024-12-01");
    ASSERT_EQ(data["comparisons"].Size(), 1u);
    const auto& entry = data["comparisons"][0];
    EXPECT_STREQ(entry["metric"].GetString(), "sales");
    EXPECT_DOUBLE_EQ(entry["value"].GetDouble(), 120.0);
    EXPECT_DOUBLE_EQ(entry["change_rate"].GetDouble(), 0.25);
    EXPECT_TRUE(entry["yoy_change_rate"].IsNull());
    EXPECT_STREQ(entry["signal"].GetString(), "strong_change");

    const auto& metadata = doc["metadata"];
    EXPECT_STREQ(metadata["generated_at"].GetString(), "2025-01-01T00:00:00.000Z");
    EXPECT_STREQ(metadata["level"].GetString(), "intermediate");
    EXPECT_STREQ(metadata["sources"][1].GetString(), "telco");
    EXPECT_STREQ(metadata["warnings"][0].GetString(), "Overlapping sources");
    EXPECT_FALSE(metadata.HasMember("generation"));
    EXPECT_FALSE(metadata.HasMember("refreshed_at"));
}

TEST(ResponseWriterTest, CrossSectionalCompareHasNullRegion) {
    CompareDomainsResult result;
    auto doc = Parse(ResponseWriter::Write(result));
    EXPECT_TRUE(doc["data"]["region"].IsNull());
    EXPECT_TRUE(doc["data"]["date"].IsNull());
    EXPECT_TRUE(doc["metadata"]["period_from"].IsNull());
    EXPECT_EQ(doc["data"]["comparisons"].Size(), 0u);
}

TEST(ResponseWriterTest, RankingsDocument) {
    RankingsResult result;
    result.metric = core::Metric::FOOT_TRAFFIC;
    result.date = core::Date(2024, 12, 1);
    result.rankings.push_back(RankingEntry{"Gangnam-gu", 1200.0, 1u, std::nullopt});
    result.rankings.push_back(RankingEntry{"Seocho-gu", std::nullopt, std::nullopt, 1.0});
    result.metadata.level = core::Level::COARSEST;

    auto doc = Parse(ResponseWriter::Write(result));
    EXPECT_STREQ(doc["operation"].GetString(), "get_rankings");
    const auto& rankings = doc["data"]["rankings"];
    ASSERT_EQ(rankings.Size(), 2u);
    EXPECT_STREQ(rankings[0]["label"].GetString(), "Gangnam-gu");
    EXPECT_EQ(rankings[0]["rank"].GetUint(), 1u);
    EXPECT_TRUE(rankings[0]["change_rate"].IsNull());
    EXPECT_TRUE(rankings[1]["value"].IsNull());
    EXPECT_TRUE(rankings[1]["rank"].IsNull());
    EXPECT_STREQ(doc["data"]["metric"].GetString(), "foot_traffic");
    EXPECT_STREQ(doc["metadata"]["level"].GetString(), "coarsest");
}

TEST(ResponseWriterTest, AnomalyDocument) {
    AnomalyResult result;
    result.region = "Seocho-gu";
    result.metric = core::Metric::FOOT_TRAFFIC;
    result.date = core::Date(2024, 12, 1);
    result.value = 200.0;
    result.series_mean = 108.0;
    result.series_stddev = 29.0;
    result.zscore = 3.17;
    result.threshold = 2.0;
    result.is_anomaly = true;

    auto doc = Parse(ResponseWriter::Write(result));
    const auto& data = doc["data"];
    EXPECT_STREQ(data["region"].GetString(), "Seocho-gu");
    EXPECT_DOUBLE_EQ(data["mean"].GetDouble(), 108.0);
    EXPECT_DOUBLE_EQ(data["stddev"].GetDouble(), 29.0);
    EXPECT_DOUBLE_EQ(data["zscore"].GetDouble(), 3.17);
    EXPECT_DOUBLE_EQ(data["threshold"].GetDouble(), 2.0);
    EXPECT_TRUE(data["is_anomaly"].GetBool());
}

TEST(ResponseWriterTest, AdvancedInsightDocument) {
    AdvancedInsightResult result;
    result.region = "Gangnam-gu";
    result.domains = {"population", "sales"};
    result.metadata = SampleMetadata();
    result.metadata.generation = 3;
    result.metadata.refreshed_at = 1735689600000;

    auto empty = Parse(ResponseWriter::Write(result));
    EXPECT_TRUE(empty["data"]["correlation"]["sales_vs_foot_traffic"].IsNull());
    EXPECT_EQ(empty["data"]["sample_count"].GetUint64(), 0u);

    analytics::AdvancedInsight insight;
    insight.label = "Gangnam-gu";
    insight.correlation = 0.9;
    insight.slope = 0.1;
    insight.sales_impact = 0.8;
    insight.sample_count = 12;
    result.insight = insight;

    auto doc = Parse(ResponseWriter::Write(result));
    const auto& data = doc["data"];
    EXPECT_DOUBLE_EQ(data["correlation"]["sales_vs_foot_traffic"].GetDouble(), 0.9);
    EXPECT_DOUBLE_EQ(data["impact"]["sales_impact_slope"].GetDouble(), 0.1);
    EXPECT_DOUBLE_EQ(data["impact"]["sales_impact_score"].GetDouble(), 0.8);
    EXPECT_TRUE(data["impact"]["foot_traffic_impact_score"].IsNull());
    EXPECT_EQ(data["sample_count"].GetUint64(), 12u);
    EXPECT_EQ(data["domains"].Size(), 2u);
    EXPECT_EQ(doc["metadata"]["generation"].GetUint64(), 3u);
    EXPECT_STREQ(doc["metadata"]["refreshed_at"].GetString(), "2025-01-01T00:00:00.000Z");
}

TEST(ResponseWriterTest, SeriesSummaryDocument) {
    SeriesSummary summary;
    summary.region = "Yeoksam-dong";
    summary.date_min = core::Date(2024, 1, 1);
    summary.date_max = core::Date(2024, 2, 1);
    analytics::InsightCandidate row;
    row.label = "Yeoksam-dong";
    row.date = core::Date(2024, 2, 1);
    row.foot_traffic.value = 110.0;
    row.foot_traffic.prior_delta = 0.1;
    summary.series.push_back(row);
    summary.foot_traffic.mom_max = ExtremePoint{core::Date(2024, 2, 1), 0.1, 110.0};
    summary.foot_traffic.anomalies.push_back(AnomalyPoint{core::Date(2024, 2, 1), -2.5, 110.0});
    summary.dominant_group = "F_30";
    summary.dominant_share = 0.6;

    auto doc = Parse(ResponseWriter::Write(summary));
    EXPECT_STREQ(doc["operation"].GetString(), "summarize_series");
    const auto& data = doc["data"];
    EXPECT_STREQ(data["date_min"].GetString(), "2024-01-01");
    ASSERT_EQ(data["series"].Size(), 1u);
    EXPECT_DOUBLE_EQ(data["series"][0]["foot_traffic_mom"].GetDouble(), 0.1);
    EXPECT_TRUE(data["series"][0]["sales"].IsNull());

    const auto& foot_traffic = data["highlights"]["foot_traffic"];
    EXPECT_STREQ(foot_traffic["mom_max"]["date"].GetString(), "2024-02-01");
    EXPECT_DOUBLE_EQ(foot_traffic["mom_max"]["series_value"].GetDouble(), 110.0);
    EXPECT_TRUE(foot_traffic["mom_min"].IsNull());
    EXPECT_DOUBLE_EQ(foot_traffic["anomalies"][0]["zscore"].GetDouble(), -2.5);
    EXPECT_EQ(data["highlights"]["sales"]["anomalies"].Size(), 0u);
    EXPECT_STREQ(data["dominant_group"].GetString(), "F_30");
    EXPECT_DOUBLE_EQ(data["dominant_share"].GetDouble(), 0.6);
}

TEST(ResponseWriterTest, ErrorDocument) {
    auto doc = Parse(ResponseWriter::WriteError(core::TimeoutError("refresh lock busy")));
    const auto& error = doc["error"];
    EXPECT_STREQ(error["code"].GetString(), "TIMEOUT");
    EXPECT_STREQ(error["message"].GetString(), "refresh lock busy");
    EXPECT_TRUE(error["retryable"].GetBool());

    auto invalid = Parse(ResponseWriter::WriteError(core::InvalidArgumentError("top_k")));
    EXPECT_STREQ(invalid["error"]["code"].GetString(), "INVALID_ARGUMENT");
    EXPECT_FALSE(invalid["error"]["retryable"].GetBool());
}

} // namespace test
} // namespace query
} // namespace geoinsight
