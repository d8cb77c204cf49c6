#include <gtest/gtest.h>
#include "geoinsight/semantic_cache/query_translator.h"

namespace geoinsight {
namespace semantic_cache {
namespace test {

class RuleBasedTranslatorTest : public ::testing::Test {
protected:
    StructuredQuery Translate(const std::string& text) {
        auto result = translator_.translate(text, core::CallOptions());
        EXPECT_TRUE(result.ok()) << result.error();
        return result.ok() ? result.value() : StructuredQuery();
    }

    RuleBasedTranslator translator_{{"Gangnam-gu", "Seocho-gu", "Seoul", "Yeoksam-dong"}};
};

TEST_F(RuleBasedTranslatorTest, RankingsWithTopKAndMetric) {
    StructuredQuery query = Translate("Top 3 by sales per district in 2024-12");
    EXPECT_EQ(query.operation, Operation::GET_RANKINGS);
    EXPECT_EQ(*query.metric, "sales");
    EXPECT_EQ(*query.top_k, 3u);
    EXPECT_EQ(*query.period, "2024-12");
    EXPECT_EQ(*query.level, "intermediate");
    EXPECT_TRUE(query.domains.empty());
    EXPECT_TRUE(query.validate().ok());
}

TEST_F(RuleBasedTranslatorTest, AnomalyWithRegionAndThreshold) {
    StructuredQuery query = Translate("Is foot traffic in Gangnam-gu anomalous in 2024-06? z 3");
    EXPECT_EQ(query.operation, Operation::DETECT_ANOMALY);
    EXPECT_EQ(*query.region, "Gangnam-gu");
    EXPECT_EQ(query.domains, (std::vector<std::string>{"population"}));
    EXPECT_DOUBLE_EQ(*query.z_threshold, 3.0);
    EXPECT_EQ(*query.period, "2024-06");
}

TEST_F(RuleBasedTranslatorTest, CorrelationMeansAdvancedInsight) {
    StructuredQuery query = Translate("How does sales correlate with visitors in Seocho-gu?");
    EXPECT_EQ(query.operation, Operation::GET_ADVANCED_INSIGHT);
    EXPECT_EQ(*query.region, "Seocho-gu");
}

TEST_F(RuleBasedTranslatorTest, ComparisonTakesPeriodRange) {
    StructuredQuery query = Translate("Compare population and sales in Seoul from 2023-01 to 2024-06");
    EXPECT_EQ(query.operation, Operation::COMPARE_DOMAINS);
    EXPECT_EQ(*query.region, "Seoul");
    EXPECT_EQ(*query.period_from, "2023-01");
    EXPECT_EQ(*query.period_to, "2024-06");
    EXPECT_EQ(query.domains, (std::vector<std::string>{"population", "sales"}));
}

TEST_F(RuleBasedTranslatorTest, LevelKeywordsMatchWholeWords) {
    EXPECT_FALSE(Translate("Top 3 by sales signal in 2024").level.has_value());
    EXPECT_FALSE(Translate("Top 3 abnormal sales in 2024").level.has_value());
    EXPECT_EQ(*Translate("Top 3 by sales per province").level, "coarsest");
    EXPECT_EQ(*Translate("Top 3 by sales per SIG").level, "intermediate");
    // The finest level wins when several are named.
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(*Translate("Top 3 by sales per district at the finest level").level, "finest");
    }
}

TEST_F(RuleBasedTranslatorTest, LongestRegionNameWins) {
    RuleBasedTranslator translator({"Jung", "Jung-gu"});
    auto query = translator.translate("what happened in Jung-gu", core::CallOptions());
    ASSERT_TRUE(query.ok());
    EXPECT_EQ(*query.value().region, "Jung-gu");
}

TEST_F(RuleBasedTranslatorTest, UnrecognizedTextIsADefaultComparison) {
    StructuredQuery query = Translate("hello there");
    EXPECT_EQ(query, StructuredQuery::Default());
    EXPECT_EQ(translator_.identity(), "rule-based");
}

TEST_F(RuleBasedTranslatorTest, EmptyTextIsRejected) {
    auto result = translator_.translate("   ", core::CallOptions());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::INVALID_ARGUMENT);
}

} // namespace test
} // namespace semantic_cache
} // namespace geoinsight
