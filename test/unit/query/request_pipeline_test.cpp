#include <gtest/gtest.h>
#include "geoinsight/query/request_pipeline.h"

#include <memory>

#include <rapidjson/document.h>

#include "geoinsight/semantic_cache/text_embedder.h"
#include "test_util/directory.h"
#include "test_util/facts.h"
#include "test_util/fakes.h"

namespace geoinsight {
namespace query {
namespace test {

namespace {

using semantic_cache::Operation;
using semantic_cache::StructuredQuery;

rapidjson::Document ParseBody(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    EXPECT_FALSE(doc.HasParseError()) << json;
    return doc;
}

} // namespace

class RequestPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<storage::InMemoryFactStore>();
        std::vector<double> growth;
        std::vector<double> sales;
        for (int i = 1; i <= 12; ++i) {
            growth.push_back(100.0 * i);
            sales.push_back(10.0 * i);
        }
        store_->upsert_batch(testutil::MonthlySeries("k1", 2024, growth, sales), {});
        store_->upsert_batch(
            testutil::MonthlySeries("k3", 2024, {98, 102, 99, 101, 100, 97, 103, 100, 99, 101, 100, 200}),
            {});

        candidates_ = std::make_shared<analytics::InsightCandidateAggregator>(testutil::SampleResolver());
        advanced_ = std::make_shared<analytics::AdvancedInsightAggregator>(store_, candidates_);
        service_ = std::make_shared<InsightService>(store_, candidates_, advanced_);
    }

    std::shared_ptr<RequestPipeline> MakePipeline(
        std::shared_ptr<semantic_cache::QueryTranslator> translator) {
        auto cache = std::make_shared<semantic_cache::QueryMappingCache>(
            std::move(translator), std::make_shared<semantic_cache::HashingEmbedder>(),
            core::CacheConfig::Default());
        EXPECT_TRUE(cache->init().ok());
        return std::make_shared<RequestPipeline>(cache, service_);
    }

    std::shared_ptr<RequestPipeline> MakeRuleBasedPipeline() {
        return MakePipeline(std::make_shared<semantic_cache::RuleBasedTranslator>(
            std::vector<std::string>{"Seoul", "Gangnam-gu", "Seocho-gu", "Yeoksam-dong"}));
    }

    std::shared_ptr<storage::InMemoryFactStore> store_;
    std::shared_ptr<analytics::InsightCandidateAggregator> candidates_;
    std::shared_ptr<analytics::AdvancedInsightAggregator> advanced_;
    std::shared_ptr<InsightService> service_;
};

TEST_F(RequestPipelineTest, RankingsFromFreeText) {
    auto pipeline = MakeRuleBasedPipeline();

    auto first = pipeline->run("Top 2 by foot traffic per district in 2024-12");
    ASSERT_TRUE(first.ok()) << first.error();
    auto doc = ParseBody(first.value().body);
    EXPECT_STREQ(doc["cache"]["outcome"].GetString(), "miss");
    EXPECT_FALSE(doc["cache"]["fallback"].GetBool());
    EXPECT_STREQ(doc["query"]["operation"].GetString(), "get_rankings");
    EXPECT_EQ(doc["query"]["top_k"].GetUint(), 2u);

    const auto& rankings = doc["result"]["data"]["rankings"];
    ASSERT_EQ(rankings.Size(), 2u);
    EXPECT_STREQ(rankings[0]["label"].GetString(), "Gangnam-gu");
    EXPECT_DOUBLE_EQ(rankings[0]["value"].GetDouble(), 1200.0);
    EXPECT_STREQ(rankings[1]["label"].GetString(), "Seocho-gu");

    auto second = pipeline->run("Top 2 by foot traffic  per district in 2024-12");
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value().resolved.outcome, semantic_cache::CacheOutcome::EXACT_HIT);
    EXPECT_EQ(second.value().resolved.fingerprint, first.value().resolved.fingerprint);
    auto again = ParseBody(second.value().body);
    EXPECT_STREQ(again["cache"]["outcome"].GetString(), "exact_hit");
    EXPECT_EQ(again["result"]["data"]["rankings"].Size(), 2u);
}

TEST_F(RequestPipelineTest, CompareDomainsForNamedRegion) {
    auto pipeline = MakeRuleBasedPipeline();
    auto response = pipeline->run("Compare population and sales for Gangnam-gu in 2024-12");
    ASSERT_TRUE(response.ok()) << response.error();

    auto doc = ParseBody(response.value().body);
    EXPECT_STREQ(doc["query"]["region"].GetString(), "Gangnam-gu");
    const auto& data = doc["result"]["data"];
    EXPECT_STREQ(data["region"].GetString(), "Gangnam-gu");
    EXPECT_STREQ(data["date"].GetString(), "2024-12-01");
    ASSERT_EQ(data["comparisons"].Size(), 2u);
    EXPECT_DOUBLE_EQ(data["comparisons"][0]["value"].GetDouble(), 1200.0);
    EXPECT_DOUBLE_EQ(data["comparisons"][1]["value"].GetDouble(), 120.0);
    EXPECT_STREQ(doc["result"]["metadata"]["sources"][0].GetString(), "telco");
}

TEST_F(RequestPipelineTest, TranslatorOutageStillAnswers) {
    auto pipeline = MakePipeline(std::make_shared<testutil::FailingTranslator>());
    auto response = pipeline->run("How is Gangnam-gu doing?");
    ASSERT_TRUE(response.ok()) << response.error();
    EXPECT_TRUE(response.value().resolved.fallback);

    auto doc = ParseBody(response.value().body);
    EXPECT_TRUE(doc["cache"]["fallback"].GetBool());
    EXPECT_GT(doc["cache"]["warnings"].Size(), 0u);
    EXPECT_STREQ(doc["query"]["operation"].GetString(), "compare_domains");
    EXPECT_FALSE(doc["query"].HasMember("region"));

    // Reduced scope: mean across every district at the latest month.
    const auto& data = doc["result"]["data"];
    EXPECT_TRUE(data["region"].IsNull());
    EXPECT_DOUBLE_EQ(data["comparisons"][0]["value"].GetDouble(), 700.0);
}

TEST_F(RequestPipelineTest, AdvancedInsightAfterRefresh) {
    ASSERT_TRUE(advanced_->refresh().ok());
    auto pipeline = MakeRuleBasedPipeline();
    auto response = pipeline->run("What is the correlation of sales and foot traffic in Gangnam-gu?");
    ASSERT_TRUE(response.ok()) << response.error();

    auto doc = ParseBody(response.value().body);
    EXPECT_STREQ(doc["query"]["operation"].GetString(), "get_advanced_insight");
    const auto& data = doc["result"]["data"];
    EXPECT_NEAR(data["correlation"]["sales_vs_foot_traffic"].GetDouble(), 1.0, 1e-9);
    EXPECT_EQ(data["sample_count"].GetUint64(), 12u);
    EXPECT_EQ(doc["result"]["metadata"]["generation"].GetUint64(), 1u);
}

TEST_F(RequestPipelineTest, AnomalyWithoutRegionIsRejected) {
    auto pipeline = MakeRuleBasedPipeline();
    auto response = pipeline->run("Any unusual sales lately?");
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(response.error_code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(RequestPipelineTest, CancelledRequestIsNotResolved) {
    auto translator = std::make_shared<testutil::CountingTranslator>(StructuredQuery::Default());
    auto pipeline = MakePipeline(translator);
    core::CallOptions options;
    options.cancellation = std::make_shared<core::CancellationToken>();
    options.cancellation->cancel();

    auto response = pipeline->run("Compare everything", options);
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(response.error_code(), core::Error::Code::CANCELLED);
    EXPECT_EQ(translator->calls(), 0);
}

TEST_F(RequestPipelineTest, ExecuteFillsServiceDefaults) {
    auto pipeline = MakeRuleBasedPipeline();

    StructuredQuery rankings;
    rankings.operation = Operation::GET_RANKINGS;
    auto ranked = pipeline->execute(rankings);
    ASSERT_TRUE(ranked.ok()) << ranked.error();
    auto ranked_doc = ParseBody(ranked.value());
    EXPECT_STREQ(ranked_doc["data"]["metric"].GetString(), "foot_traffic");
    EXPECT_EQ(ranked_doc["data"]["rankings"].Size(), 2u);

    StructuredQuery anomaly;
    anomaly.operation = Operation::DETECT_ANOMALY;
    anomaly.region = "Seocho-gu";
    anomaly.period = "2024-12";
    auto detected = pipeline->execute(anomaly);
    ASSERT_TRUE(detected.ok()) << detected.error();
    auto anomaly_doc = ParseBody(detected.value());
    EXPECT_STREQ(anomaly_doc["data"]["metric"].GetString(), "foot_traffic");
    EXPECT_DOUBLE_EQ(anomaly_doc["data"]["threshold"].GetDouble(), 2.0);
    EXPECT_TRUE(anomaly_doc["data"]["is_anomaly"].GetBool());

    StructuredQuery compare;
    compare.region = "Gangnam-gu";
    compare.period = "2024-06";
    auto compared = pipeline->execute(compare);
    ASSERT_TRUE(compared.ok()) << compared.error();
    auto compare_doc = ParseBody(compared.value());
    EXPECT_STREQ(compare_doc["data"]["date"].GetString(), "2024-06-01");
    EXPECT_EQ(compare_doc["data"]["comparisons"].Size(), 2u);
}

TEST_F(RequestPipelineTest, ExecutePropagatesValidationErrors) {
    auto pipeline = MakeRuleBasedPipeline();
    StructuredQuery query;
    query.operation = Operation::GET_RANKINGS;
    query.metric = "weather";
    EXPECT_EQ(pipeline->execute(query).error_code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(RequestPipelineTest, RequiresCacheAndService) {
    EXPECT_THROW(RequestPipeline pipeline(nullptr, service_), core::InvalidArgumentError);
}

} // namespace test
} // namespace query
} // namespace geoinsight
