#include <gtest/gtest.h>
#include "geoinsight/semantic_cache/structured_query.h"

namespace geoinsight {
namespace semantic_cache {
namespace test {

TEST(StructuredQueryTest, DefaultComparesEveryDomain) {
    StructuredQuery query = StructuredQuery::Default();
    EXPECT_EQ(query.operation, Operation::COMPARE_DOMAINS);
    EXPECT_EQ(query.domains, (std::vector<std::string>{"population", "sales"}));
    EXPECT_FALSE(query.region.has_value());
    EXPECT_TRUE(query.validate().ok());
    EXPECT_EQ(query.ToJson(), R"({"operation":"compare_domains","domains":["population","sales"]})");
}

TEST(StructuredQueryTest, CanonicalJsonHasFixedKeyOrder) {
    StructuredQuery query;
    query.operation = Operation::GET_RANKINGS;
    query.level = "sig";
    query.top_k = 5;
    query.metric = "sales";
    query.period = "2024-12";
    EXPECT_EQ(query.ToJson(),
              R"({"operation":"get_rankings","period":"2024-12","metric":"sales","top_k":5,"level":"sig"})");

    auto parsed = StructuredQuery::FromJson(
        R"({"level":"sig","top_k":5,"metric":"sales","period":"2024-12","operation":"get_rankings"})");
    ASSERT_TRUE(parsed.ok()) << parsed.error();
    EXPECT_EQ(parsed.value(), query);
    EXPECT_EQ(parsed.value().ToJson(), query.ToJson());
}

TEST(StructuredQueryTest, NullFieldsAreAbsent) {
    auto parsed = StructuredQuery::FromJson(
        R"({"operation":"detect_anomaly","region":"Gangnam-gu","period":null,"z_threshold":null})");
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(*parsed.value().region, "Gangnam-gu");
    EXPECT_FALSE(parsed.value().period.has_value());
    EXPECT_FALSE(parsed.value().z_threshold.has_value());
}

TEST(StructuredQueryTest, FromJsonRejectsMalformedDocuments) {
    const char* cases[] = {
        "not json",
        "[]",
        R"({"region":"x"})",
        R"({"operation":"forecast"})",
        R"({"operation":"get_rankings","top_k":-1})",
        R"({"operation":"get_rankings","top_k":"5"})",
        R"({"operation":"compare_domains","domains":"sales"})",
        R"({"operation":"compare_domains","region":7})",
    };
    for (const char* json : cases) {
        auto parsed = StructuredQuery::FromJson(json);
        ASSERT_FALSE(parsed.ok()) << json;
        EXPECT_EQ(parsed.error_code(), core::Error::Code::INVALID_ARGUMENT) << json;
    }
}

TEST(StructuredQueryTest, ValidateChecksNamesRangesAndPeriods) {
    StructuredQuery query = StructuredQuery::Default();
    query.domains.push_back("weather");
    EXPECT_FALSE(query.validate().ok());

    query = StructuredQuery::Default();
    query.top_k = 0;
    EXPECT_FALSE(query.validate().ok());
    query.top_k = 101;
    EXPECT_FALSE(query.validate().ok());
    EXPECT_TRUE(query.validate(200).ok());

    query = StructuredQuery::Default();
    query.z_threshold = -1.0;
    EXPECT_FALSE(query.validate().ok());

    query = StructuredQuery::Default();
    query.period_from = "2024-13";
    EXPECT_EQ(query.validate().error_code(), core::Error::Code::INVALID_ARGUMENT);

    query = StructuredQuery::Default();
    query.level = "street";
    EXPECT_FALSE(query.validate().ok());
    query.level = "sido";
    query.metric = "activity_volume";
    EXPECT_TRUE(query.validate().ok());
}

} // namespace test
} // namespace semantic_cache
} // namespace geoinsight
