#ifndef GEOINSIGHT_SEMANTIC_CACHE_STRUCTURED_QUERY_H_
#define GEOINSIGHT_SEMANTIC_CACHE_STRUCTURED_QUERY_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "geoinsight/core/result.h"

namespace geoinsight {
namespace semantic_cache {

/**
 * @brief Version of the structured query layout below
 *
 * Bump whenever a field is added, removed or changes meaning; cache entries
 * recorded under another version stop matching.
 */
constexpr const char* kStructuredQuerySchemaVersion = "2";

enum class Operation {
    COMPARE_DOMAINS,
    GET_RANKINGS,
    DETECT_ANOMALY,
    GET_ADVANCED_INSIGHT
};

const char* OperationName(Operation operation);
std::optional<Operation> ParseOperation(const std::string& name);

/**
 * @brief Machine-actionable form of an analytical request
 */
struct StructuredQuery {
    Operation operation = Operation::COMPARE_DOMAINS;
    std::optional<std::string> region;
    std::optional<std::string> period_from;
    std::optional<std::string> period_to;
    std::optional<std::string> period;
    std::vector<std::string> domains;
    std::optional<std::string> metric;
    std::optional<uint32_t> top_k;
    std::optional<double> z_threshold;
    std::optional<std::string> level;

    /**
     * @brief Reduced-scope query used when no translation is available:
     * compare every domain, no region, latest period
     */
    static StructuredQuery Default();

    /**
     * @brief Canonical JSON: fixed key order, absent fields omitted
     */
    std::string ToJson() const;

    static core::Result<StructuredQuery> FromJson(const std::string& json);

    /**
     * @brief Reject unknown names, malformed periods and out-of-range
     * numeric arguments with INVALID_ARGUMENT
     */
    core::Result<void> validate(size_t max_top_k = 100) const;

    bool operator==(const StructuredQuery& other) const;
    bool operator!=(const StructuredQuery& other) const { return !(*this == other); }
};

} // namespace semantic_cache
} // namespace geoinsight

#endif // GEOINSIGHT_SEMANTIC_CACHE_STRUCTURED_QUERY_H_
