#ifndef GEOINSIGHT_SEMANTIC_CACHE_QUERY_TRANSLATOR_H_
#define GEOINSIGHT_SEMANTIC_CACHE_QUERY_TRANSLATOR_H_

#include <string>
#include <vector>

#include "geoinsight/core/call_options.h"
#include "geoinsight/core/result.h"
#include "geoinsight/semantic_cache/structured_query.h"

namespace geoinsight {
namespace semantic_cache {

/**
 * @brief Translates free text into a structured query
 *
 * Usually backed by an external language model: slow, rate limited and
 * allowed to fail. Callers treat every failure the same way.
 */
class QueryTranslator {
public:
    virtual ~QueryTranslator() = default;

    virtual core::Result<StructuredQuery> translate(const std::string& text,
                                                    const core::CallOptions& options) = 0;

    /**
     * @brief Parser name and version; part of every cache fingerprint
     */
    virtual std::string identity() const = 0;
};

/**
 * @brief Deterministic keyword translator
 *
 * Recognizes operation keywords ("rank", "top N", "anomaly", "correlation"),
 * domains, levels, periods (YYYY, YYYY-MM, YYYY-MM-DD) and the longest known
 * region name contained in the text. Anything unrecognized defaults to a
 * domain comparison.
 */
class RuleBasedTranslator : public QueryTranslator {
public:
    explicit RuleBasedTranslator(std::vector<std::string> regions = {});

    core::Result<StructuredQuery> translate(const std::string& text,
                                            const core::CallOptions& options) override;
    std::string identity() const override { return "rule-based"; }

private:
    std::vector<std::string> regions_;
};

} // namespace semantic_cache
} // namespace geoinsight

#endif // GEOINSIGHT_SEMANTIC_CACHE_QUERY_TRANSLATOR_H_
