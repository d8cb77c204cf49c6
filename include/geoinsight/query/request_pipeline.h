#ifndef GEOINSIGHT_QUERY_REQUEST_PIPELINE_H_
#define GEOINSIGHT_QUERY_REQUEST_PIPELINE_H_

#include <memory>
#include <string>

#include "geoinsight/core/call_options.h"
#include "geoinsight/core/result.h"
#include "geoinsight/query/insight_service.h"
#include "geoinsight/semantic_cache/query_mapping_cache.h"
#include "geoinsight/semantic_cache/structured_query.h"

namespace geoinsight {
namespace query {

struct PipelineResponse {
    semantic_cache::ResolvedQuery resolved;
    std::string body;  // {"cache": {...}, "query": {...}, "result": {...}}
};

/**
 * @brief Free text in, JSON out
 *
 * Resolves the request through the semantic cache, then dispatches the
 * structured query to the insight service. Fields the query leaves out take
 * the service defaults.
 */
class RequestPipeline {
public:
    RequestPipeline(std::shared_ptr<semantic_cache::QueryMappingCache> cache,
                    std::shared_ptr<const InsightService> service);

    core::Result<PipelineResponse> run(const std::string& text,
                                       const core::CallOptions& options = core::CallOptions());

    /**
     * @brief Execute an already structured query; returns the result document
     */
    core::Result<std::string> execute(const semantic_cache::StructuredQuery& query) const;

private:
    std::shared_ptr<semantic_cache::QueryMappingCache> cache_;
    std::shared_ptr<const InsightService> service_;
};

} // namespace query
} // namespace geoinsight

#endif // GEOINSIGHT_QUERY_REQUEST_PIPELINE_H_
