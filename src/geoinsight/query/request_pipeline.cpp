#include "geoinsight/query/request_pipeline.h"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "geoinsight/common/logger.h"
#include "geoinsight/query/response_writer.h"

namespace geoinsight {
namespace query {

namespace {

using semantic_cache::Operation;
using semantic_cache::StructuredQuery;

template <typename T>
core::Result<std::string> Render(const core::Result<T>& result) {
    if (!result.ok()) return core::Result<std::string>(result.error_detail());
    return ResponseWriter::Write(result.value());
}

std::vector<std::string> DomainsOrDefault(const StructuredQuery& query) {
    if (!query.domains.empty()) return query.domains;
    return StructuredQuery::Default().domains;
}

} // namespace

RequestPipeline::RequestPipeline(std::shared_ptr<semantic_cache::QueryMappingCache> cache,
                                 std::shared_ptr<const InsightService> service)
    : cache_(std::move(cache)), service_(std::move(service)) {
    if (!cache_ || !service_) {
        throw core::InvalidArgumentError("RequestPipeline requires a cache and an insight service");
    }
}

core::Result<std::string> RequestPipeline::execute(const StructuredQuery& query) const {
    const auto& config = service_->config();
    const std::string region = query.region.value_or("");
    const std::string level = query.level.value_or("");

    switch (query.operation) {
        case Operation::COMPARE_DOMAINS: {
            std::string from = query.period_from.value_or("");
            std::string to = query.period_to.value_or("");
            if (from.empty() && to.empty() && query.period) {
                from = *query.period;
                to = *query.period;
            }
            return Render(service_->compare_domains(region, from, to, DomainsOrDefault(query), level));
        }
        case Operation::GET_RANKINGS:
            return Render(service_->get_rankings(query.metric.value_or("foot_traffic"),
                                                 query.period.value_or(""),
                                                 query.top_k ? *query.top_k : config.default_top_k,
                                                 level));
        case Operation::DETECT_ANOMALY: {
            std::string domain = query.domains.empty() ? query.metric.value_or("population")
                                                       : query.domains.front();
            return Render(service_->detect_anomaly(region, domain, query.period.value_or(""),
                                                   query.z_threshold.value_or(config.default_z_threshold),
                                                   level));
        }
        case Operation::GET_ADVANCED_INSIGHT:
            return Render(service_->get_advanced_insight(region, query.period.value_or(""),
                                                         DomainsOrDefault(query), level));
    }
    return core::Result<std::string>(core::InternalError("Unhandled operation"));
}

core::Result<PipelineResponse> RequestPipeline::run(const std::string& text,
                                                    const core::CallOptions& options) {
    auto resolved = cache_->resolve(text, options);
    if (!resolved.ok()) return core::Result<PipelineResponse>(resolved.error_detail());

    PipelineResponse response;
    response.resolved = resolved.take_value();

    auto result = execute(response.resolved.query);
    if (!result.ok()) {
        GEOINSIGHT_DEBUG("Query {} rejected: {}", response.resolved.query.ToJson(), result.error());
        return core::Result<PipelineResponse>(result.error_detail());
    }

    const auto& r = response.resolved;
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("cache");
    writer.StartObject();
    writer.Key("outcome");
    writer.String(semantic_cache::CacheOutcomeName(r.outcome));
    writer.Key("fallback");
    writer.Bool(r.fallback);
    writer.Key("fingerprint");
    writer.String(r.fingerprint.c_str(), static_cast<rapidjson::SizeType>(r.fingerprint.size()));
    if (r.matched_fingerprint) {
        writer.Key("matched_fingerprint");
        writer.String(r.matched_fingerprint->c_str(),
                      static_cast<rapidjson::SizeType>(r.matched_fingerprint->size()));
    }
    if (r.distance) {
        writer.Key("distance");
        writer.Double(*r.distance);
    }
    writer.Key("warnings");
    writer.StartArray();
    for (const auto& warning : r.warnings) {
        writer.String(warning.c_str(), static_cast<rapidjson::SizeType>(warning.size()));
    }
    writer.EndArray();
    writer.EndObject();

    const std::string query_json = r.query.ToJson();
    writer.Key("query");
    writer.RawValue(query_json.c_str(), query_json.size(), rapidjson::kObjectType);
    const std::string& body = result.value();
    writer.Key("result");
    writer.RawValue(body.c_str(), body.size(), rapidjson::kObjectType);
    writer.EndObject();

    response.body.assign(buffer.GetString(), buffer.GetSize());
    return response;
}

} // namespace query
} // namespace geoinsight
