#include "geoinsight/core/config.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace geoinsight {
namespace core {

namespace {

using rapidjson::Value;

void ReadSize(const Value& obj, const char* key, size_t& out) {
    auto it = obj.FindMember(key);
    if (it != obj.MemberEnd() && it->value.IsUint64()) {
        out = static_cast<size_t>(it->value.GetUint64());
    }
}

void ReadDouble(const Value& obj, const char* key, double& out) {
    auto it = obj.FindMember(key);
    if (it != obj.MemberEnd() && it->value.IsNumber()) {
        out = it->value.GetDouble();
    }
}

void ReadString(const Value& obj, const char* key, std::string& out) {
    auto it = obj.FindMember(key);
    if (it != obj.MemberEnd() && it->value.IsString()) {
        out.assign(it->value.GetString(), it->value.GetStringLength());
    }
}

void ReadMillis(const Value& obj, const char* key, std::chrono::milliseconds& out) {
    auto it = obj.FindMember(key);
    if (it != obj.MemberEnd() && it->value.IsInt64()) {
        out = std::chrono::milliseconds(it->value.GetInt64());
    }
}

const Value* Section(const Value& root, const char* key) {
    auto it = root.FindMember(key);
    if (it == root.MemberEnd() || !it->value.IsObject()) return nullptr;
    return &it->value;
}

} // namespace

Result<void> Config::validate() const {
    if (spatial.coarsest_code_width == 0 ||
        spatial.intermediate_code_width <= spatial.coarsest_code_width) {
        return Result<void>::error(
            "spatial.intermediate_code_width must be greater than coarsest_code_width > 0",
            Error::Code::INVALID_ARGUMENT);
    }
    if (metrics.granularity.empty()) {
        return Result<void>::error("metrics.granularity must not be empty",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (metrics.prior_period_lag == 0 || metrics.prior_year_lag == 0) {
        return Result<void>::error("metrics lags must be positive",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (query.max_top_k == 0 || query.default_top_k == 0 ||
        query.default_top_k > query.max_top_k) {
        return Result<void>::error("query.default_top_k must be in [1, max_top_k]",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (!(query.default_z_threshold > 0.0) || !std::isfinite(query.default_z_threshold)) {
        return Result<void>::error("query.default_z_threshold must be > 0",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (!(cache.max_distance >= 0.0 && cache.max_distance <= 2.0)) {
        return Result<void>::error("cache.max_distance must be within [0, 2]",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (cache.top_k == 0 || cache.embedding_dimension == 0) {
        return Result<void>::error("cache.top_k and cache.embedding_dimension must be positive",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (cache.translator_workers == 0 || cache.translator_queue_capacity == 0) {
        return Result<void>::error(
            "cache.translator_workers and cache.translator_queue_capacity must be positive",
            Error::Code::INVALID_ARGUMENT);
    }
    if (cache.schema_version.empty()) {
        return Result<void>::error("cache.schema_version must not be empty",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (cache.translator_timeout.count() <= 0 || cache.embedding_timeout.count() <= 0 ||
        refresh.timeout.count() <= 0 || refresh.lock_timeout.count() < 0) {
        return Result<void>::error("timeouts must be positive", Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

Result<Config> Config::FromJsonString(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "Config parse error at offset " << doc.GetErrorOffset() << ": "
            << rapidjson::GetParseError_En(doc.GetParseError());
        return Result<Config>::error(oss.str(), Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return Result<Config>::error("Config root must be a JSON object",
                                     Error::Code::INVALID_ARGUMENT);
    }

    Config config = Config::Default();
    ReadString(doc, "log_level", config.log_level);

    if (const Value* s = Section(doc, "spatial")) {
        ReadSize(*s, "intermediate_code_width", config.spatial.intermediate_code_width);
        ReadSize(*s, "coarsest_code_width", config.spatial.coarsest_code_width);
    }
    if (const Value* s = Section(doc, "metrics")) {
        ReadString(*s, "granularity", config.metrics.granularity);
        ReadSize(*s, "prior_period_lag", config.metrics.prior_period_lag);
        ReadSize(*s, "prior_year_lag", config.metrics.prior_year_lag);
    }
    if (const Value* s = Section(doc, "query")) {
        std::string level_name;
        ReadString(*s, "default_level", level_name);
        if (!level_name.empty()) {
            auto level = ParseLevel(level_name);
            if (!level) {
                return Result<Config>::error("Unknown query.default_level: " + level_name,
                                             Error::Code::INVALID_ARGUMENT);
            }
            config.query.default_level = *level;
        }
        ReadSize(*s, "max_top_k", config.query.max_top_k);
        ReadSize(*s, "default_top_k", config.query.default_top_k);
        ReadDouble(*s, "default_z_threshold", config.query.default_z_threshold);
        ReadDouble(*s, "anomaly_highlight_threshold", config.query.anomaly_highlight_threshold);
        ReadSize(*s, "highlight_limit", config.query.highlight_limit);
    }
    if (const Value* s = Section(doc, "cache")) {
        ReadDouble(*s, "max_distance", config.cache.max_distance);
        ReadSize(*s, "top_k", config.cache.top_k);
        ReadString(*s, "schema_version", config.cache.schema_version);
        ReadSize(*s, "embedding_dimension", config.cache.embedding_dimension);
        ReadMillis(*s, "translator_timeout_ms", config.cache.translator_timeout);
        ReadMillis(*s, "embedding_timeout_ms", config.cache.embedding_timeout);
        ReadSize(*s, "translator_workers", config.cache.translator_workers);
        ReadSize(*s, "translator_queue_capacity", config.cache.translator_queue_capacity);
        ReadString(*s, "persistence_path", config.cache.persistence_path);
    }
    if (const Value* s = Section(doc, "refresh")) {
        ReadMillis(*s, "timeout_ms", config.refresh.timeout);
        ReadMillis(*s, "lock_timeout_ms", config.refresh.lock_timeout);
    }

    auto valid = config.validate();
    if (!valid.ok()) {
        return Result<Config>(valid.error_detail());
    }
    return config;
}

Result<Config> Config::FromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<Config>::error("Cannot open config file: " + path,
                                     Error::Code::NOT_FOUND);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return FromJsonString(buffer.str());
}

} // namespace core
} // namespace geoinsight
