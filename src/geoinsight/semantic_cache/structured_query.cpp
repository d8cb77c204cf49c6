#include "geoinsight/semantic_cache/structured_query.h"

#include <cmath>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "geoinsight/core/types.h"

namespace geoinsight {
namespace semantic_cache {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void WriteString(JsonWriter& writer, const char* key, const std::optional<std::string>& value) {
    if (!value) return;
    writer.Key(key);
    writer.String(value->c_str(), static_cast<rapidjson::SizeType>(value->size()));
}

core::Result<std::optional<std::string>> ReadString(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return std::optional<std::string>();
    }
    if (!it->value.IsString()) {
        return core::Result<std::optional<std::string>>::error(
            std::string("Structured query field '") + key + "' must be a string",
            core::Error::Code::INVALID_ARGUMENT);
    }
    return std::optional<std::string>(
        std::string(it->value.GetString(), it->value.GetStringLength()));
}

} // namespace

const char* OperationName(Operation operation) {
    switch (operation) {
        case Operation::COMPARE_DOMAINS: return "compare_domains";
        case Operation::GET_RANKINGS: return "get_rankings";
        case Operation::DETECT_ANOMALY: return "detect_anomaly";
        case Operation::GET_ADVANCED_INSIGHT: return "get_advanced_insight";
    }
    return "unknown";
}

std::optional<Operation> ParseOperation(const std::string& name) {
    if (name == "compare_domains") return Operation::COMPARE_DOMAINS;
    if (name == "get_rankings") return Operation::GET_RANKINGS;
    if (name == "detect_anomaly") return Operation::DETECT_ANOMALY;
    if (name == "get_advanced_insight") return Operation::GET_ADVANCED_INSIGHT;
    return std::nullopt;
}

StructuredQuery StructuredQuery::Default() {
    StructuredQuery query;
    query.operation = Operation::COMPARE_DOMAINS;
    query.domains = {"population", "sales"};
    return query;
}

std::string StructuredQuery::ToJson() const {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.Key("operation");
    writer.String(OperationName(operation));
    WriteString(writer, "region", region);
    WriteString(writer, "period_from", period_from);
    WriteString(writer, "period_to", period_to);
    WriteString(writer, "period", period);
    if (!domains.empty()) {
        writer.Key("domains");
        writer.StartArray();
        for (const auto& domain : domains) {
            writer.String(domain.c_str(), static_cast<rapidjson::SizeType>(domain.size()));
        }
        writer.EndArray();
    }
    WriteString(writer, "metric", metric);
    if (top_k) {
        writer.Key("top_k");
        writer.Uint(*top_k);
    }
    if (z_threshold) {
        writer.Key("z_threshold");
        writer.Double(*z_threshold);
    }
    WriteString(writer, "level", level);
    writer.EndObject();
    return buffer.GetString();
}

core::Result<StructuredQuery> StructuredQuery::FromJson(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return core::Result<StructuredQuery>::error(
            std::string("Structured query parse error: ") +
                rapidjson::GetParseError_En(doc.GetParseError()),
            core::Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return core::Result<StructuredQuery>::error("Structured query must be a JSON object",
                                                    core::Error::Code::INVALID_ARGUMENT);
    }

    StructuredQuery query;
    auto op = doc.FindMember("operation");
    if (op == doc.MemberEnd() || !op->value.IsString()) {
        return core::Result<StructuredQuery>::error("Structured query requires 'operation'",
                                                    core::Error::Code::INVALID_ARGUMENT);
    }
    auto operation = ParseOperation(op->value.GetString());
    if (!operation) {
        return core::Result<StructuredQuery>::error(
            std::string("Unknown operation: ") + op->value.GetString(),
            core::Error::Code::INVALID_ARGUMENT);
    }
    query.operation = *operation;

    struct StringField {
        const char* key;
        std::optional<std::string> StructuredQuery::*member;
    };
    const StringField fields[] = {
        {"region", &StructuredQuery::region},
        {"period_from", &StructuredQuery::period_from},
        {"period_to", &StructuredQuery::period_to},
        {"period", &StructuredQuery::period},
        {"metric", &StructuredQuery::metric},
        {"level", &StructuredQuery::level},
    };
    for (const auto& field : fields) {
        auto value = ReadString(doc, field.key);
        if (!value.ok()) return core::Result<StructuredQuery>(value.error_detail());
        query.*field.member = value.value();
    }

    auto domains = doc.FindMember("domains");
    if (domains != doc.MemberEnd() && !domains->value.IsNull()) {
        if (!domains->value.IsArray()) {
            return core::Result<StructuredQuery>::error("'domains' must be an array",
                                                        core::Error::Code::INVALID_ARGUMENT);
        }
        for (const auto& domain : domains->value.GetArray()) {
            if (!domain.IsString()) {
                return core::Result<StructuredQuery>::error("'domains' entries must be strings",
                                                            core::Error::Code::INVALID_ARGUMENT);
            }
            query.domains.emplace_back(domain.GetString(), domain.GetStringLength());
        }
    }

    auto top_k = doc.FindMember("top_k");
    if (top_k != doc.MemberEnd() && !top_k->value.IsNull()) {
        if (!top_k->value.IsUint()) {
            return core::Result<StructuredQuery>::error("'top_k' must be a non-negative integer",
                                                        core::Error::Code::INVALID_ARGUMENT);
        }
        query.top_k = top_k->value.GetUint();
    }

    auto z = doc.FindMember("z_threshold");
    if (z != doc.MemberEnd() && !z->value.IsNull()) {
        if (!z->value.IsNumber()) {
            return core::Result<StructuredQuery>::error("'z_threshold' must be a number",
                                                        core::Error::Code::INVALID_ARGUMENT);
        }
        query.z_threshold = z->value.GetDouble();
    }

    return query;
}

core::Result<void> StructuredQuery::validate(size_t max_top_k) const {
    for (const auto& domain : domains) {
        if (!core::DomainMetric(domain)) {
            return core::Result<void>(core::InvalidArgumentError("Unknown domain: " + domain));
        }
    }
    if (metric && !core::ParseMetric(*metric)) {
        return core::Result<void>(core::InvalidArgumentError("Unknown metric: " + *metric));
    }
    if (level && !core::ParseLevel(*level)) {
        return core::Result<void>(core::InvalidArgumentError("Unknown level: " + *level));
    }
    if (top_k && (*top_k < 1 || *top_k > max_top_k)) {
        return core::Result<void>(core::InvalidArgumentError(
            "top_k must be within [1, " + std::to_string(max_top_k) + "]"));
    }
    if (z_threshold && !(std::isfinite(*z_threshold) && *z_threshold > 0.0)) {
        return core::Result<void>(core::InvalidArgumentError("z_threshold must be > 0"));
    }
    for (const auto* value : {&period, &period_from, &period_to}) {
        if (*value) {
            auto parsed = core::ParsePeriod(**value);
            if (!parsed.ok()) return core::Result<void>(parsed.error_detail());
        }
    }
    return core::Result<void>();
}

bool StructuredQuery::operator==(const StructuredQuery& other) const {
    return operation == other.operation && region == other.region &&
           period_from == other.period_from && period_to == other.period_to &&
           period == other.period && domains == other.domains && metric == other.metric &&
           top_k == other.top_k && z_threshold == other.z_threshold && level == other.level;
}

} // namespace semantic_cache
} // namespace geoinsight
