#include "geoinsight/query/response_writer.h"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace geoinsight {
namespace query {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void WriteString(JsonWriter& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void WriteNumber(JsonWriter& writer, const char* key, const core::OptionalValue& value) {
    writer.Key(key);
    if (value) {
        writer.Double(*value);
    } else {
        writer.Null();
    }
}

void WriteDate(JsonWriter& writer, const char* key, const std::optional<core::Date>& date) {
    writer.Key(key);
    if (date) {
        WriteString(writer, date->to_string());
    } else {
        writer.Null();
    }
}

void WriteStrings(JsonWriter& writer, const char* key, const std::vector<std::string>& values) {
    writer.Key(key);
    writer.StartArray();
    for (const auto& value : values) WriteString(writer, value);
    writer.EndArray();
}

void WriteMetadata(JsonWriter& writer, const ResponseMetadata& metadata) {
    writer.Key("metadata");
    writer.StartObject();
    WriteStrings(writer, "sources", metadata.sources);
    writer.Key("generated_at");
    WriteString(writer, core::FormatTimestamp(metadata.generated_at));
    WriteDate(writer, "period_from", metadata.period_from);
    WriteDate(writer, "period_to", metadata.period_to);
    writer.Key("level");
    writer.String(core::LevelName(metadata.level));
    if (metadata.refreshed_at) {
        writer.Key("refreshed_at");
        WriteString(writer, core::FormatTimestamp(*metadata.refreshed_at));
    }
    if (metadata.generation) {
        writer.Key("generation");
        writer.Uint64(*metadata.generation);
    }
    WriteStrings(writer, "warnings", metadata.warnings);
    writer.EndObject();
}

void WriteExtreme(JsonWriter& writer, const char* key, const std::optional<ExtremePoint>& point) {
    writer.Key(key);
    if (!point) {
        writer.Null();
        return;
    }
    writer.StartObject();
    writer.Key("date");
    WriteString(writer, point->date.to_string());
    writer.Key("value");
    writer.Double(point->value);
    WriteNumber(writer, "series_value", point->series_value);
    writer.EndObject();
}

void WriteHighlights(JsonWriter& writer, const char* key, const MetricHighlights& highlights) {
    writer.Key(key);
    writer.StartObject();
    WriteExtreme(writer, "mom_max", highlights.mom_max);
    WriteExtreme(writer, "mom_min", highlights.mom_min);
    WriteExtreme(writer, "yoy_max", highlights.yoy_max);
    WriteExtreme(writer, "yoy_min", highlights.yoy_min);
    writer.Key("anomalies");
    writer.StartArray();
    for (const auto& anomaly : highlights.anomalies) {
        writer.StartObject();
        writer.Key("date");
        WriteString(writer, anomaly.date.to_string());
        writer.Key("zscore");
        writer.Double(anomaly.zscore);
        WriteNumber(writer, "value", anomaly.value);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
}

std::string Finish(rapidjson::StringBuffer& buffer) {
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace

std::string ResponseWriter::Write(const CompareDomainsResult& result) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.Key("operation");
    writer.String("compare_domains");
    writer.Key("data");
    writer.StartObject();
    writer.Key("region");
    if (result.region) {
        WriteString(writer, *result.region);
    } else {
        writer.Null();
    }
    WriteDate(writer, "date", result.date);
    writer.Key("comparisons");
    writer.StartArray();
    for (const auto& comparison : result.comparisons) {
        writer.StartObject();
        writer.Key("domain");
        WriteString(writer, comparison.domain);
        writer.Key("metric");
        writer.String(core::MetricName(comparison.metric));
        WriteNumber(writer, "value", comparison.value);
        WriteNumber(writer, "change_rate", comparison.change_rate);
        WriteNumber(writer, "yoy_change_rate", comparison.year_over_year);
        writer.Key("trend");
        WriteString(writer, comparison.trend);
        writer.Key("signal");
        WriteString(writer, comparison.signal);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
    WriteMetadata(writer, result.metadata);
    writer.EndObject();
    return Finish(buffer);
}

std::string ResponseWriter::Write(const RankingsResult& result) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.Key("operation");
    writer.String("get_rankings");
    writer.Key("data");
    writer.StartObject();
    writer.Key("metric");
    writer.String(core::MetricName(result.metric));
    WriteDate(writer, "date", result.date);
    writer.Key("rankings");
    writer.StartArray();
    for (const auto& entry : result.rankings) {
        writer.StartObject();
        writer.Key("label");
        WriteString(writer, entry.label);
        WriteNumber(writer, "value", entry.value);
        writer.Key("rank");
        if (entry.rank) {
            writer.Uint(*entry.rank);
        } else {
            writer.Null();
        }
        WriteNumber(writer, "change_rate", entry.change_rate);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
    WriteMetadata(writer, result.metadata);
    writer.EndObject();
    return Finish(buffer);
}

std::string ResponseWriter::Write(const AnomalyResult& result) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.Key("operation");
    writer.String("detect_anomaly");
    writer.Key("data");
    writer.StartObject();
    writer.Key("region");
    WriteString(writer, result.region);
    writer.Key("metric");
    writer.String(core::MetricName(result.metric));
    WriteDate(writer, "date", result.date);
    WriteNumber(writer, "value", result.value);
    WriteNumber(writer, "mean", result.series_mean);
    WriteNumber(writer, "stddev", result.series_stddev);
    WriteNumber(writer, "zscore", result.zscore);
    writer.Key("threshold");
    writer.Double(result.threshold);
    writer.Key("is_anomaly");
    writer.Bool(result.is_anomaly);
    writer.EndObject();
    WriteMetadata(writer, result.metadata);
    writer.EndObject();
    return Finish(buffer);
}

std::string ResponseWriter::Write(const AdvancedInsightResult& result) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.Key("operation");
    writer.String("get_advanced_insight");
    writer.Key("data");
    writer.StartObject();
    writer.Key("region");
    WriteString(writer, result.region);
    WriteStrings(writer, "domains", result.domains);
    writer.Key("correlation");
    writer.StartObject();
    WriteNumber(writer, "sales_vs_foot_traffic",
                result.insight ? result.insight->correlation : core::OptionalValue());
    writer.EndObject();
    writer.Key("impact");
    writer.StartObject();
    WriteNumber(writer, "sales_impact_slope",
                result.insight ? result.insight->slope : core::OptionalValue());
    WriteNumber(writer, "sales_impact_score",
                result.insight ? result.insight->sales_impact : core::OptionalValue());
    WriteNumber(writer, "foot_traffic_impact_score",
                result.insight ? result.insight->foot_traffic_impact : core::OptionalValue());
    writer.EndObject();
    writer.Key("sample_count");
    writer.Uint64(result.insight ? result.insight->sample_count : 0);
    writer.EndObject();
    WriteMetadata(writer, result.metadata);
    writer.EndObject();
    return Finish(buffer);
}

std::string ResponseWriter::Write(const SeriesSummary& result) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.Key("operation");
    writer.String("summarize_series");
    writer.Key("data");
    writer.StartObject();
    writer.Key("region");
    WriteString(writer, result.region);
    WriteDate(writer, "date_min", result.date_min);
    WriteDate(writer, "date_max", result.date_max);
    writer.Key("series");
    writer.StartArray();
    for (const auto& row : result.series) {
        writer.StartObject();
        writer.Key("date");
        WriteString(writer, row.date.to_string());
        WriteNumber(writer, "foot_traffic", row.foot_traffic.value);
        WriteNumber(writer, "foot_traffic_mom", row.foot_traffic.prior_delta);
        WriteNumber(writer, "foot_traffic_yoy", row.foot_traffic.prior_year_delta);
        WriteNumber(writer, "foot_traffic_zscore", row.foot_traffic.zscore);
        WriteNumber(writer, "sales", row.sales.value);
        WriteNumber(writer, "sales_mom", row.sales.prior_delta);
        WriteNumber(writer, "sales_yoy", row.sales.prior_year_delta);
        WriteNumber(writer, "sales_zscore", row.sales.zscore);
        WriteNumber(writer, "sales_count", row.sales_count);
        writer.EndObject();
    }
    writer.EndArray();
    writer.Key("highlights");
    writer.StartObject();
    WriteHighlights(writer, "foot_traffic", result.foot_traffic);
    WriteHighlights(writer, "sales", result.sales);
    writer.EndObject();
    writer.Key("dominant_group");
    if (result.dominant_group) {
        WriteString(writer, *result.dominant_group);
    } else {
        writer.Null();
    }
    WriteNumber(writer, "dominant_share", result.dominant_share);
    writer.EndObject();
    WriteMetadata(writer, result.metadata);
    writer.EndObject();
    return Finish(buffer);
}

std::string ResponseWriter::WriteError(const core::Error& error) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.Key("error");
    writer.StartObject();
    writer.Key("code");
    writer.String(core::CodeName(error.code()));
    writer.Key("message");
    writer.String(error.what());
    writer.Key("retryable");
    writer.Bool(error.retryable());
    writer.EndObject();
    writer.EndObject();
    return Finish(buffer);
}

} // namespace query
} // namespace geoinsight
