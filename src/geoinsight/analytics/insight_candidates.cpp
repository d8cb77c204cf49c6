#include "geoinsight/analytics/insight_candidates.h"

#include <iterator>
#include <map>
#include <set>
#include <tuple>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "geoinsight/common/logger.h"

namespace geoinsight {
namespace analytics {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void WriteOptional(JsonWriter& writer, const char* key, const core::OptionalValue& value) {
    writer.Key(key);
    if (value) {
        writer.Double(*value);
    } else {
        writer.Null();
    }
}

void WriteWindow(JsonWriter& writer, const char* key, const MetricWindow& window) {
    writer.Key(key);
    writer.StartObject();
    WriteOptional(writer, "value", window.value);
    WriteOptional(writer, "prior", window.prior);
    WriteOptional(writer, "prior_delta", window.prior_delta);
    WriteOptional(writer, "prior_year", window.prior_year);
    WriteOptional(writer, "prior_year_delta", window.prior_year_delta);
    WriteOptional(writer, "series_mean", window.series_mean);
    WriteOptional(writer, "series_stddev", window.series_stddev);
    WriteOptional(writer, "zscore", window.zscore);
    WriteOptional(writer, "cross_sectional_mean", window.cross_sectional_mean);
    writer.Key("rank");
    if (window.rank) {
        writer.Uint(*window.rank);
    } else {
        writer.Null();
    }
    writer.EndObject();
}

} // namespace

std::vector<const InsightCandidate*> CandidateSet::at_level(core::Level level) const {
    std::vector<const InsightCandidate*> out;
    for (const auto& row : rows) {
        if (row.level == level) out.push_back(&row);
    }
    return out;
}

InsightCandidateAggregator::InsightCandidateAggregator(
    std::shared_ptr<const spatial::SpatialResolver> resolver,
    const core::MetricsConfig& config)
    : resolver_(std::move(resolver)), metrics_(config), dominance_(config) {
    if (!resolver_) {
        throw core::InvalidArgumentError("InsightCandidateAggregator requires a spatial resolver");
    }
}

core::Result<CandidateSet> InsightCandidateAggregator::build(
    const storage::FactSnapshot& snapshot) const {
    return build_levels(snapshot, {core::Level::FINEST, core::Level::INTERMEDIATE,
                                   core::Level::COARSEST});
}

core::Result<CandidateSet> InsightCandidateAggregator::build(
    const storage::FactSnapshot& snapshot, core::Level level) const {
    return build_levels(snapshot, {level});
}

core::Result<CandidateSet> InsightCandidateAggregator::build_levels(
    const storage::FactSnapshot& snapshot,
    const std::vector<core::Level>& levels) const {
    auto keys = storage::CheckPrimaryKeys(snapshot);
    if (!keys.ok()) {
        GEOINSIGHT_ERROR("Fact snapshot v{} rejected: {}", snapshot.version, keys.error());
        return core::Result<CandidateSet>(keys.error_detail());
    }

    CandidateSet set;
    set.snapshot_version = snapshot.version;
    set.sources = snapshot.sources();
    for (const auto& overlap : storage::FindSourceOverlaps(snapshot)) {
        set.warnings.push_back(overlap.describe());
    }
    if (!set.warnings.empty()) {
        GEOINSIGHT_WARN("{} activity groups combine several sources (first: {})",
                        set.warnings.size(), set.warnings.front());
    }

    for (core::Level level : levels) {
        auto rows = build_level(snapshot, level);
        set.rows.insert(set.rows.end(), std::make_move_iterator(rows.begin()),
                        std::make_move_iterator(rows.end()));
    }

    auto unique = CheckUnique(set.rows);
    if (!unique.ok()) {
        GEOINSIGHT_ERROR("Candidate aggregation produced duplicate rows: {}", unique.error());
        return core::Result<CandidateSet>(unique.error_detail());
    }
    return set;
}

std::vector<InsightCandidate> InsightCandidateAggregator::build_level(
    const storage::FactSnapshot& snapshot, core::Level level) const {
    auto metrics = metrics_.run(snapshot, *resolver_, level);

    std::map<std::pair<std::string, core::Date>, DominantGroup> dominant;
    if (level == core::Level::FINEST) {
        for (auto& group : dominance_.compute(snapshot, *resolver_)) {
            auto key = std::make_pair(group.label, group.date);
            dominant.emplace(std::move(key), std::move(group));
        }
    }

    std::vector<InsightCandidate> rows;
    rows.reserve(metrics.size());
    for (auto& row : metrics) {
        InsightCandidate candidate;
        candidate.level = level;
        candidate.label = std::move(row.label);
        candidate.date = row.date;
        candidate.foot_traffic = row.foot_traffic;
        candidate.sales = row.sales;
        candidate.sales_count = row.sales_count;
        auto it = dominant.find(std::make_pair(candidate.label, candidate.date));
        if (it != dominant.end()) {
            candidate.dominant_group = it->second.group;
            candidate.dominant_share = it->second.share;
        }
        rows.push_back(std::move(candidate));
    }
    return rows;
}

core::Result<void> InsightCandidateAggregator::CheckUnique(
    const std::vector<InsightCandidate>& rows) {
    std::set<std::tuple<core::Level, std::string, core::Date>> seen;
    for (const auto& row : rows) {
        if (!seen.emplace(row.level, row.label, row.date).second) {
            return core::Result<void>(core::InternalError(
                std::string("Duplicate insight candidate for ") + core::LevelName(row.level) +
                "/" + row.label + "/" + row.date.to_string()));
        }
    }
    return core::Result<void>();
}

std::string CandidatesToJson(const std::vector<InsightCandidate>& rows) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartArray();
    for (const auto& row : rows) {
        writer.StartObject();
        writer.Key("level");
        writer.String(core::LevelName(row.level));
        writer.Key("label");
        writer.String(row.label.c_str(), static_cast<rapidjson::SizeType>(row.label.size()));
        writer.Key("date");
        writer.String(row.date.to_string().c_str());
        WriteWindow(writer, "foot_traffic", row.foot_traffic);
        WriteWindow(writer, "sales", row.sales);
        WriteOptional(writer, "sales_count", row.sales_count);
        writer.Key("dominant_group");
        if (row.dominant_group) {
            writer.String(row.dominant_group->c_str(),
                          static_cast<rapidjson::SizeType>(row.dominant_group->size()));
        } else {
            writer.Null();
        }
        WriteOptional(writer, "dominant_share", row.dominant_share);
        writer.EndObject();
    }
    writer.EndArray();
    return buffer.GetString();
}

} // namespace analytics
} // namespace geoinsight
