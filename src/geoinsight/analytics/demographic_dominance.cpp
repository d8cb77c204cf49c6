#include "geoinsight/analytics/demographic_dominance.h"

#include <map>
#include <unordered_map>

#include "geoinsight/analytics/statistics.h"

namespace geoinsight {
namespace analytics {

DemographicDominanceCalculator::DemographicDominanceCalculator(const core::MetricsConfig& config)
    : config_(config) {}

std::vector<DominantGroup> DemographicDominanceCalculator::compute(
    const storage::FactSnapshot& snapshot,
    const spatial::SpatialResolver& resolver) const {
    std::unordered_map<std::string, std::string> labels;
    // (label, date) -> group key -> summed value; std::map keeps group keys
    // ordered so the first maximum seen is the lexicographically smallest.
    std::map<std::pair<std::string, core::Date>, std::map<std::string, core::OptionalValue>> cells;

    for (const auto& fact : snapshot.demographics) {
        if (fact.granularity != config_.granularity) continue;
        auto label_it = labels.find(fact.spatial_key);
        if (label_it == labels.end()) {
            label_it = labels.emplace(fact.spatial_key,
                                      resolver.label(fact.spatial_key, core::Level::FINEST)).first;
        }
        auto& groups = cells[std::make_pair(label_it->second, fact.date)];
        AccumulateOptional(groups[fact.sex + "_" + fact.age_group], fact.value);
    }

    std::vector<DominantGroup> out;
    for (const auto& [cell, groups] : cells) {
        const std::string* best_group = nullptr;
        double best_value = 0.0;
        core::OptionalValue total;
        for (const auto& [group, value] : groups) {
            if (!value) continue;
            AccumulateOptional(total, value);
            if (!best_group || *value > best_value) {
                best_group = &group;
                best_value = *value;
            }
        }
        if (!best_group) continue;

        DominantGroup row;
        row.label = cell.first;
        row.date = cell.second;
        row.group = *best_group;
        row.value = best_value;
        row.total = total;
        if (total && *total != 0.0) {
            row.share = best_value / *total;
        }
        out.push_back(std::move(row));
    }
    return out;
}

} // namespace analytics
} // namespace geoinsight
