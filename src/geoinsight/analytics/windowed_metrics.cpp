#include "geoinsight/analytics/windowed_metrics.h"

#include <algorithm>
#include <map>
#include <unordered_map>

#include "geoinsight/analytics/statistics.h"
#include "geoinsight/common/logger.h"

namespace geoinsight {
namespace analytics {

namespace {

using MetricAccessor = MetricWindow WindowedMetricsRow::*;
using ValueAccessor = core::OptionalValue AggregatedRow::*;

struct MetricColumn {
    ValueAccessor input;
    MetricAccessor output;
};

const MetricColumn kColumns[] = {
    {&AggregatedRow::foot_traffic, &WindowedMetricsRow::foot_traffic},
    {&AggregatedRow::sales, &WindowedMetricsRow::sales},
};

// Lagged value within one partition; absent before the window is full.
core::OptionalValue Lag(const std::vector<const AggregatedRow*>& partition, size_t i,
                        size_t lag, ValueAccessor column) {
    if (i < lag) return std::nullopt;
    return partition[i - lag]->*column;
}

void ComputeRanks(std::vector<WindowedMetricsRow>& out, MetricAccessor metric) {
    std::map<core::Date, std::vector<size_t>> by_date;
    for (size_t i = 0; i < out.size(); ++i) {
        if ((out[i].*metric).value) {
            by_date[out[i].date].push_back(i);
        }
    }
    for (auto& [date, indices] : by_date) {
        std::sort(indices.begin(), indices.end(), [&](size_t a, size_t b) {
            return *(out[a].*metric).value > *(out[b].*metric).value;
        });
        uint32_t rank = 0;
        core::OptionalValue previous;
        for (size_t idx : indices) {
            double value = *(out[idx].*metric).value;
            if (!previous || value != *previous) {
                ++rank;
                previous = value;
            }
            (out[idx].*metric).rank = rank;
        }
    }
}

} // namespace

WindowedMetricsEngine::WindowedMetricsEngine(const core::MetricsConfig& config)
    : config_(config) {
    if (config_.prior_period_lag == 0 || config_.prior_year_lag == 0) {
        throw core::InvalidArgumentError("Metric lags must be positive");
    }
}

std::vector<AggregatedRow> WindowedMetricsEngine::aggregate(
    const storage::FactSnapshot& snapshot,
    const spatial::SpatialResolver& resolver,
    core::Level level) const {
    std::unordered_map<std::string, std::string> labels;
    std::map<std::pair<std::string, core::Date>, AggregatedRow> groups;
    size_t skipped = 0;

    for (const auto& fact : snapshot.activity) {
        if (fact.granularity != config_.granularity) {
            ++skipped;
            continue;
        }
        auto label_it = labels.find(fact.spatial_key);
        if (label_it == labels.end()) {
            label_it = labels.emplace(fact.spatial_key,
                                      resolver.label(fact.spatial_key, level)).first;
        }

        auto key = std::make_pair(label_it->second, fact.date);
        auto group_it = groups.find(key);
        if (group_it == groups.end()) {
            AggregatedRow row;
            row.label = label_it->second;
            row.date = fact.date;
            group_it = groups.emplace(key, std::move(row)).first;
        }
        AccumulateOptional(group_it->second.foot_traffic, fact.foot_traffic);
        AccumulateOptional(group_it->second.sales, fact.sales);
        AccumulateOptional(group_it->second.sales_count, fact.sales_count);
    }

    if (skipped > 0) {
        GEOINSIGHT_DEBUG("Skipped {} activity facts not at '{}' granularity", skipped,
                         config_.granularity);
    }

    std::vector<AggregatedRow> rows;
    rows.reserve(groups.size());
    for (auto& entry : groups) {
        rows.push_back(std::move(entry.second));
    }
    return rows;
}

std::vector<WindowedMetricsRow> WindowedMetricsEngine::compute(
    core::Level level,
    const std::vector<AggregatedRow>& rows) const {
    // Partition by label, order by date
    std::map<std::string, std::vector<const AggregatedRow*>> partitions;
    for (const auto& row : rows) {
        partitions[row.label].push_back(&row);
    }
    for (auto& entry : partitions) {
        std::sort(entry.second.begin(), entry.second.end(),
                  [](const AggregatedRow* a, const AggregatedRow* b) { return a->date < b->date; });
    }

    std::vector<WindowedMetricsRow> out;
    out.reserve(rows.size());

    for (const auto& [label, partition] : partitions) {
        const size_t first = out.size();
        for (const AggregatedRow* row : partition) {
            WindowedMetricsRow result;
            result.level = level;
            result.label = label;
            result.date = row->date;
            result.sales_count = row->sales_count;
            out.push_back(std::move(result));
        }

        for (const auto& column : kColumns) {
            RunningStats stats;
            for (const AggregatedRow* row : partition) {
                stats.add(row->*column.input);
            }
            const core::OptionalValue mean = stats.mean();
            const core::OptionalValue stddev = stats.sample_stddev();

            for (size_t i = 0; i < partition.size(); ++i) {
                MetricWindow& window = out[first + i].*column.output;
                window.value = partition[i]->*column.input;
                window.prior = Lag(partition, i, config_.prior_period_lag, column.input);
                window.prior_delta = RelativeChange(window.value, window.prior);
                window.prior_year = Lag(partition, i, config_.prior_year_lag, column.input);
                window.prior_year_delta = RelativeChange(window.value, window.prior_year);
                window.series_mean = mean;
                window.series_stddev = stddev;
                window.zscore = ZScore(window.value, mean, stddev);
            }
        }
    }

    // Cross-sectional statistics per date
    for (const auto& column : kColumns) {
        std::map<core::Date, RunningStats> by_date;
        for (const auto& row : out) {
            by_date[row.date].add((row.*column.output).value);
        }
        for (auto& row : out) {
            (row.*column.output).cross_sectional_mean = by_date[row.date].mean();
        }
        ComputeRanks(out, column.output);
    }

    return out;
}

} // namespace analytics
} // namespace geoinsight
