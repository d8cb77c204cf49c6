#ifndef GEOINSIGHT_ANALYTICS_WINDOWED_METRICS_H_
#define GEOINSIGHT_ANALYTICS_WINDOWED_METRICS_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "geoinsight/core/config.h"
#include "geoinsight/core/types.h"
#include "geoinsight/spatial/spatial_resolver.h"
#include "geoinsight/storage/fact_store.h"

namespace geoinsight {
namespace analytics {

/**
 * @brief Windowed statistics of one metric at one (label, date)
 *
 * Every field is optional: an absent field means there was not enough data
 * to compute it, never zero.
 */
struct MetricWindow {
    core::OptionalValue value;
    core::OptionalValue prior;                 // Lag of prior_period_lag rows
    core::OptionalValue prior_delta;           // (value - prior) / prior
    core::OptionalValue prior_year;            // Lag of prior_year_lag rows
    core::OptionalValue prior_year_delta;      // (value - prior_year) / prior_year
    core::OptionalValue series_mean;           // Over the label's whole series
    core::OptionalValue series_stddev;         // Sample std-dev over the series
    core::OptionalValue zscore;
    core::OptionalValue cross_sectional_mean;  // Across labels at this date
    std::optional<uint32_t> rank;              // Dense, descending, at this date
};

/**
 * @brief Facts summed onto one (label, date) of a level
 */
struct AggregatedRow {
    std::string label;
    core::Date date;
    core::OptionalValue foot_traffic;
    core::OptionalValue sales;
    core::OptionalValue sales_count;
};

/**
 * @brief Output row of the windowed metrics engine
 */
struct WindowedMetricsRow {
    core::Level level = core::Level::INTERMEDIATE;
    std::string label;
    core::Date date;
    MetricWindow foot_traffic;
    MetricWindow sales;
    core::OptionalValue sales_count;

    const MetricWindow& metric(core::Metric metric) const {
        return metric == core::Metric::SALES ? sales : foot_traffic;
    }
};

/**
 * @brief Computes MoM/YoY deltas, series statistics, z-scores, cross-sectional
 * means and ranks per spatial label and date
 *
 * Partitioned by label and ordered by date; each partition is scanned once
 * with lag buffers. Pure function of its input, deterministic output ordered
 * by (label, date).
 */
class WindowedMetricsEngine {
public:
    explicit WindowedMetricsEngine(const core::MetricsConfig& config = core::MetricsConfig::Default());

    /**
     * @brief Resolve every fact of the configured granularity to its label at
     * `level` and sum facts sharing a (label, date)
     */
    std::vector<AggregatedRow> aggregate(const storage::FactSnapshot& snapshot,
                                         const spatial::SpatialResolver& resolver,
                                         core::Level level) const;

    /**
     * @brief Window functions over aggregated rows; input order is irrelevant
     * but (label, date) must be unique
     */
    std::vector<WindowedMetricsRow> compute(core::Level level,
                                            const std::vector<AggregatedRow>& rows) const;

    std::vector<WindowedMetricsRow> run(const storage::FactSnapshot& snapshot,
                                        const spatial::SpatialResolver& resolver,
                                        core::Level level) const {
        return compute(level, aggregate(snapshot, resolver, level));
    }

    const core::MetricsConfig& config() const { return config_; }

private:
    core::MetricsConfig config_;
};

} // namespace analytics
} // namespace geoinsight

#endif // GEOINSIGHT_ANALYTICS_WINDOWED_METRICS_H_
