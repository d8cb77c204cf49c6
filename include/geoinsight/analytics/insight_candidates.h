#ifndef GEOINSIGHT_ANALYTICS_INSIGHT_CANDIDATES_H_
#define GEOINSIGHT_ANALYTICS_INSIGHT_CANDIDATES_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geoinsight/analytics/demographic_dominance.h"
#include "geoinsight/analytics/windowed_metrics.h"
#include "geoinsight/core/config.h"
#include "geoinsight/core/result.h"
#include "geoinsight/spatial/spatial_resolver.h"
#include "geoinsight/storage/fact_store.h"

namespace geoinsight {
namespace analytics {

/**
 * @brief Unified per-(level, label, date) analytical row
 *
 * Derived on demand from the current fact snapshot; never stored.
 * Demographic fields are only populated at the finest level.
 */
struct InsightCandidate {
    core::Level level = core::Level::INTERMEDIATE;
    std::string label;
    core::Date date;
    MetricWindow foot_traffic;
    MetricWindow sales;
    core::OptionalValue sales_count;
    std::optional<std::string> dominant_group;
    core::OptionalValue dominant_share;

    const MetricWindow& metric(core::Metric metric) const {
        return metric == core::Metric::SALES ? sales : foot_traffic;
    }
};

/**
 * @brief Candidate rows plus the data-quality context they were built with
 */
struct CandidateSet {
    std::vector<InsightCandidate> rows;   // Ordered by (level, label, date)
    std::vector<std::string> warnings;    // Source overlaps and similar notices
    std::vector<std::string> sources;     // Sources present in the snapshot
    uint64_t snapshot_version = 0;

    /**
     * @brief Rows of one level, still ordered by (label, date)
     */
    std::vector<const InsightCandidate*> at_level(core::Level level) const;
};

/**
 * @brief Builds the unified candidate collection across all three levels
 */
class InsightCandidateAggregator {
public:
    InsightCandidateAggregator(std::shared_ptr<const spatial::SpatialResolver> resolver,
                               const core::MetricsConfig& config = core::MetricsConfig::Default());

    /**
     * @brief Candidates for every level
     *
     * Fails with INTERNAL when the snapshot holds duplicate primary keys or
     * the output would hold two rows for one (level, label, date).
     */
    core::Result<CandidateSet> build(const storage::FactSnapshot& snapshot) const;

    /**
     * @brief Candidates for a single level
     */
    core::Result<CandidateSet> build(const storage::FactSnapshot& snapshot, core::Level level) const;

    const spatial::SpatialResolver& resolver() const { return *resolver_; }

    /**
     * @brief INTERNAL error if two rows share (level, label, date)
     */
    static core::Result<void> CheckUnique(const std::vector<InsightCandidate>& rows);

private:
    core::Result<CandidateSet> build_levels(const storage::FactSnapshot& snapshot,
                                            const std::vector<core::Level>& levels) const;
    std::vector<InsightCandidate> build_level(const storage::FactSnapshot& snapshot,
                                              core::Level level) const;

    std::shared_ptr<const spatial::SpatialResolver> resolver_;
    WindowedMetricsEngine metrics_;
    DemographicDominanceCalculator dominance_;
};

/**
 * @brief Canonical JSON rendering of candidate rows (absent fields as null)
 */
std::string CandidatesToJson(const std::vector<InsightCandidate>& rows);

} // namespace analytics
} // namespace geoinsight

#endif // GEOINSIGHT_ANALYTICS_INSIGHT_CANDIDATES_H_
