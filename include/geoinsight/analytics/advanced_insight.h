#ifndef GEOINSIGHT_ANALYTICS_ADVANCED_INSIGHT_H_
#define GEOINSIGHT_ANALYTICS_ADVANCED_INSIGHT_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "geoinsight/analytics/insight_candidates.h"
#include "geoinsight/core/call_options.h"
#include "geoinsight/core/config.h"
#include "geoinsight/core/result.h"
#include "geoinsight/storage/fact_store.h"

namespace geoinsight {
namespace analytics {

/**
 * @brief Cross-metric statistics of one spatial label over its whole series
 */
struct AdvancedInsight {
    core::Level level = core::Level::INTERMEDIATE;
    std::string label;
    core::OptionalValue correlation;          // Pearson r(sales, foot_traffic)
    core::OptionalValue slope;                // OLS slope of sales on foot_traffic
    core::OptionalValue sales_impact;         // Mean |z| of sales
    core::OptionalValue foot_traffic_impact;  // Mean |z| of foot_traffic
    size_t sample_count = 0;                  // Rows with both metrics present
};

/**
 * @brief One published refresh result; immutable once published
 */
struct AdvancedInsightGeneration {
    uint64_t generation = 0;
    core::Timestamp refreshed_at = 0;
    uint64_t snapshot_version = 0;
    std::vector<AdvancedInsight> insights;  // Ordered by (level, label)
    std::vector<std::string> sources;
    std::vector<std::string> warnings;

    const AdvancedInsight* find(core::Level level, const std::string& label) const;
};

using GenerationPtr = std::shared_ptr<const AdvancedInsightGeneration>;

/**
 * @brief Batch correlation and impact aggregator
 *
 * Refreshes are serialized by a timed lock and published with an atomic
 * pointer swap, so readers observe either the previous generation or the new
 * one in full. A refresh that fails, times out or is cancelled leaves the
 * last good generation in place.
 */
class AdvancedInsightAggregator {
public:
    struct Stats {
        uint64_t refreshes = 0;
        uint64_t failures = 0;
    };

    AdvancedInsightAggregator(std::shared_ptr<const storage::FactStore> store,
                              std::shared_ptr<const InsightCandidateAggregator> candidates,
                              const core::RefreshConfig& config = core::RefreshConfig::Default());

    /**
     * @brief Recompute from the current fact snapshot and publish
     *
     * The effective deadline is the earlier of the caller's and the
     * configured refresh timeout. Fails with TIMEOUT when another refresh
     * holds the lock beyond the configured lock timeout.
     */
    core::Result<GenerationPtr> refresh(const core::CallOptions& options = core::CallOptions());

    /**
     * @brief Last published generation; null before the first refresh
     */
    GenerationPtr current() const;

    Stats stats() const;

    /**
     * @brief Group candidate rows by (level, label) and compute statistics
     */
    static core::Result<std::vector<AdvancedInsight>> Compute(
        const std::vector<InsightCandidate>& rows,
        const core::CallOptions& options = core::CallOptions());

private:
    core::Result<GenerationPtr> run_refresh(const core::CallOptions& options);

    std::shared_ptr<const storage::FactStore> store_;
    std::shared_ptr<const InsightCandidateAggregator> candidates_;
    core::RefreshConfig config_;

    std::timed_mutex refresh_mutex_;
    std::shared_ptr<const AdvancedInsightGeneration> current_;
    std::atomic<uint64_t> refreshes_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace analytics
} // namespace geoinsight

#endif // GEOINSIGHT_ANALYTICS_ADVANCED_INSIGHT_H_
