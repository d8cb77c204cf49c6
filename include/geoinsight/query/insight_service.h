#ifndef GEOINSIGHT_QUERY_INSIGHT_SERVICE_H_
#define GEOINSIGHT_QUERY_INSIGHT_SERVICE_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geoinsight/analytics/advanced_insight.h"
#include "geoinsight/analytics/insight_candidates.h"
#include "geoinsight/core/config.h"
#include "geoinsight/core/result.h"
#include "geoinsight/core/types.h"
#include "geoinsight/storage/fact_store.h"

namespace geoinsight {
namespace query {

/**
 * @brief Provenance attached to every response
 */
struct ResponseMetadata {
    std::vector<std::string> sources;
    core::Timestamp generated_at = 0;
    std::optional<core::Date> period_from;   // Range actually applied
    std::optional<core::Date> period_to;
    core::Level level = core::Level::INTERMEDIATE;
    std::optional<core::Timestamp> refreshed_at;  // Advanced insights only
    std::optional<uint64_t> generation;           // Advanced insights only
    std::vector<std::string> warnings;
};

struct DomainComparison {
    std::string domain;
    core::Metric metric = core::Metric::FOOT_TRAFFIC;
    core::OptionalValue value;
    core::OptionalValue change_rate;  // Month over month
    core::OptionalValue year_over_year;
    std::string trend;                // up | down | flat
    std::string signal;               // strong_change | moderate_change | minor_change | insufficient_data
};

struct CompareDomainsResult {
    std::optional<std::string> region;  // Absent: cross-sectional mean of every unit
    std::optional<core::Date> date;     // Latest date with data in the range
    std::vector<DomainComparison> comparisons;
    ResponseMetadata metadata;
};

struct RankingEntry {
    std::string label;
    core::OptionalValue value;
    std::optional<uint32_t> rank;
    core::OptionalValue change_rate;
};

struct RankingsResult {
    core::Metric metric = core::Metric::FOOT_TRAFFIC;
    std::optional<core::Date> date;
    std::vector<RankingEntry> rankings;
    ResponseMetadata metadata;
};

struct AnomalyResult {
    std::string region;
    core::Metric metric = core::Metric::FOOT_TRAFFIC;
    std::optional<core::Date> date;
    core::OptionalValue value;
    core::OptionalValue series_mean;
    core::OptionalValue series_stddev;
    core::OptionalValue zscore;
    double threshold = 0.0;
    bool is_anomaly = false;
    ResponseMetadata metadata;
};

struct AdvancedInsightResult {
    std::string region;
    std::vector<std::string> domains;
    std::optional<analytics::AdvancedInsight> insight;
    ResponseMetadata metadata;
};

struct ExtremePoint {
    core::Date date;
    double value = 0.0;               // The delta that is extreme
    core::OptionalValue series_value; // Metric value at that date
};

struct AnomalyPoint {
    core::Date date;
    double zscore = 0.0;
    core::OptionalValue value;
};

struct MetricHighlights {
    std::optional<ExtremePoint> mom_max;
    std::optional<ExtremePoint> mom_min;
    std::optional<ExtremePoint> yoy_max;
    std::optional<ExtremePoint> yoy_min;
    std::vector<AnomalyPoint> anomalies;  // |z| descending
};

struct SeriesSummary {
    std::string region;
    std::optional<core::Date> date_min;
    std::optional<core::Date> date_max;
    std::vector<analytics::InsightCandidate> series;  // Latest rows, oldest first
    MetricHighlights foot_traffic;
    MetricHighlights sales;
    std::optional<std::string> dominant_group;
    core::OptionalValue dominant_share;
    ResponseMetadata metadata;
};

/**
 * @brief The analytical operations exposed to the adapter layer
 *
 * Arguments are validated before any fact is read; violations are
 * INVALID_ARGUMENT. Empty strings mean "not given". Missing data is reported
 * through absent fields and metadata warnings, never as an error.
 */
class InsightService {
public:
    InsightService(std::shared_ptr<const storage::FactStore> store,
                   std::shared_ptr<const analytics::InsightCandidateAggregator> candidates,
                   std::shared_ptr<const analytics::AdvancedInsightAggregator> advanced,
                   const core::QueryConfig& config = core::QueryConfig::Default());

    /**
     * @brief Month-over-month change per domain at the latest date in range
     */
    core::Result<CompareDomainsResult> compare_domains(const std::string& region,
                                                       const std::string& period_from,
                                                       const std::string& period_to,
                                                       const std::vector<std::string>& domains,
                                                       const std::string& level = "") const;

    /**
     * @brief Top-k units by metric at the latest date in the period
     */
    core::Result<RankingsResult> get_rankings(const std::string& metric,
                                              const std::string& period,
                                              size_t top_k,
                                              const std::string& level = "") const;

    core::Result<AnomalyResult> detect_anomaly(const std::string& region,
                                               const std::string& domain,
                                               const std::string& period,
                                               double z_threshold,
                                               const std::string& level = "") const;

    /**
     * @brief Correlation and impact from the last refreshed generation
     */
    core::Result<AdvancedInsightResult> get_advanced_insight(const std::string& region,
                                                             const std::string& period,
                                                             const std::vector<std::string>& domains,
                                                             const std::string& level = "") const;

    /**
     * @brief Recent series and notable points of one unit
     */
    core::Result<SeriesSummary> summarize_series(const std::string& region,
                                                 const std::string& level = "") const;

    const core::QueryConfig& config() const { return config_; }

private:
    core::Result<core::Level> resolve_level(const std::string& level) const;
    core::Result<analytics::CandidateSet> load(core::Level level) const;
    ResponseMetadata metadata(const analytics::CandidateSet& set, core::Level level) const;
    std::string match_region(const analytics::CandidateSet& set, const std::string& region,
                             core::Level level) const;

    std::shared_ptr<const storage::FactStore> store_;
    std::shared_ptr<const analytics::InsightCandidateAggregator> candidates_;
    std::shared_ptr<const analytics::AdvancedInsightAggregator> advanced_;
    core::QueryConfig config_;
};

/**
 * @brief "up", "down" or "flat" (absent change counts as flat)
 */
const char* TrendLabel(const core::OptionalValue& change_rate);

/**
 * @brief Magnitude bucket of a change rate
 */
const char* SignalLabel(const core::OptionalValue& change_rate);

} // namespace query
} // namespace geoinsight

#endif // GEOINSIGHT_QUERY_INSIGHT_SERVICE_H_
