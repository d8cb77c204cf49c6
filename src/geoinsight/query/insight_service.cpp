#include "geoinsight/query/insight_service.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <utility>

#include "geoinsight/analytics/statistics.h"
#include "geoinsight/common/logger.h"

namespace geoinsight {
namespace query {

namespace {

using core::Date;
using core::OptionalValue;
using Bounds = std::pair<std::optional<Date>, std::optional<Date>>;
using RowList = std::vector<const analytics::InsightCandidate*>;

constexpr size_t kSeriesWindow = 12;

bool InBounds(const Date& date, const Bounds& bounds) {
    if (bounds.first && date < *bounds.first) return false;
    if (bounds.second && date > *bounds.second) return false;
    return true;
}

// Rows of one label inside the bounds, oldest first.
RowList RowsOf(const RowList& rows, const std::string& label, const Bounds& bounds) {
    RowList out;
    for (const auto* row : rows) {
        if (row->label == label && InBounds(row->date, bounds)) out.push_back(row);
    }
    return out;
}

std::optional<Date> LatestDate(const RowList& rows, const Bounds& bounds) {
    std::optional<Date> latest;
    for (const auto* row : rows) {
        if (!InBounds(row->date, bounds)) continue;
        if (!latest || row->date > *latest) latest = row->date;
    }
    return latest;
}

void ApplyPeriod(ResponseMetadata& metadata, const std::optional<Date>& date,
                 const Bounds& bounds) {
    if (date) {
        metadata.period_from = date;
        metadata.period_to = date;
    } else {
        metadata.period_from = bounds.first;
        metadata.period_to = bounds.second;
    }
}

std::string NoDataWarning(const std::string& what, const Bounds& bounds) {
    std::string message = "No data for " + what;
    if (bounds.first || bounds.second) {
        message += " between " + (bounds.first ? bounds.first->to_string() : std::string("-")) +
                   " and " + (bounds.second ? bounds.second->to_string() : std::string("-"));
    }
    return message;
}

core::Result<std::vector<std::pair<std::string, core::Metric>>> ParseDomains(
    const std::vector<std::string>& domains) {
    using Out = std::vector<std::pair<std::string, core::Metric>>;
    if (domains.empty()) {
        return core::Result<Out>(core::InvalidArgumentError(
            "At least one domain is required (population, sales)"));
    }
    Out out;
    for (const auto& domain : domains) {
        auto metric = core::DomainMetric(domain);
        if (!metric) {
            return core::Result<Out>(core::InvalidArgumentError("Unknown domain: " + domain));
        }
        out.emplace_back(domain, *metric);
    }
    return out;
}

core::Result<Bounds> ParseSinglePeriod(const std::string& period) {
    return core::ParsePeriodBounds(period, period);
}

MetricHighlights BuildHighlights(const RowList& rows, core::Metric metric,
                                 double threshold, size_t limit) {
    MetricHighlights highlights;

    auto pick = [&](OptionalValue analytics::MetricWindow::*field, bool want_max) {
        std::optional<ExtremePoint> chosen;
        for (const auto* row : rows) {
            const auto& window = row->metric(metric);
            const auto& delta = window.*field;
            if (!delta) continue;
            // Strict comparison keeps the earliest date on ties.
            if (!chosen || (want_max ? *delta > chosen->value : *delta < chosen->value)) {
                chosen = ExtremePoint{row->date, *delta, window.value};
            }
        }
        return chosen;
    };

    highlights.mom_max = pick(&analytics::MetricWindow::prior_delta, true);
    highlights.mom_min = pick(&analytics::MetricWindow::prior_delta, false);
    highlights.yoy_max = pick(&analytics::MetricWindow::prior_year_delta, true);
    highlights.yoy_min = pick(&analytics::MetricWindow::prior_year_delta, false);

    for (const auto* row : rows) {
        const auto& window = row->metric(metric);
        if (window.zscore && std::fabs(*window.zscore) >= threshold) {
            highlights.anomalies.push_back(AnomalyPoint{row->date, *window.zscore, window.value});
        }
    }
    std::stable_sort(highlights.anomalies.begin(), highlights.anomalies.end(),
                     [](const AnomalyPoint& a, const AnomalyPoint& b) {
                         return std::fabs(a.zscore) > std::fabs(b.zscore);
                     });
    if (highlights.anomalies.size() > limit) highlights.anomalies.resize(limit);
    return highlights;
}

} // namespace

const char* TrendLabel(const OptionalValue& change_rate) {
    if (!change_rate) return "flat";
    if (*change_rate > 0.0) return "up";
    if (*change_rate < 0.0) return "down";
    return "flat";
}

const char* SignalLabel(const OptionalValue& change_rate) {
    if (!change_rate) return "insufficient_data";
    double magnitude = std::fabs(*change_rate);
    if (magnitude >= 0.2) return "strong_change";
    if (magnitude >= 0.05) return "moderate_change";
    return "minor_change";
}

InsightService::InsightService(std::shared_ptr<const storage::FactStore> store,
                               std::shared_ptr<const analytics::InsightCandidateAggregator> candidates,
                               std::shared_ptr<const analytics::AdvancedInsightAggregator> advanced,
                               const core::QueryConfig& config)
    : store_(std::move(store)),
      candidates_(std::move(candidates)),
      advanced_(std::move(advanced)),
      config_(config) {
    if (!store_ || !candidates_ || !advanced_) {
        throw core::InvalidArgumentError("InsightService requires a fact store and both aggregators");
    }
}

core::Result<core::Level> InsightService::resolve_level(const std::string& level) const {
    if (level.empty()) return config_.default_level;
    auto parsed = core::ParseLevel(level);
    if (!parsed) {
        return core::Result<core::Level>(core::InvalidArgumentError("Unknown level: " + level));
    }
    return *parsed;
}

core::Result<analytics::CandidateSet> InsightService::load(core::Level level) const {
    auto snapshot = store_->snapshot();
    if (!snapshot.ok()) {
        GEOINSIGHT_WARN("Fact snapshot unavailable: {}", snapshot.error());
        return core::Result<analytics::CandidateSet>(snapshot.error_detail());
    }
    auto set = candidates_->build(*snapshot.value(), level);
    if (!set.ok()) {
        GEOINSIGHT_ERROR("Candidate build failed at level {}: {}", core::LevelName(level), set.error());
    }
    return set;
}

ResponseMetadata InsightService::metadata(const analytics::CandidateSet& set,
                                          core::Level level) const {
    ResponseMetadata metadata;
    metadata.sources = set.sources;
    metadata.generated_at = core::NowMillis();
    metadata.level = level;
    metadata.warnings = set.warnings;
    return metadata;
}

std::string InsightService::match_region(const analytics::CandidateSet& set,
                                         const std::string& region, core::Level level) const {
    for (const auto& row : set.rows) {
        if (row.level == level && row.label == region) return region;
    }
    return candidates_->resolver().label(region, level);
}

core::Result<CompareDomainsResult> InsightService::compare_domains(
    const std::string& region, const std::string& period_from, const std::string& period_to,
    const std::vector<std::string>& domains, const std::string& level) const {
    auto lvl = resolve_level(level);
    if (!lvl.ok()) return core::Result<CompareDomainsResult>(lvl.error_detail());
    auto metrics = ParseDomains(domains);
    if (!metrics.ok()) return core::Result<CompareDomainsResult>(metrics.error_detail());
    auto bounds = core::ParsePeriodBounds(period_from, period_to);
    if (!bounds.ok()) return core::Result<CompareDomainsResult>(bounds.error_detail());

    auto set = load(lvl.value());
    if (!set.ok()) return core::Result<CompareDomainsResult>(set.error_detail());

    const auto rows = set.value().at_level(lvl.value());
    CompareDomainsResult result;
    result.metadata = metadata(set.value(), lvl.value());

    if (!region.empty()) {
        const std::string label = match_region(set.value(), region, lvl.value());
        result.region = label;
        auto series = RowsOf(rows, label, bounds.value());
        const analytics::InsightCandidate* latest = series.empty() ? nullptr : series.back();
        if (latest) {
            result.date = latest->date;
        } else {
            result.metadata.warnings.push_back(NoDataWarning("region '" + label + "'", bounds.value()));
        }
        for (const auto& entry : metrics.value()) {
            DomainComparison comparison;
            comparison.domain = entry.first;
            comparison.metric = entry.second;
            if (latest) {
                const auto& window = latest->metric(entry.second);
                comparison.value = window.value;
                comparison.change_rate = window.prior_delta;
                comparison.year_over_year = window.prior_year_delta;
            }
            comparison.trend = TrendLabel(comparison.change_rate);
            comparison.signal = SignalLabel(comparison.change_rate);
            result.comparisons.push_back(std::move(comparison));
        }
    } else {
        // Reduced scope: compare the mean across every unit of the level.
        std::map<Date, const analytics::InsightCandidate*> by_date;
        for (const auto* row : rows) by_date.emplace(row->date, row);

        auto latest = by_date.end();
        for (auto it = by_date.begin(); it != by_date.end(); ++it) {
            if (InBounds(it->first, bounds.value())) latest = it;
        }
        const analytics::InsightCandidate* current = nullptr;
        const analytics::InsightCandidate* previous = nullptr;
        if (latest != by_date.end()) {
            current = latest->second;
            result.date = latest->first;
            if (latest != by_date.begin()) previous = std::prev(latest)->second;
        } else {
            result.metadata.warnings.push_back(NoDataWarning("any unit", bounds.value()));
        }
        result.metadata.warnings.push_back("No region given; comparing the mean across all units");

        for (const auto& entry : metrics.value()) {
            DomainComparison comparison;
            comparison.domain = entry.first;
            comparison.metric = entry.second;
            if (current) {
                comparison.value = current->metric(entry.second).cross_sectional_mean;
                if (previous) {
                    comparison.change_rate = analytics::RelativeChange(
                        comparison.value, previous->metric(entry.second).cross_sectional_mean);
                }
            }
            comparison.trend = TrendLabel(comparison.change_rate);
            comparison.signal = SignalLabel(comparison.change_rate);
            result.comparisons.push_back(std::move(comparison));
        }
    }

    ApplyPeriod(result.metadata, result.date, bounds.value());
    return result;
}

core::Result<RankingsResult> InsightService::get_rankings(const std::string& metric,
                                                          const std::string& period,
                                                          size_t top_k,
                                                          const std::string& level) const {
    auto parsed_metric = core::ParseMetric(metric);
    if (!parsed_metric) {
        return core::Result<RankingsResult>(core::InvalidArgumentError("Unknown metric: " + metric));
    }
    if (top_k < 1 || top_k > config_.max_top_k) {
        return core::Result<RankingsResult>(core::InvalidArgumentError(
            "top_k must be between 1 and " + std::to_string(config_.max_top_k)));
    }
    auto lvl = resolve_level(level);
    if (!lvl.ok()) return core::Result<RankingsResult>(lvl.error_detail());
    auto bounds = ParseSinglePeriod(period);
    if (!bounds.ok()) return core::Result<RankingsResult>(bounds.error_detail());

    auto set = load(lvl.value());
    if (!set.ok()) return core::Result<RankingsResult>(set.error_detail());

    const auto rows = set.value().at_level(lvl.value());
    RankingsResult result;
    result.metric = *parsed_metric;
    result.metadata = metadata(set.value(), lvl.value());
    result.date = LatestDate(rows, bounds.value());

    if (!result.date) {
        result.metadata.warnings.push_back(NoDataWarning("rankings", bounds.value()));
    } else {
        RowList at_date;
        for (const auto* row : rows) {
            if (row->date == *result.date) at_date.push_back(row);
        }
        const core::Metric m = *parsed_metric;
        std::sort(at_date.begin(), at_date.end(),
                  [m](const analytics::InsightCandidate* a, const analytics::InsightCandidate* b) {
                      const auto& va = a->metric(m).value;
                      const auto& vb = b->metric(m).value;
                      if (va.has_value() != vb.has_value()) return va.has_value();
                      if (va && *va != *vb) return *va > *vb;
                      return a->label < b->label;
                  });
        if (at_date.size() > top_k) at_date.resize(top_k);
        for (const auto* row : at_date) {
            const auto& window = row->metric(m);
            result.rankings.push_back(RankingEntry{row->label, window.value, window.rank,
                                                   window.prior_delta});
        }
    }

    ApplyPeriod(result.metadata, result.date, bounds.value());
    return result;
}

core::Result<AnomalyResult> InsightService::detect_anomaly(const std::string& region,
                                                           const std::string& domain,
                                                           const std::string& period,
                                                           double z_threshold,
                                                           const std::string& level) const {
    if (region.empty()) {
        return core::Result<AnomalyResult>(core::InvalidArgumentError("region is required"));
    }
    auto metric = core::DomainMetric(domain);
    if (!metric) metric = core::ParseMetric(domain);
    if (!metric) {
        return core::Result<AnomalyResult>(core::InvalidArgumentError("Unknown domain: " + domain));
    }
    if (!std::isfinite(z_threshold) || z_threshold <= 0.0) {
        return core::Result<AnomalyResult>(core::InvalidArgumentError(
            "z_threshold must be a positive finite number"));
    }
    auto lvl = resolve_level(level);
    if (!lvl.ok()) return core::Result<AnomalyResult>(lvl.error_detail());
    auto bounds = ParseSinglePeriod(period);
    if (!bounds.ok()) return core::Result<AnomalyResult>(bounds.error_detail());

    auto set = load(lvl.value());
    if (!set.ok()) return core::Result<AnomalyResult>(set.error_detail());

    const auto rows = set.value().at_level(lvl.value());
    AnomalyResult result;
    result.region = match_region(set.value(), region, lvl.value());
    result.metric = *metric;
    result.threshold = z_threshold;
    result.metadata = metadata(set.value(), lvl.value());

    auto series = RowsOf(rows, result.region, bounds.value());
    if (series.empty()) {
        result.metadata.warnings.push_back(NoDataWarning("region '" + result.region + "'", bounds.value()));
    } else {
        const auto* row = series.back();
        const auto& window = row->metric(*metric);
        result.date = row->date;
        result.value = window.value;
        result.series_mean = window.series_mean;
        result.series_stddev = window.series_stddev;
        result.zscore = window.zscore;
        result.is_anomaly = window.zscore && std::fabs(*window.zscore) >= z_threshold;
    }

    ApplyPeriod(result.metadata, result.date, bounds.value());
    return result;
}

core::Result<AdvancedInsightResult> InsightService::get_advanced_insight(
    const std::string& region, const std::string& period,
    const std::vector<std::string>& domains, const std::string& level) const {
    if (region.empty()) {
        return core::Result<AdvancedInsightResult>(core::InvalidArgumentError("region is required"));
    }
    auto metrics = ParseDomains(domains);
    if (!metrics.ok()) return core::Result<AdvancedInsightResult>(metrics.error_detail());
    auto lvl = resolve_level(level);
    if (!lvl.ok()) return core::Result<AdvancedInsightResult>(lvl.error_detail());
    auto bounds = ParseSinglePeriod(period);
    if (!bounds.ok()) return core::Result<AdvancedInsightResult>(bounds.error_detail());

    AdvancedInsightResult result;
    result.domains = domains;
    result.metadata.generated_at = core::NowMillis();
    result.metadata.level = lvl.value();
    result.metadata.period_from = bounds.value().first;
    result.metadata.period_to = bounds.value().second;

    auto generation = advanced_->current();
    if (!generation) {
        result.region = candidates_->resolver().label(region, lvl.value());
        result.metadata.warnings.push_back("Advanced insights have not been refreshed yet");
        return result;
    }

    result.metadata.sources = generation->sources;
    result.metadata.warnings = generation->warnings;
    result.metadata.refreshed_at = generation->refreshed_at;
    result.metadata.generation = generation->generation;

    const analytics::AdvancedInsight* insight = generation->find(lvl.value(), region);
    result.region = region;
    if (!insight) {
        result.region = candidates_->resolver().label(region, lvl.value());
        insight = generation->find(lvl.value(), result.region);
    }
    if (insight) {
        result.insight = *insight;
    } else {
        result.metadata.warnings.push_back("No advanced insight for region '" + result.region + "'");
    }
    return result;
}

core::Result<SeriesSummary> InsightService::summarize_series(const std::string& region,
                                                             const std::string& level) const {
    if (region.empty()) {
        return core::Result<SeriesSummary>(core::InvalidArgumentError("region is required"));
    }
    auto lvl = resolve_level(level);
    if (!lvl.ok()) return core::Result<SeriesSummary>(lvl.error_detail());

    auto set = load(lvl.value());
    if (!set.ok()) return core::Result<SeriesSummary>(set.error_detail());

    SeriesSummary summary;
    summary.region = match_region(set.value(), region, lvl.value());
    summary.metadata = metadata(set.value(), lvl.value());

    const auto rows = RowsOf(set.value().at_level(lvl.value()), summary.region, Bounds());
    if (rows.empty()) {
        summary.metadata.warnings.push_back(NoDataWarning("region '" + summary.region + "'", Bounds()));
        return summary;
    }

    summary.date_min = rows.front()->date;
    summary.date_max = rows.back()->date;
    summary.metadata.period_from = summary.date_min;
    summary.metadata.period_to = summary.date_max;

    size_t first = rows.size() > kSeriesWindow ? rows.size() - kSeriesWindow : 0;
    for (size_t i = first; i < rows.size(); ++i) summary.series.push_back(*rows[i]);

    summary.foot_traffic = BuildHighlights(rows, core::Metric::FOOT_TRAFFIC,
                                           config_.anomaly_highlight_threshold,
                                           config_.highlight_limit);
    summary.sales = BuildHighlights(rows, core::Metric::SALES,
                                    config_.anomaly_highlight_threshold,
                                    config_.highlight_limit);
    summary.dominant_group = rows.back()->dominant_group;
    summary.dominant_share = rows.back()->dominant_share;
    return summary;
}

} // namespace query
} // namespace geoinsight
