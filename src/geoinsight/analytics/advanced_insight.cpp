#include "geoinsight/analytics/advanced_insight.h"

#include <cmath>
#include <map>

#include "geoinsight/analytics/statistics.h"
#include "geoinsight/common/logger.h"

namespace geoinsight {
namespace analytics {

namespace {

constexpr size_t kCancellationCheckInterval = 256;

struct GroupAccumulator {
    PairedStats pairs;
    RunningStats sales_abs_z;
    RunningStats foot_traffic_abs_z;
};

} // namespace

const AdvancedInsight* AdvancedInsightGeneration::find(core::Level level,
                                                       const std::string& label) const {
    for (const auto& insight : insights) {
        if (insight.level == level && insight.label == label) {
            return &insight;
        }
    }
    return nullptr;
}

AdvancedInsightAggregator::AdvancedInsightAggregator(
    std::shared_ptr<const storage::FactStore> store,
    std::shared_ptr<const InsightCandidateAggregator> candidates,
    const core::RefreshConfig& config)
    : store_(std::move(store)), candidates_(std::move(candidates)), config_(config) {
    if (!store_ || !candidates_) {
        throw core::InvalidArgumentError("AdvancedInsightAggregator requires a fact store and "
                                         "a candidate aggregator");
    }
}

GenerationPtr AdvancedInsightAggregator::current() const {
    return std::atomic_load(&current_);
}

AdvancedInsightAggregator::Stats AdvancedInsightAggregator::stats() const {
    Stats stats;
    stats.refreshes = refreshes_.load();
    stats.failures = failures_.load();
    return stats;
}

core::Result<GenerationPtr> AdvancedInsightAggregator::refresh(const core::CallOptions& options) {
    std::unique_lock<std::timed_mutex> lock(refresh_mutex_, std::defer_lock);
    if (!lock.try_lock_for(config_.lock_timeout)) {
        failures_++;
        GEOINSIGHT_WARN("Advanced insight refresh skipped: another refresh is still running");
        return core::Result<GenerationPtr>(
            core::TimeoutError("Advanced insight refresh lock not acquired"));
    }

    auto result = run_refresh(options.bounded_by(config_.timeout));
    if (!result.ok()) {
        failures_++;
        auto previous = current();
        GEOINSIGHT_WARN("Advanced insight refresh failed ({}): {}; serving generation {}",
                        core::CodeName(result.error_code()), result.error(),
                        previous ? previous->generation : 0);
    }
    return result;
}

core::Result<GenerationPtr> AdvancedInsightAggregator::run_refresh(const core::CallOptions& options) {
    GEOINSIGHT_INFO("Advanced insight refresh started");

    auto check = options.check("Advanced insight refresh");
    if (!check.ok()) return core::Result<GenerationPtr>(check.error_detail());

    auto snapshot = store_->snapshot();
    if (!snapshot.ok()) {
        return core::Result<GenerationPtr>(snapshot.error_detail());
    }
    const storage::SnapshotPtr& facts = snapshot.value();

    check = options.check("Advanced insight refresh");
    if (!check.ok()) return core::Result<GenerationPtr>(check.error_detail());

    auto candidates = candidates_->build(*facts);
    if (!candidates.ok()) {
        return core::Result<GenerationPtr>(candidates.error_detail());
    }

    auto insights = Compute(candidates.value().rows, options);
    if (!insights.ok()) {
        return core::Result<GenerationPtr>(insights.error_detail());
    }

    auto previous = current();
    auto next = std::make_shared<AdvancedInsightGeneration>();
    next->generation = previous ? previous->generation + 1 : 1;
    next->refreshed_at = core::NowMillis();
    next->snapshot_version = facts->version;
    next->insights = std::move(insights).value();
    next->sources = candidates.value().sources;
    next->warnings = candidates.value().warnings;

    GenerationPtr published = std::move(next);
    std::atomic_store(&current_, published);
    refreshes_++;

    GEOINSIGHT_INFO("Advanced insight refresh finished: generation {} with {} units from "
                    "snapshot v{}", published->generation, published->insights.size(),
                    published->snapshot_version);
    return published;
}

core::Result<std::vector<AdvancedInsight>> AdvancedInsightAggregator::Compute(
    const std::vector<InsightCandidate>& rows,
    const core::CallOptions& options) {
    std::map<std::pair<core::Level, std::string>, GroupAccumulator> groups;

    for (size_t i = 0; i < rows.size(); ++i) {
        if (i % kCancellationCheckInterval == 0) {
            auto check = options.check("Advanced insight aggregation");
            if (!check.ok()) {
                return core::Result<std::vector<AdvancedInsight>>(check.error_detail());
            }
        }

        const InsightCandidate& row = rows[i];
        if (!row.sales.value || !row.foot_traffic.value) continue;

        auto& group = groups[std::make_pair(row.level, row.label)];
        group.pairs.add(*row.foot_traffic.value, *row.sales.value);
        if (row.sales.zscore) group.sales_abs_z.add(std::fabs(*row.sales.zscore));
        if (row.foot_traffic.zscore) group.foot_traffic_abs_z.add(std::fabs(*row.foot_traffic.zscore));
    }

    std::vector<AdvancedInsight> out;
    out.reserve(groups.size());
    for (const auto& [key, group] : groups) {
        AdvancedInsight insight;
        insight.level = key.first;
        insight.label = key.second;
        insight.correlation = group.pairs.correlation();
        insight.slope = group.pairs.slope();
        insight.sales_impact = group.sales_abs_z.mean();
        insight.foot_traffic_impact = group.foot_traffic_abs_z.mean();
        insight.sample_count = group.pairs.count();
        out.push_back(std::move(insight));
    }
    return out;
}

} // namespace analytics
} // namespace geoinsight
