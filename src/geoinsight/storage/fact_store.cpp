#include "geoinsight/storage/fact_store.h"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <tuple>

#include "geoinsight/common/logger.h"

namespace geoinsight {
namespace storage {

namespace {

using ActivityKey = std::tuple<std::string, core::Date, std::string, std::string>;
using DemographicKey = std::tuple<std::string, core::Date, std::string, std::string,
                                  std::string, std::string>;

ActivityKey KeyOf(const ActivityFact& fact) {
    return ActivityKey(fact.spatial_key, fact.date, fact.granularity, fact.source);
}

DemographicKey KeyOf(const DemographicFact& fact) {
    return DemographicKey(fact.spatial_key, fact.date, fact.granularity, fact.source,
                          fact.sex, fact.age_group);
}

template<typename Fact>
void UpsertInto(std::vector<Fact>& facts, const std::vector<Fact>& incoming) {
    if (incoming.empty()) return;
    std::map<decltype(KeyOf(facts.front())), size_t> positions;
    for (size_t i = 0; i < facts.size(); ++i) {
        positions[KeyOf(facts[i])] = i;
    }
    for (const auto& fact : incoming) {
        auto key = KeyOf(fact);
        auto it = positions.find(key);
        if (it != positions.end()) {
            facts[it->second] = fact;
        } else {
            positions.emplace(std::move(key), facts.size());
            facts.push_back(fact);
        }
    }
}

std::string FormatKey(const ActivityKey& key) {
    std::ostringstream oss;
    oss << std::get<0>(key) << "/" << std::get<1>(key).to_string() << "/"
        << std::get<2>(key) << "/" << std::get<3>(key);
    return oss.str();
}

std::string FormatKey(const DemographicKey& key) {
    std::ostringstream oss;
    oss << std::get<0>(key) << "/" << std::get<1>(key).to_string() << "/"
        << std::get<2>(key) << "/" << std::get<3>(key) << "/"
        << std::get<4>(key) << "/" << std::get<5>(key);
    return oss.str();
}

} // namespace

std::vector<std::string> FactSnapshot::sources() const {
    std::set<std::string> names;
    for (const auto& fact : activity) names.insert(fact.source);
    for (const auto& fact : demographics) names.insert(fact.source);
    return std::vector<std::string>(names.begin(), names.end());
}

InMemoryFactStore::InMemoryFactStore()
    : current_(std::make_shared<const FactSnapshot>()) {}

core::Result<SnapshotPtr> InMemoryFactStore::snapshot() const {
    return SnapshotPtr(std::atomic_load(&current_));
}

uint64_t InMemoryFactStore::version() const {
    return std::atomic_load(&current_)->version;
}

void InMemoryFactStore::upsert(const ActivityFact& fact) {
    upsert_batch({fact}, {});
}

void InMemoryFactStore::upsert(const DemographicFact& fact) {
    upsert_batch({}, {fact});
}

void InMemoryFactStore::upsert_batch(const std::vector<ActivityFact>& activity,
                                     const std::vector<DemographicFact>& demographics) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<FactSnapshot>(*std::atomic_load(&current_));
    UpsertInto(next->activity, activity);
    UpsertInto(next->demographics, demographics);
    publish(std::move(next));
}

void InMemoryFactStore::publish(std::shared_ptr<FactSnapshot> next) {
    next->version = current_->version + 1;
    std::shared_ptr<const FactSnapshot> published = std::move(next);
    std::atomic_store(&current_, published);
    GEOINSIGHT_DEBUG("Published fact snapshot v{} ({} activity, {} demographic)",
                     published->version, published->activity.size(),
                     published->demographics.size());
}

std::string SourceOverlap::describe() const {
    std::ostringstream oss;
    oss << "sources overlap for " << spatial_key << " at " << date.to_string()
        << " (" << granularity << "): ";
    for (size_t i = 0; i < sources.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << sources[i];
    }
    oss << "; values are summed";
    return oss.str();
}

std::vector<SourceOverlap> FindSourceOverlaps(const FactSnapshot& snapshot) {
    std::map<std::tuple<std::string, core::Date, std::string>, std::set<std::string>> groups;
    for (const auto& fact : snapshot.activity) {
        groups[std::make_tuple(fact.spatial_key, fact.date, fact.granularity)].insert(fact.source);
    }

    std::vector<SourceOverlap> overlaps;
    for (const auto& entry : groups) {
        if (entry.second.size() < 2) continue;
        SourceOverlap overlap;
        overlap.spatial_key = std::get<0>(entry.first);
        overlap.date = std::get<1>(entry.first);
        overlap.granularity = std::get<2>(entry.first);
        overlap.sources.assign(entry.second.begin(), entry.second.end());
        overlaps.push_back(std::move(overlap));
    }
    return overlaps;
}

core::Result<void> CheckPrimaryKeys(const FactSnapshot& snapshot) {
    std::set<ActivityKey> activity_keys;
    for (const auto& fact : snapshot.activity) {
        auto key = KeyOf(fact);
        if (!activity_keys.insert(key).second) {
            return core::Result<void>(core::InternalError(
                "Duplicate activity fact primary key: " + FormatKey(key)));
        }
    }
    std::set<DemographicKey> demographic_keys;
    for (const auto& fact : snapshot.demographics) {
        auto key = KeyOf(fact);
        if (!demographic_keys.insert(key).second) {
            return core::Result<void>(core::InternalError(
                "Duplicate demographic fact primary key: " + FormatKey(key)));
        }
    }
    return core::Result<void>();
}

} // namespace storage
} // namespace geoinsight
