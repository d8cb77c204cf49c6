#ifndef GEOINSIGHT_STORAGE_FACT_STORE_H_
#define GEOINSIGHT_STORAGE_FACT_STORE_H_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "geoinsight/core/result.h"
#include "geoinsight/core/types.h"

namespace geoinsight {
namespace storage {

/**
 * @brief Normalized activity record
 *
 * Primary key: (spatial_key, date, granularity, source).
 */
struct ActivityFact {
    std::string spatial_key;
    core::Date date;
    std::string granularity = core::kMonthlyGranularity;
    std::string source;
    core::OptionalValue foot_traffic;
    core::OptionalValue sales;
    core::OptionalValue sales_count;
};

/**
 * @brief Normalized demographic record
 *
 * Primary key: (spatial_key, date, granularity, source, sex, age_group).
 */
struct DemographicFact {
    std::string spatial_key;
    core::Date date;
    std::string granularity = core::kMonthlyGranularity;
    std::string source;
    std::string sex;
    std::string age_group;
    core::OptionalValue value;
};

/**
 * @brief Immutable view of every fact at one point in time
 */
struct FactSnapshot {
    std::vector<ActivityFact> activity;
    std::vector<DemographicFact> demographics;
    uint64_t version = 0;

    /**
     * @brief Distinct source names, sorted
     */
    std::vector<std::string> sources() const;
};

using SnapshotPtr = std::shared_ptr<const FactSnapshot>;

/**
 * @brief Read access to the normalized fact store
 */
class FactStore {
public:
    virtual ~FactStore() = default;

    /**
     * @brief Current snapshot; fails with UPSTREAM_UNAVAILABLE when the
     * backing source cannot be read
     */
    virtual core::Result<SnapshotPtr> snapshot() const = 0;
};

/**
 * @brief Fact store kept in memory
 *
 * Writers copy the current snapshot, apply their change and publish the new
 * one with an atomic pointer swap; readers never lock.
 */
class InMemoryFactStore : public FactStore {
public:
    InMemoryFactStore();

    core::Result<SnapshotPtr> snapshot() const override;

    /**
     * @brief Insert or replace by primary key
     */
    void upsert(const ActivityFact& fact);
    void upsert(const DemographicFact& fact);

    /**
     * @brief Insert or replace a batch under a single new version
     */
    void upsert_batch(const std::vector<ActivityFact>& activity,
                      const std::vector<DemographicFact>& demographics);

    uint64_t version() const;

private:
    void publish(std::shared_ptr<FactSnapshot> next);

    std::mutex write_mutex_;
    std::shared_ptr<const FactSnapshot> current_;
};

/**
 * @brief A (unit, date, granularity) group fed by more than one source
 */
struct SourceOverlap {
    std::string spatial_key;
    core::Date date;
    std::string granularity;
    std::vector<std::string> sources;

    std::string describe() const;
};

/**
 * @brief Activity groups whose values will be summed across sources
 */
std::vector<SourceOverlap> FindSourceOverlaps(const FactSnapshot& snapshot);

/**
 * @brief INTERNAL error when two facts share a primary key
 */
core::Result<void> CheckPrimaryKeys(const FactSnapshot& snapshot);

} // namespace storage
} // namespace geoinsight

#endif // GEOINSIGHT_STORAGE_FACT_STORE_H_
