#ifndef GEOINSIGHT_ANALYTICS_DEMOGRAPHIC_DOMINANCE_H_
#define GEOINSIGHT_ANALYTICS_DEMOGRAPHIC_DOMINANCE_H_

#include <string>
#include <vector>

#include "geoinsight/core/config.h"
#include "geoinsight/core/types.h"
#include "geoinsight/spatial/spatial_resolver.h"
#include "geoinsight/storage/fact_store.h"

namespace geoinsight {
namespace analytics {

/**
 * @brief Largest demographic group of a finest-level unit at one date
 */
struct DominantGroup {
    std::string label;
    core::Date date;
    std::string group;          // "<sex>_<age_group>"
    double value = 0.0;         // Summed value of the dominant group
    core::OptionalValue total;  // Sum over every group at (label, date)
    core::OptionalValue share;  // value / total; absent when total is zero
};

/**
 * @brief Dominant (sex, age group) per finest label and date
 *
 * Ties go to the lexicographically smallest group key. Groups whose values
 * are all absent are not candidates; a (label, date) with no candidate
 * produces no row.
 */
class DemographicDominanceCalculator {
public:
    explicit DemographicDominanceCalculator(
        const core::MetricsConfig& config = core::MetricsConfig::Default());

    std::vector<DominantGroup> compute(const storage::FactSnapshot& snapshot,
                                       const spatial::SpatialResolver& resolver) const;

private:
    core::MetricsConfig config_;
};

} // namespace analytics
} // namespace geoinsight

#endif // GEOINSIGHT_ANALYTICS_DEMOGRAPHIC_DOMINANCE_H_
