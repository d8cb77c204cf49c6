#ifndef GEOINSIGHT_STORAGE_DATASET_LOADER_H_
#define GEOINSIGHT_STORAGE_DATASET_LOADER_H_

#include <memory>
#include <string>
#include <vector>

#include "geoinsight/core/result.h"
#include "geoinsight/spatial/spatial_directory.h"
#include "geoinsight/storage/fact_store.h"

namespace geoinsight {
namespace storage {

/**
 * @brief Spatial directory and facts read from one JSON document
 */
struct Dataset {
    std::shared_ptr<spatial::SpatialDirectory> directory;
    std::vector<ActivityFact> activity;
    std::vector<DemographicFact> demographics;
};

/**
 * @brief Parse a dataset document
 *
 * Layout:
 * ```
 * {
 *   "directory": {
 *     "finest":       [{"raw_key": "...", "label": "...", "code": "..."}],
 *     "intermediate": [{"code": "...", "name": "...", "parent_code": "..."}],
 *     "coarsest":     [{"code": "...", "name": "..."}]
 *   },
 *   "activity":     [{"spatial_key": "...", "date": "2024-01-01", "granularity": "month",
 *                     "source": "...", "foot_traffic": 1.0, "sales": null, "sales_count": 3}],
 *   "demographics": [{"spatial_key": "...", "date": "2024-01-01", "source": "...",
 *                     "sex": "F", "age_group": "30", "value": 12.0}]
 * }
 * ```
 * Any malformed record fails the whole load with INVALID_ARGUMENT.
 */
core::Result<Dataset> ParseDataset(const std::string& json);

core::Result<Dataset> LoadDataset(const std::string& path);

} // namespace storage
} // namespace geoinsight

#endif // GEOINSIGHT_STORAGE_DATASET_LOADER_H_
