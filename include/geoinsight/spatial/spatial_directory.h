#ifndef GEOINSIGHT_SPATIAL_SPATIAL_DIRECTORY_H_
#define GEOINSIGHT_SPATIAL_SPATIAL_DIRECTORY_H_

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "geoinsight/core/result.h"

namespace geoinsight {
namespace spatial {

/**
 * @brief A finest-level unit as registered by a source
 *
 * `raw_key` is the identifier facts carry; `code` is the administrative code
 * when the source supplied one (may be empty).
 */
struct FinestUnit {
    std::string raw_key;
    std::string label;
    std::string code;
};

/**
 * @brief An intermediate administrative unit (e.g. district)
 */
struct IntermediateUnit {
    std::string code;
    std::string name;
    std::string parent_code;
};

/**
 * @brief A coarsest administrative unit (e.g. province)
 */
struct CoarsestUnit {
    std::string code;
    std::string name;
};

/**
 * @brief Lookup tables the spatial resolver consults
 *
 * Codes and raw keys are unique; names are not (the same district name can
 * exist under several provinces), so name lookups return every match.
 * The directory is built once and then shared read-only.
 */
class SpatialDirectory {
public:
    SpatialDirectory() = default;

    core::Result<void> add_finest(const FinestUnit& unit);
    core::Result<void> add_intermediate(const IntermediateUnit& unit);
    core::Result<void> add_coarsest(const CoarsestUnit& unit);

    const FinestUnit* find_finest_by_key(const std::string& raw_key) const;
    std::vector<const FinestUnit*> find_finest_by_label(const std::string& label) const;

    const IntermediateUnit* find_intermediate_by_code(const std::string& code) const;
    std::vector<const IntermediateUnit*> find_intermediate_by_name(const std::string& name) const;

    const CoarsestUnit* find_coarsest_by_code(const std::string& code) const;
    std::vector<const CoarsestUnit*> find_coarsest_by_name(const std::string& name) const;

    /**
     * @brief Every finest label and unit name, sorted and deduplicated
     */
    std::vector<std::string> names() const;

    size_t finest_count() const { return finest_.size(); }
    size_t intermediate_count() const { return intermediate_.size(); }
    size_t coarsest_count() const { return coarsest_.size(); }

private:
    std::map<std::string, FinestUnit> finest_;
    std::map<std::string, IntermediateUnit> intermediate_;
    std::map<std::string, CoarsestUnit> coarsest_;

    std::unordered_multimap<std::string, std::string> finest_by_label_;
    std::unordered_multimap<std::string, std::string> intermediate_by_name_;
    std::unordered_multimap<std::string, std::string> coarsest_by_name_;
};

} // namespace spatial
} // namespace geoinsight

#endif // GEOINSIGHT_SPATIAL_SPATIAL_DIRECTORY_H_
