#include "geoinsight/spatial/spatial_directory.h"

#include <algorithm>

namespace geoinsight {
namespace spatial {

namespace {

// Multimap iteration order is unspecified; results are sorted by the
// unit's unique key so callers stay deterministic.
template<typename Unit>
std::vector<const Unit*> CollectByName(const std::unordered_multimap<std::string, std::string>& index,
                                       const std::map<std::string, Unit>& units,
                                       const std::string& name) {
    std::vector<const Unit*> out;
    std::vector<std::string> keys;
    auto range = index.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) {
        keys.push_back(it->second);
    }
    std::sort(keys.begin(), keys.end());
    for (const auto& key : keys) {
        auto unit = units.find(key);
        if (unit != units.end()) {
            out.push_back(&unit->second);
        }
    }
    return out;
}

} // namespace

core::Result<void> SpatialDirectory::add_finest(const FinestUnit& unit) {
    if (unit.raw_key.empty()) {
        return core::Result<void>::error("Finest unit requires a raw key",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    if (!finest_.emplace(unit.raw_key, unit).second) {
        return core::Result<void>::error("Duplicate finest unit key: " + unit.raw_key,
                                         core::Error::Code::ALREADY_EXISTS);
    }
    if (!unit.label.empty()) {
        finest_by_label_.emplace(unit.label, unit.raw_key);
    }
    return core::Result<void>();
}

core::Result<void> SpatialDirectory::add_intermediate(const IntermediateUnit& unit) {
    if (unit.code.empty() || unit.name.empty()) {
        return core::Result<void>::error("Intermediate unit requires code and name",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    if (!intermediate_.emplace(unit.code, unit).second) {
        return core::Result<void>::error("Duplicate intermediate code: " + unit.code,
                                         core::Error::Code::ALREADY_EXISTS);
    }
    intermediate_by_name_.emplace(unit.name, unit.code);
    return core::Result<void>();
}

core::Result<void> SpatialDirectory::add_coarsest(const CoarsestUnit& unit) {
    if (unit.code.empty() || unit.name.empty()) {
        return core::Result<void>::error("Coarsest unit requires code and name",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    if (!coarsest_.emplace(unit.code, unit).second) {
        return core::Result<void>::error("Duplicate coarsest code: " + unit.code,
                                         core::Error::Code::ALREADY_EXISTS);
    }
    coarsest_by_name_.emplace(unit.name, unit.code);
    return core::Result<void>();
}

const FinestUnit* SpatialDirectory::find_finest_by_key(const std::string& raw_key) const {
    auto it = finest_.find(raw_key);
    return it == finest_.end() ? nullptr : &it->second;
}

std::vector<const FinestUnit*> SpatialDirectory::find_finest_by_label(const std::string& label) const {
    return CollectByName(finest_by_label_, finest_, label);
}

const IntermediateUnit* SpatialDirectory::find_intermediate_by_code(const std::string& code) const {
    auto it = intermediate_.find(code);
    return it == intermediate_.end() ? nullptr : &it->second;
}

std::vector<const IntermediateUnit*> SpatialDirectory::find_intermediate_by_name(
    const std::string& name) const {
    return CollectByName(intermediate_by_name_, intermediate_, name);
}

const CoarsestUnit* SpatialDirectory::find_coarsest_by_code(const std::string& code) const {
    auto it = coarsest_.find(code);
    return it == coarsest_.end() ? nullptr : &it->second;
}

std::vector<const CoarsestUnit*> SpatialDirectory::find_coarsest_by_name(const std::string& name) const {
    return CollectByName(coarsest_by_name_, coarsest_, name);
}

std::vector<std::string> SpatialDirectory::names() const {
    std::vector<std::string> out;
    out.reserve(finest_.size() + intermediate_.size() + coarsest_.size());
    for (const auto& entry : finest_) {
        if (!entry.second.label.empty()) out.push_back(entry.second.label);
    }
    for (const auto& entry : intermediate_) out.push_back(entry.second.name);
    for (const auto& entry : coarsest_) out.push_back(entry.second.name);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

} // namespace spatial
} // namespace geoinsight
