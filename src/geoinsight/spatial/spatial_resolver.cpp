#include "geoinsight/spatial/spatial_resolver.h"

#include <algorithm>
#include <cctype>

#include "geoinsight/common/logger.h"

namespace geoinsight {
namespace spatial {

namespace {

bool IsAllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

void FillCoarsestFromCode(const SpatialDirectory& directory, const std::string& code,
                          SpatialResolution& resolution) {
    if (resolution.coarsest) return;
    if (const CoarsestUnit* unit = directory.find_coarsest_by_code(code)) {
        resolution.coarsest = unit->name;
    }
}

} // namespace

const std::optional<std::string>& SpatialResolution::at(core::Level level) const {
    switch (level) {
        case core::Level::FINEST: return finest;
        case core::Level::INTERMEDIATE: return intermediate;
        case core::Level::COARSEST: return coarsest;
    }
    return finest;
}

std::optional<std::string>& SpatialResolution::at(core::Level level) {
    switch (level) {
        case core::Level::FINEST: return finest;
        case core::Level::INTERMEDIATE: return intermediate;
        case core::Level::COARSEST: return coarsest;
    }
    return finest;
}

void DirectoryKeyStrategy::apply(const SpatialDirectory& directory,
                                 SpatialResolution& resolution) const {
    const FinestUnit* unit = directory.find_finest_by_key(resolution.raw_key);
    if (!unit) return;
    if (!resolution.finest && !unit->label.empty()) {
        resolution.finest = unit->label;
    }
    if (!resolution.code && !unit->code.empty()) {
        resolution.code = unit->code;
    }
}

CodePrefixStrategy::CodePrefixStrategy(const core::SpatialConfig& config) : config_(config) {
    if (config_.coarsest_code_width == 0 ||
        config_.intermediate_code_width <= config_.coarsest_code_width) {
        throw core::InvalidArgumentError("Code prefix widths must satisfy 0 < coarsest < intermediate");
    }
}

void CodePrefixStrategy::apply(const SpatialDirectory& directory,
                               SpatialResolution& resolution) const {
    std::string code;
    if (resolution.code) {
        code = *resolution.code;
    } else if (IsAllDigits(resolution.raw_key)) {
        code = resolution.raw_key;
    } else {
        return;
    }

    bool matched = false;
    if (code.size() >= config_.intermediate_code_width) {
        const std::string prefix = code.substr(0, config_.intermediate_code_width);
        if (const IntermediateUnit* unit = directory.find_intermediate_by_code(prefix)) {
            if (!resolution.intermediate) {
                resolution.intermediate = unit->name;
            }
            if (!unit->parent_code.empty()) {
                FillCoarsestFromCode(directory, unit->parent_code, resolution);
            }
            matched = true;
        }
    }
    if (code.size() >= config_.coarsest_code_width) {
        const std::string prefix = code.substr(0, config_.coarsest_code_width);
        if (directory.find_coarsest_by_code(prefix)) {
            FillCoarsestFromCode(directory, prefix, resolution);
            matched = true;
        }
    }
    if (matched && !resolution.code) {
        resolution.code = code;
    }
}

void NameMatchStrategy::apply(const SpatialDirectory& directory,
                              SpatialResolution& resolution) const {
    std::vector<std::string> names{resolution.raw_key};
    if (resolution.finest && *resolution.finest != resolution.raw_key) {
        names.push_back(*resolution.finest);
    }

    for (const auto& name : names) {
        if (!resolution.finest) {
            auto matches = directory.find_finest_by_label(name);
            if (matches.size() == 1) {
                resolution.finest = matches.front()->label;
                if (!resolution.code && !matches.front()->code.empty()) {
                    resolution.code = matches.front()->code;
                }
            } else if (matches.size() > 1) {
                GEOINSIGHT_DEBUG("Ambiguous finest label '{}' ({} units)", name, matches.size());
            }
        }

        if (!resolution.intermediate) {
            auto matches = directory.find_intermediate_by_name(name);
            if (matches.size() == 1) {
                resolution.intermediate = matches.front()->name;
                if (!matches.front()->parent_code.empty()) {
                    FillCoarsestFromCode(directory, matches.front()->parent_code, resolution);
                }
            } else if (matches.size() > 1) {
                GEOINSIGHT_DEBUG("Ambiguous intermediate name '{}' ({} units)", name, matches.size());
            }
        }

        if (!resolution.coarsest) {
            auto matches = directory.find_coarsest_by_name(name);
            if (matches.size() == 1) {
                resolution.coarsest = matches.front()->name;
            } else if (matches.size() > 1) {
                GEOINSIGHT_DEBUG("Ambiguous coarsest name '{}' ({} units)", name, matches.size());
            }
        }
    }
}

SpatialResolver::SpatialResolver(std::shared_ptr<const SpatialDirectory> directory,
                                 const core::SpatialConfig& config)
    : SpatialResolver(std::move(directory), DefaultStrategies(config)) {}

SpatialResolver::SpatialResolver(std::shared_ptr<const SpatialDirectory> directory,
                                 std::vector<std::unique_ptr<ResolverStrategy>> strategies)
    : directory_(std::move(directory)), strategies_(std::move(strategies)) {
    if (!directory_) {
        directory_ = std::make_shared<SpatialDirectory>();
    }
}

std::vector<std::unique_ptr<ResolverStrategy>> SpatialResolver::DefaultStrategies(
    const core::SpatialConfig& config) {
    std::vector<std::unique_ptr<ResolverStrategy>> strategies;
    strategies.push_back(std::make_unique<DirectoryKeyStrategy>());
    strategies.push_back(std::make_unique<CodePrefixStrategy>(config));
    strategies.push_back(std::make_unique<NameMatchStrategy>());
    return strategies;
}

SpatialResolution SpatialResolver::resolve(const std::string& raw_key) const {
    SpatialResolution resolution;
    resolution.raw_key = raw_key;
    for (const auto& strategy : strategies_) {
        if (resolution.complete()) break;
        strategy->apply(*directory_, resolution);
    }
    if (!resolution.complete()) {
        GEOINSIGHT_TRACE("Spatial key '{}' partially resolved (finest={}, intermediate={}, coarsest={})",
                         raw_key, resolution.finest.has_value(),
                         resolution.intermediate.has_value(), resolution.coarsest.has_value());
    }
    return resolution;
}

std::string SpatialResolver::label(const std::string& raw_key, core::Level level) const {
    return resolve(raw_key).label(level);
}

} // namespace spatial
} // namespace geoinsight
