#ifndef GEOINSIGHT_SPATIAL_SPATIAL_RESOLVER_H_
#define GEOINSIGHT_SPATIAL_SPATIAL_RESOLVER_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geoinsight/core/config.h"
#include "geoinsight/core/types.h"
#include "geoinsight/spatial/spatial_directory.h"

namespace geoinsight {
namespace spatial {

/**
 * @brief Labels a raw spatial key resolved to, one per level
 *
 * A level that no strategy could resolve stays empty; label() substitutes
 * the raw key for it so aggregation never drops the unit.
 */
struct SpatialResolution {
    std::string raw_key;
    std::optional<std::string> code;
    std::optional<std::string> finest;
    std::optional<std::string> intermediate;
    std::optional<std::string> coarsest;

    const std::optional<std::string>& at(core::Level level) const;
    std::optional<std::string>& at(core::Level level);

    std::string label(core::Level level) const {
        const auto& value = at(level);
        return value ? *value : raw_key;
    }

    bool complete() const { return finest && intermediate && coarsest; }
};

/**
 * @brief One rule of the resolution chain
 *
 * A strategy only fills levels that are still empty; it never overwrites a
 * label set by an earlier strategy.
 */
class ResolverStrategy {
public:
    virtual ~ResolverStrategy() = default;

    virtual const char* name() const = 0;
    virtual void apply(const SpatialDirectory& directory, SpatialResolution& resolution) const = 0;
};

/**
 * @brief Exact raw key lookup in the finest directory
 */
class DirectoryKeyStrategy : public ResolverStrategy {
public:
    const char* name() const override { return "directory_key"; }
    void apply(const SpatialDirectory& directory, SpatialResolution& resolution) const override;
};

/**
 * @brief Administrative code truncated to the intermediate and coarsest
 * prefix widths
 *
 * Uses the code found by an earlier strategy, or the raw key itself when it
 * consists only of digits.
 */
class CodePrefixStrategy : public ResolverStrategy {
public:
    explicit CodePrefixStrategy(const core::SpatialConfig& config = core::SpatialConfig::Default());

    const char* name() const override { return "code_prefix"; }
    void apply(const SpatialDirectory& directory, SpatialResolution& resolution) const override;

private:
    core::SpatialConfig config_;
};

/**
 * @brief Raw key and finest label matched against unit names
 *
 * A name shared by several units of one level is ambiguous and leaves that
 * level unresolved.
 */
class NameMatchStrategy : public ResolverStrategy {
public:
    const char* name() const override { return "name_match"; }
    void apply(const SpatialDirectory& directory, SpatialResolution& resolution) const override;
};

/**
 * @brief Reconciles source spatial keys onto the three-level hierarchy
 *
 * Every strategy of the chain is consulted in order for the levels still
 * missing; the first one to produce a label for a level wins. Resolution
 * never fails.
 */
class SpatialResolver {
public:
    explicit SpatialResolver(std::shared_ptr<const SpatialDirectory> directory,
                             const core::SpatialConfig& config = core::SpatialConfig::Default());
    SpatialResolver(std::shared_ptr<const SpatialDirectory> directory,
                    std::vector<std::unique_ptr<ResolverStrategy>> strategies);

    SpatialResolution resolve(const std::string& raw_key) const;

    /**
     * @brief Label of the unit at one level; the raw key when unresolved
     */
    std::string label(const std::string& raw_key, core::Level level) const;

    const SpatialDirectory& directory() const { return *directory_; }

    static std::vector<std::unique_ptr<ResolverStrategy>> DefaultStrategies(
        const core::SpatialConfig& config);

private:
    std::shared_ptr<const SpatialDirectory> directory_;
    std::vector<std::unique_ptr<ResolverStrategy>> strategies_;
};

} // namespace spatial
} // namespace geoinsight

#endif // GEOINSIGHT_SPATIAL_SPATIAL_RESOLVER_H_
