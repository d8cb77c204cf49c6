#pragma once

#include <memory>
#include <stdexcept>

#include "geoinsight/spatial/spatial_resolver.h"

namespace geoinsight {
namespace testutil {

/**
 * Two districts of one province:
 *
 *   Seoul (11)
 *     Gangnam-gu (11680): k1 Yeoksam-dong, k2 Samseong-dong
 *     Seocho-gu  (11650): k3 Seocho-dong
 */
inline std::shared_ptr<spatial::SpatialDirectory> SampleDirectory() {
    auto directory = std::make_shared<spatial::SpatialDirectory>();
    bool ok = directory->add_coarsest({"11", "Seoul"}).ok() &&
              directory->add_intermediate({"11680", "Gangnam-gu", "11"}).ok() &&
              directory->add_intermediate({"11650", "Seocho-gu", "11"}).ok() &&
              directory->add_finest({"k1", "Yeoksam-dong", "1168010100"}).ok() &&
              directory->add_finest({"k2", "Samseong-dong", "1168010500"}).ok() &&
              directory->add_finest({"k3", "Seocho-dong", "1165010800"}).ok();
    if (!ok) throw std::logic_error("sample directory rejected");
    return directory;
}

inline std::shared_ptr<const spatial::SpatialResolver> SampleResolver() {
    return std::make_shared<const spatial::SpatialResolver>(SampleDirectory(),
                                                            core::SpatialConfig::Default());
}

} // namespace testutil
} // namespace geoinsight
