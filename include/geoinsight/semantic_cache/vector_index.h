#ifndef GEOINSIGHT_SEMANTIC_CACHE_VECTOR_INDEX_H_
#define GEOINSIGHT_SEMANTIC_CACHE_VECTOR_INDEX_H_

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "geoinsight/core/result.h"

namespace geoinsight {
namespace semantic_cache {

using Embedding = std::vector<float>;

struct Neighbor {
    std::string id;
    double distance;  // Cosine distance, 1 - similarity, within [0, 2]
};

/**
 * @brief Nearest-neighbour search over embeddings
 */
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    /**
     * @brief Add or replace the vector stored under `id`
     */
    virtual core::Result<void> insert(const Embedding& vector, const std::string& id) = 0;

    /**
     * @brief Up to `k` neighbours ordered by ascending distance
     */
    virtual core::Result<std::vector<Neighbor>> query(const Embedding& vector, size_t k) const = 0;

    virtual size_t size() const = 0;
    virtual size_t dimension() const = 0;
};

/**
 * @brief Exact brute-force cosine index
 *
 * Vectors are normalized on insert so a lookup is one dot product per entry.
 */
class FlatVectorIndex : public VectorIndex {
public:
    explicit FlatVectorIndex(size_t dimension);

    core::Result<void> insert(const Embedding& vector, const std::string& id) override;
    core::Result<std::vector<Neighbor>> query(const Embedding& vector, size_t k) const override;
    size_t size() const override;
    size_t dimension() const override { return dimension_; }

private:
    core::Result<Embedding> normalized(const Embedding& vector) const;

    size_t dimension_;
    mutable std::shared_mutex mutex_;
    std::vector<std::string> ids_;
    std::vector<Embedding> vectors_;
    std::unordered_map<std::string, size_t> positions_;
};

/**
 * @brief 1 - cos(a, b); INVALID_ARGUMENT on dimension mismatch or a zero vector
 */
core::Result<double> CosineDistance(const Embedding& a, const Embedding& b);

} // namespace semantic_cache
} // namespace geoinsight

#endif // GEOINSIGHT_SEMANTIC_CACHE_VECTOR_INDEX_H_
