#include "geoinsight/semantic_cache/vector_index.h"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace geoinsight {
namespace semantic_cache {

namespace {

double Norm(const Embedding& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    return std::sqrt(sum);
}

double Dot(const Embedding& a, const Embedding& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) sum += static_cast<double>(a[i]) * b[i];
    return sum;
}

} // namespace

core::Result<double> CosineDistance(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        return core::Result<double>::error("Embedding dimensions differ",
                                           core::Error::Code::INVALID_ARGUMENT);
    }
    double na = Norm(a);
    double nb = Norm(b);
    if (na == 0.0 || nb == 0.0) {
        return core::Result<double>::error("Cosine distance of a zero vector",
                                           core::Error::Code::INVALID_ARGUMENT);
    }
    double similarity = std::max(-1.0, std::min(1.0, Dot(a, b) / (na * nb)));
    return 1.0 - similarity;
}

FlatVectorIndex::FlatVectorIndex(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw core::InvalidArgumentError("Vector index dimension must be positive");
    }
}

core::Result<Embedding> FlatVectorIndex::normalized(const Embedding& vector) const {
    if (vector.size() != dimension_) {
        return core::Result<Embedding>::error(
            "Expected embedding of dimension " + std::to_string(dimension_) + ", got " +
                std::to_string(vector.size()),
            core::Error::Code::INVALID_ARGUMENT);
    }
    double norm = Norm(vector);
    if (norm == 0.0 || !std::isfinite(norm)) {
        return core::Result<Embedding>::error("Embedding has no direction",
                                              core::Error::Code::INVALID_ARGUMENT);
    }
    Embedding out(vector.size());
    for (size_t i = 0; i < vector.size(); ++i) {
        out[i] = static_cast<float>(vector[i] / norm);
    }
    return out;
}

core::Result<void> FlatVectorIndex::insert(const Embedding& vector, const std::string& id) {
    auto unit = normalized(vector);
    if (!unit.ok()) return core::Result<void>(unit.error_detail());

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it != positions_.end()) {
        vectors_[it->second] = std::move(unit).value();
    } else {
        positions_.emplace(id, ids_.size());
        ids_.push_back(id);
        vectors_.push_back(std::move(unit).value());
    }
    return core::Result<void>();
}

core::Result<std::vector<Neighbor>> FlatVectorIndex::query(const Embedding& vector, size_t k) const {
    auto unit = normalized(vector);
    if (!unit.ok()) return core::Result<std::vector<Neighbor>>(unit.error_detail());
    const Embedding& q = unit.value();

    std::vector<Neighbor> neighbors;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        neighbors.reserve(ids_.size());
        for (size_t i = 0; i < ids_.size(); ++i) {
            double similarity = std::max(-1.0, std::min(1.0, Dot(q, vectors_[i])));
            neighbors.push_back(Neighbor{ids_[i], 1.0 - similarity});
        }
    }

    auto by_distance = [](const Neighbor& a, const Neighbor& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.id < b.id;
    };
    if (k < neighbors.size()) {
        std::partial_sort(neighbors.begin(), neighbors.begin() + k, neighbors.end(), by_distance);
        neighbors.resize(k);
    } else {
        std::sort(neighbors.begin(), neighbors.end(), by_distance);
    }
    return neighbors;
}

size_t FlatVectorIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ids_.size();
}

} // namespace semantic_cache
} // namespace geoinsight
