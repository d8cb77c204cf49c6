#include "geoinsight/semantic_cache/text_embedder.h"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <vector>

namespace geoinsight {
namespace semantic_cache {

namespace {

constexpr float kTrigramWeight = 0.5f;

uint64_t Fnv1a(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

// ASCII letters are lower-cased; other bytes (UTF-8 continuation included)
// pass through so non-Latin words stay intact.
std::vector<std::string> Tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (c < 0x80 && !std::isalnum(c)) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

void AddFeature(Embedding& vec, const std::string& feature, float weight) {
    uint64_t hash = Fnv1a(feature);
    size_t bucket = static_cast<size_t>(hash % vec.size());
    float sign = (hash >> 63) ? -1.0f : 1.0f;
    vec[bucket] += sign * weight;
}

} // namespace

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw core::InvalidArgumentError("Embedding dimension must be positive");
    }
}

core::Result<Embedding> HashingEmbedder::embed(const std::string& text,
                                               const core::CallOptions& options) {
    auto check = options.check("Embedding");
    if (!check.ok()) return core::Result<Embedding>(check.error_detail());

    auto tokens = Tokenize(text);
    if (tokens.empty()) {
        return core::Result<Embedding>::error("Nothing to embed in request text",
                                              core::Error::Code::INVALID_ARGUMENT);
    }

    Embedding vec(dimension_, 0.0f);
    for (const auto& token : tokens) {
        AddFeature(vec, "w:" + token, 1.0f);
        const std::string padded = "^" + token + "$";
        for (size_t i = 0; i + 3 <= padded.size(); ++i) {
            AddFeature(vec, "t:" + padded.substr(i, 3), kTrigramWeight);
        }
    }

    double norm = 0.0;
    for (float x : vec) norm += static_cast<double>(x) * x;
    norm = std::sqrt(norm);
    if (norm == 0.0) {
        return core::Result<Embedding>::error("Hashed features cancelled out",
                                              core::Error::Code::INVALID_ARGUMENT);
    }
    for (auto& x : vec) x = static_cast<float>(x / norm);
    return vec;
}

} // namespace semantic_cache
} // namespace geoinsight
