#ifndef GEOINSIGHT_SEMANTIC_CACHE_TEXT_EMBEDDER_H_
#define GEOINSIGHT_SEMANTIC_CACHE_TEXT_EMBEDDER_H_

#include <string>

#include "geoinsight/core/call_options.h"
#include "geoinsight/core/result.h"
#include "geoinsight/semantic_cache/vector_index.h"

namespace geoinsight {
namespace semantic_cache {

/**
 * @brief Maps request text to an embedding for similarity search
 */
class TextEmbedder {
public:
    virtual ~TextEmbedder() = default;

    virtual core::Result<Embedding> embed(const std::string& text,
                                          const core::CallOptions& options) = 0;
    virtual size_t dimension() const = 0;
};

/**
 * @brief Deterministic feature-hashing embedder
 *
 * Features are lower-cased word tokens and the byte trigrams of each token,
 * hashed into `dimension` signed buckets and L2-normalized. Texts sharing
 * most of their words land close together; it needs no model and no
 * network.
 */
class HashingEmbedder : public TextEmbedder {
public:
    explicit HashingEmbedder(size_t dimension = 256);

    core::Result<Embedding> embed(const std::string& text,
                                  const core::CallOptions& options) override;
    size_t dimension() const override { return dimension_; }

private:
    size_t dimension_;
};

} // namespace semantic_cache
} // namespace geoinsight

#endif // GEOINSIGHT_SEMANTIC_CACHE_TEXT_EMBEDDER_H_
