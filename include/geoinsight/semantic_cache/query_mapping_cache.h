#ifndef GEOINSIGHT_SEMANTIC_CACHE_QUERY_MAPPING_CACHE_H_
#define GEOINSIGHT_SEMANTIC_CACHE_QUERY_MAPPING_CACHE_H_

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "geoinsight/core/call_options.h"
#include "geoinsight/core/config.h"
#include "geoinsight/core/result.h"
#include "geoinsight/core/types.h"
#include "geoinsight/semantic_cache/query_translator.h"
#include "geoinsight/semantic_cache/structured_query.h"
#include "geoinsight/semantic_cache/text_embedder.h"
#include "geoinsight/semantic_cache/translation_worker.h"
#include "geoinsight/semantic_cache/vector_index.h"

namespace geoinsight {
namespace semantic_cache {

enum class CacheOutcome {
    EXACT_HIT,
    NEAR_HIT,
    MISS
};

const char* CacheOutcomeName(CacheOutcome outcome);

/**
 * @brief Stored mapping from a request to its structured query
 *
 * Alias entries (near-hits) point at the primary entry they reused and are
 * never added to the similarity index.
 */
struct CacheEntry {
    std::string fingerprint;
    std::string request_text;
    Embedding embedding;
    StructuredQuery query;
    std::string schema_version;
    std::string parser_identity;
    core::Timestamp created_at = 0;
    core::Timestamp updated_at = 0;
    std::optional<std::string> alias_of;
};

/**
 * @brief Outcome of resolving one request
 */
struct ResolvedQuery {
    StructuredQuery query;
    CacheOutcome outcome = CacheOutcome::MISS;
    bool fallback = false;                          // Default query used, nothing cached
    std::string fingerprint;
    std::optional<std::string> matched_fingerprint; // Entry reused by a near-hit
    std::optional<double> distance;                 // Cosine distance of the near-hit
    std::vector<std::string> warnings;
};

struct CacheStats {
    uint64_t exact_hits = 0;
    uint64_t near_hits = 0;
    uint64_t misses = 0;
    uint64_t translator_calls = 0;
    uint64_t fallbacks = 0;
    uint64_t entries = 0;
};

/**
 * @brief Semantic cache from free-text requests to structured queries
 *
 * Lifecycle: construct, init() to load persisted entries and build the
 * similarity index, resolve()/store() while serving, shutdown() (or the
 * destructor) to flush pending writes.
 *
 * Lookup order per request: exact fingerprint, nearest primary entry within
 * the configured cosine distance, then the translator. The embedder runs on
 * the calling thread; translations go through a bounded TranslationWorker.
 * A translator that fails, times out, is saturated or returns an invalid
 * query yields the default query, which is never cached. Thread-safe.
 */
class QueryMappingCache {
public:
    QueryMappingCache(std::shared_ptr<QueryTranslator> translator,
                      std::shared_ptr<TextEmbedder> embedder,
                      const core::CacheConfig& config = core::CacheConfig::Default(),
                      std::unique_ptr<VectorIndex> index = nullptr);
    ~QueryMappingCache();

    QueryMappingCache(const QueryMappingCache&) = delete;
    QueryMappingCache& operator=(const QueryMappingCache&) = delete;

    /**
     * @brief Load persisted entries; malformed lines are skipped with a warning
     */
    core::Result<void> init();

    /**
     * @brief Map request text to a structured query
     *
     * Fails only with INVALID_ARGUMENT for empty text, or with a retryable
     * TIMEOUT/CANCELLED when the caller's own deadline or cancellation fires.
     */
    core::Result<ResolvedQuery> resolve(const std::string& text,
                                        const core::CallOptions& options = core::CallOptions());

    /**
     * @brief Record a validated translation
     *
     * Idempotent per fingerprint: a second store only refreshes updated_at
     * and keeps the first translation.
     * @return The query the cache holds for the text after the call
     */
    core::Result<StructuredQuery> store(const std::string& text, const StructuredQuery& query,
                                        const std::optional<Embedding>& embedding = std::nullopt);

    /**
     * @brief Write entries to the persistence file if anything changed
     */
    core::Result<void> flush();

    /**
     * @brief Flush and stop serving; safe to call more than once
     */
    core::Result<void> shutdown();

    std::optional<CacheEntry> entry(const std::string& fingerprint) const;
    std::string fingerprint(const std::string& text) const;
    CacheStats stats() const;
    size_t size() const;

    const core::CacheConfig& config() const { return config_; }

private:
    struct Candidate {
        std::string fingerprint;
        StructuredQuery query;
        double distance;
    };

    bool is_current(const CacheEntry& entry) const;
    std::optional<Candidate> find_near(const Embedding& embedding) const;
    void record_alias(const std::string& fingerprint, const std::string& text,
                      const Embedding& embedding, const Candidate& match);
    core::Result<void> load(const std::string& path);
    core::Result<void> write(const std::string& path) const;

    std::shared_ptr<QueryTranslator> translator_;
    std::shared_ptr<TextEmbedder> embedder_;
    core::CacheConfig config_;
    std::unique_ptr<VectorIndex> index_;
    std::string parser_identity_;
    std::unique_ptr<TranslationWorker> translation_worker_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, CacheEntry> entries_;
    bool initialized_ = false;
    bool dirty_ = false;

    std::atomic<uint64_t> exact_hits_{0};
    std::atomic<uint64_t> near_hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> translator_calls_{0};
    std::atomic<uint64_t> fallbacks_{0};
};

} // namespace semantic_cache
} // namespace geoinsight

#endif // GEOINSIGHT_SEMANTIC_CACHE_QUERY_MAPPING_CACHE_H_
