#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "geoinsight/core/result.h"
#include "geoinsight/core/types.h"

namespace geoinsight {
namespace core {

/**
 * @brief Administrative code layout used by the spatial resolver
 */
struct SpatialConfig {
    size_t intermediate_code_width;  // Leading digits identifying the intermediate unit
    size_t coarsest_code_width;      // Leading digits identifying the coarsest unit

    SpatialConfig() : intermediate_code_width(5), coarsest_code_width(2) {}

    static SpatialConfig Default() {
        return SpatialConfig();
    }
};

/**
 * @brief Configuration for the windowed metrics engine
 */
struct MetricsConfig {
    std::string granularity;     // Fact granularity consumed by the engine
    size_t prior_period_lag;     // Rows back for the month-over-month delta
    size_t prior_year_lag;       // Rows back for the year-over-year delta

    MetricsConfig() : granularity(kMonthlyGranularity), prior_period_lag(1), prior_year_lag(12) {}

    static MetricsConfig Default() {
        return MetricsConfig();
    }
};

/**
 * @brief Boundary validation and defaults for the exposed operations
 */
struct QueryConfig {
    Level default_level;
    size_t max_top_k;
    size_t default_top_k;
    double default_z_threshold;
    double anomaly_highlight_threshold;  // |z| reported as a highlight in series summaries
    size_t highlight_limit;

    QueryConfig() : default_level(Level::INTERMEDIATE), max_top_k(100), default_top_k(10),
                    default_z_threshold(2.0), anomaly_highlight_threshold(2.0),
                    highlight_limit(5) {}

    static QueryConfig Default() {
        return QueryConfig();
    }
};

/**
 * @brief Configuration for the semantic query cache
 */
struct CacheConfig {
    double max_distance;                          // Cosine distance accepted as a near-hit
    size_t top_k;                                 // Neighbours examined per lookup
    std::string schema_version;                   // Structured-query schema the entries must match
    size_t embedding_dimension;                   // Dimension of stored embeddings
    std::chrono::milliseconds translator_timeout; // Upper bound on one translation call
    std::chrono::milliseconds embedding_timeout;  // Upper bound on one embedding call
    size_t translator_workers;                    // Threads running translator calls
    size_t translator_queue_capacity;             // Translations waiting beyond that; more fall back
    std::string persistence_path;                 // JSON-lines file; empty keeps the cache in memory

    CacheConfig() : max_distance(0.08), top_k(5), schema_version("2"),
                    embedding_dimension(256),
                    translator_timeout(30000), embedding_timeout(2000),
                    translator_workers(2), translator_queue_capacity(8) {}

    static CacheConfig Default() {
        return CacheConfig();
    }

    static CacheConfig InMemory() {
        CacheConfig config;
        config.persistence_path.clear();
        return config;
    }
};

/**
 * @brief Configuration for the advanced insight refresh job
 */
struct RefreshConfig {
    std::chrono::milliseconds timeout;       // Default refresh deadline
    std::chrono::milliseconds lock_timeout;  // Wait for a concurrent refresh to finish

    RefreshConfig() : timeout(60000), lock_timeout(5000) {}

    static RefreshConfig Default() {
        return RefreshConfig();
    }
};

/**
 * @brief Global configuration
 */
struct Config {
    SpatialConfig spatial;
    MetricsConfig metrics;
    QueryConfig query;
    CacheConfig cache;
    RefreshConfig refresh;
    std::string log_level;

    Config() : log_level("info") {}

    static Config Default() {
        return Config();
    }

    /**
     * @brief Check ranges and cross-field constraints
     */
    Result<void> validate() const;

    /**
     * @brief Parse a JSON document; keys that are absent keep their defaults
     *
     * Layout:
     * ```
     * {
     *   "log_level": "info",
     *   "spatial": {"intermediate_code_width": 5, "coarsest_code_width": 2},
     *   "metrics": {"granularity": "month", "prior_year_lag": 12},
     *   "query":   {"default_level": "intermediate", "max_top_k": 100},
     *   "cache":   {"max_distance": 0.08, "top_k": 5, "schema_version": "2",
     *               "embedding_dimension": 256, "translator_timeout_ms": 30000,
     *               "embedding_timeout_ms": 2000, "translator_workers": 2,
     *               "translator_queue_capacity": 8, "persistence_path": ""},
     *   "refresh": {"timeout_ms": 60000, "lock_timeout_ms": 5000}
     * }
     * ```
     */
    static Result<Config> FromJsonString(const std::string& json);
    static Result<Config> FromJsonFile(const std::string& path);
};

} // namespace core
} // namespace geoinsight
