#ifndef GEOINSIGHT_SEMANTIC_CACHE_FINGERPRINT_H_
#define GEOINSIGHT_SEMANTIC_CACHE_FINGERPRINT_H_

#include <string>

namespace geoinsight {
namespace semantic_cache {

/**
 * @brief Trim and collapse runs of whitespace to a single space
 *
 * Case and punctuation are preserved; only layout differences are folded.
 */
std::string NormalizeRequestText(const std::string& text);

/**
 * @brief Hex SHA-256 of the length-prefixed (normalized text, parser
 * identity, schema version) triple
 */
std::string RequestFingerprint(const std::string& text,
                               const std::string& parser_identity,
                               const std::string& schema_version);

/**
 * @brief Hex SHA-256 of raw bytes
 */
std::string Sha256Hex(const std::string& data);

} // namespace semantic_cache
} // namespace geoinsight

#endif // GEOINSIGHT_SEMANTIC_CACHE_FINGERPRINT_H_
