#include "geoinsight/semantic_cache/query_mapping_cache.h"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <future>
#include <mutex>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "geoinsight/common/logger.h"
#include "geoinsight/semantic_cache/fingerprint.h"

namespace geoinsight {
namespace semantic_cache {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

constexpr std::chrono::milliseconds kPollInterval(10);

/**
 * Queue a translation and wait for it until the deadline in `options`,
 * polling the cancellation token. A caller that gives up leaves the call to
 * finish on its worker; the result is dropped.
 */
core::Result<StructuredQuery> AwaitTranslation(TranslationWorker& worker, const std::string& text,
                                               const core::CallOptions& options) {
    auto submitted = worker.submit(text, options);
    if (!submitted.ok()) {
        return core::Result<StructuredQuery>(submitted.error_detail());
    }
    PendingTranslation pending = submitted.take_value();
    while (pending.wait_for(kPollInterval) != std::future_status::ready) {
        auto check = options.check("Translation");
        if (!check.ok()) {
            return core::Result<StructuredQuery>(check.error_detail());
        }
    }
    return pending.get();
}

void WriteString(JsonWriter& writer, const char* key, const std::string& value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

std::string SerializeEntry(const CacheEntry& entry) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    WriteString(writer, "fingerprint", entry.fingerprint);
    WriteString(writer, "request_text", entry.request_text);
    writer.Key("embedding");
    writer.StartArray();
    for (float x : entry.embedding) {
        writer.Double(static_cast<double>(x));
    }
    writer.EndArray();
    const std::string query = entry.query.ToJson();
    writer.Key("structured_query");
    writer.RawValue(query.c_str(), query.size(), rapidjson::kObjectType);
    WriteString(writer, "schema_version", entry.schema_version);
    WriteString(writer, "parser_identity", entry.parser_identity);
    writer.Key("created_at");
    writer.Int64(entry.created_at);
    writer.Key("updated_at");
    writer.Int64(entry.updated_at);
    if (entry.alias_of) {
        WriteString(writer, "alias_of", *entry.alias_of);
    }
    writer.EndObject();
    return buffer.GetString();
}

core::Result<CacheEntry> ParseEntry(const std::string& line) {
    rapidjson::Document doc;
    doc.Parse(line.c_str(), line.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return core::Result<CacheEntry>::error("not a JSON object",
                                               core::Error::Code::INVALID_ARGUMENT);
    }

    auto get_string = [&doc](const char* key, std::string& out) {
        auto it = doc.FindMember(key);
        if (it == doc.MemberEnd() || !it->value.IsString()) return false;
        out.assign(it->value.GetString(), it->value.GetStringLength());
        return true;
    };

    CacheEntry entry;
    if (!get_string("fingerprint", entry.fingerprint) ||
        !get_string("request_text", entry.request_text) ||
        !get_string("schema_version", entry.schema_version) ||
        !get_string("parser_identity", entry.parser_identity)) {
        return core::Result<CacheEntry>::error("missing required string field",
                                               core::Error::Code::INVALID_ARGUMENT);
    }
    std::string alias;
    if (get_string("alias_of", alias)) {
        entry.alias_of = alias;
    }

    auto query_it = doc.FindMember("structured_query");
    if (query_it == doc.MemberEnd() || !query_it->value.IsObject()) {
        return core::Result<CacheEntry>::error("missing structured_query",
                                               core::Error::Code::INVALID_ARGUMENT);
    }
    rapidjson::StringBuffer query_buffer;
    JsonWriter query_writer(query_buffer);
    query_it->value.Accept(query_writer);
    auto query = StructuredQuery::FromJson(query_buffer.GetString());
    if (!query.ok()) {
        return core::Result<CacheEntry>(query.error_detail());
    }
    entry.query = std::move(query).value();

    auto embedding_it = doc.FindMember("embedding");
    if (embedding_it != doc.MemberEnd() && embedding_it->value.IsArray()) {
        for (const auto& x : embedding_it->value.GetArray()) {
            if (!x.IsNumber()) {
                return core::Result<CacheEntry>::error("embedding must hold numbers",
                                                       core::Error::Code::INVALID_ARGUMENT);
            }
            entry.embedding.push_back(static_cast<float>(x.GetDouble()));
        }
    }

    auto created = doc.FindMember("created_at");
    if (created != doc.MemberEnd() && created->value.IsInt64()) {
        entry.created_at = created->value.GetInt64();
    }
    auto updated = doc.FindMember("updated_at");
    if (updated != doc.MemberEnd() && updated->value.IsInt64()) {
        entry.updated_at = updated->value.GetInt64();
    }
    return entry;
}

} // namespace

const char* CacheOutcomeName(CacheOutcome outcome) {
    switch (outcome) {
        case CacheOutcome::EXACT_HIT: return "exact_hit";
        case CacheOutcome::NEAR_HIT: return "near_hit";
        case CacheOutcome::MISS: return "miss";
    }
    return "unknown";
}

QueryMappingCache::QueryMappingCache(std::shared_ptr<QueryTranslator> translator,
                                     std::shared_ptr<TextEmbedder> embedder,
                                     const core::CacheConfig& config,
                                     std::unique_ptr<VectorIndex> index)
    : translator_(std::move(translator)),
      embedder_(std::move(embedder)),
      config_(config),
      index_(std::move(index)) {
    if (!translator_ || !embedder_) {
        throw core::InvalidArgumentError("QueryMappingCache requires a translator and an embedder");
    }
    if (embedder_->dimension() != config_.embedding_dimension) {
        throw core::InvalidArgumentError(
            "Embedder dimension " + std::to_string(embedder_->dimension()) +
            " does not match cache.embedding_dimension " +
            std::to_string(config_.embedding_dimension));
    }
    if (!index_) {
        index_ = std::make_unique<FlatVectorIndex>(config_.embedding_dimension);
    }
    if (index_->dimension() != config_.embedding_dimension) {
        throw core::InvalidArgumentError("Vector index dimension does not match the embedder");
    }
    parser_identity_ = translator_->identity();
    translation_worker_ = std::make_unique<TranslationWorker>(
        translator_, config_.translator_workers, config_.translator_queue_capacity);
}

QueryMappingCache::~QueryMappingCache() {
    auto result = shutdown();
    if (!result.ok()) {
        GEOINSIGHT_ERROR("Query mapping cache flush on shutdown failed: {}", result.error());
    }
}

core::Result<void> QueryMappingCache::init() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (initialized_) {
        return core::Result<void>();
    }
    if (!config_.persistence_path.empty()) {
        auto loaded = load(config_.persistence_path);
        if (!loaded.ok()) {
            return loaded;
        }
    }
    initialized_ = true;
    GEOINSIGHT_INFO("Query mapping cache ready: {} entries, {} indexed, parser '{}', schema v{}",
                    entries_.size(), index_->size(), parser_identity_, config_.schema_version);
    return core::Result<void>();
}

core::Result<void> QueryMappingCache::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        GEOINSIGHT_INFO("No persisted query mappings at {}", path);
        return core::Result<void>();
    }

    std::string line;
    size_t line_number = 0;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        auto parsed = ParseEntry(line);
        if (!parsed.ok()) {
            ++skipped;
            GEOINSIGHT_WARN("Skipping query mapping line {} of {}: {}", line_number, path,
                            parsed.error());
            continue;
        }
        CacheEntry entry = std::move(parsed).value();
        // Entries from another schema or parser stay on disk but never
        // occupy neighbour slots.
        if (!entry.alias_of && !entry.embedding.empty() && is_current(entry)) {
            auto inserted = index_->insert(entry.embedding, entry.fingerprint);
            if (!inserted.ok()) {
                GEOINSIGHT_WARN("Query mapping {} not indexed: {}", entry.fingerprint,
                                inserted.error());
            }
        }
        std::string key = entry.fingerprint;
        entries_[key] = std::move(entry);
    }
    if (file.bad()) {
        return core::Result<void>::error("Failed reading query mappings from " + path,
                                         core::Error::Code::INTERNAL);
    }
    if (skipped > 0) {
        GEOINSIGHT_WARN("Skipped {} malformed query mapping lines in {}", skipped, path);
    }
    return core::Result<void>();
}

bool QueryMappingCache::is_current(const CacheEntry& entry) const {
    return entry.schema_version == config_.schema_version &&
           entry.parser_identity == parser_identity_;
}

std::string QueryMappingCache::fingerprint(const std::string& text) const {
    return RequestFingerprint(text, parser_identity_, config_.schema_version);
}

core::Result<ResolvedQuery> QueryMappingCache::resolve(const std::string& text,
                                                       const core::CallOptions& options) {
    auto check = options.check("Query resolution");
    if (!check.ok()) return core::Result<ResolvedQuery>(check.error_detail());

    const std::string normalized = NormalizeRequestText(text);
    if (normalized.empty()) {
        return core::Result<ResolvedQuery>(core::InvalidArgumentError("Request text is empty"));
    }

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!initialized_) {
            return core::Result<ResolvedQuery>(
                core::InternalError("Query mapping cache used before init()"));
        }
    }

    ResolvedQuery resolved;
    resolved.fingerprint = fingerprint(text);

    // Exact hit
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(resolved.fingerprint);
        if (it != entries_.end() && is_current(it->second)) {
            it->second.updated_at = core::NowMillis();
            dirty_ = true;
            resolved.query = it->second.query;
            resolved.outcome = CacheOutcome::EXACT_HIT;
            resolved.matched_fingerprint = it->second.alias_of ? it->second.alias_of
                                                               : std::optional<std::string>();
            exact_hits_++;
            GEOINSIGHT_DEBUG("Query cache exact hit {}", resolved.fingerprint);
            return resolved;
        }
    }

    // Near hit
    std::optional<Embedding> embedding;
    {
        const auto embed_options = options.bounded_by(config_.embedding_timeout);
        core::Result<Embedding> embedded = Embedding();
        try {
            embedded = embedder_->embed(normalized, embed_options);
        } catch (const std::exception& e) {
            embedded = core::Result<Embedding>(
                core::UpstreamUnavailableError(std::string("Embedding failed: ") + e.what()));
        }
        if (embedded.ok()) {
            embedding = std::move(embedded).value();
        } else {
            auto caller = options.check("Query resolution");
            if (!caller.ok()) return core::Result<ResolvedQuery>(caller.error_detail());
            resolved.warnings.push_back("embedding unavailable: " + embedded.error());
            GEOINSIGHT_WARN("Embedding failed, skipping similarity lookup: {}", embedded.error());
        }
    }

    if (embedding) {
        auto match = find_near(*embedding);
        if (match) {
            record_alias(resolved.fingerprint, text, *embedding, *match);
            resolved.query = match->query;
            resolved.outcome = CacheOutcome::NEAR_HIT;
            resolved.matched_fingerprint = match->fingerprint;
            resolved.distance = match->distance;
            near_hits_++;
            GEOINSIGHT_DEBUG("Query cache near hit {} -> {} (distance {:.4f})",
                             resolved.fingerprint, match->fingerprint, match->distance);
            return resolved;
        }
    }

    // Miss
    misses_++;
    translator_calls_++;
    resolved.outcome = CacheOutcome::MISS;
    const auto translate_options = options.bounded_by(config_.translator_timeout);
    auto translated = AwaitTranslation(*translation_worker_, normalized, translate_options);

    if (translated.ok()) {
        auto valid = translated.value().validate();
        if (!valid.ok()) {
            translated = core::Result<StructuredQuery>(core::UpstreamUnavailableError(
                "Translator returned an invalid query: " + valid.error()));
        }
    }

    if (!translated.ok()) {
        auto caller = options.check("Query resolution");
        if (!caller.ok()) return core::Result<ResolvedQuery>(caller.error_detail());

        fallbacks_++;
        GEOINSIGHT_WARN("Translator unavailable ({}), using default query: {}",
                        core::CodeName(translated.error_code()), translated.error());
        resolved.query = StructuredQuery::Default();
        resolved.fallback = true;
        resolved.warnings.push_back("translator unavailable: " + translated.error());
        return resolved;
    }

    // A concurrent miss on the same fingerprint may have stored first; answer
    // with whatever the cache now holds.
    auto stored = store(text, translated.value(), embedding);
    if (stored.ok()) {
        resolved.query = stored.take_value();
    } else {
        resolved.query = translated.value();
        GEOINSIGHT_WARN("Translated query not cached: {}", stored.error());
        resolved.warnings.push_back("translation not cached: " + stored.error());
    }
    GEOINSIGHT_DEBUG("Query cache miss {} translated by '{}'", resolved.fingerprint,
                     parser_identity_);
    return resolved;
}

std::optional<QueryMappingCache::Candidate> QueryMappingCache::find_near(
    const Embedding& embedding) const {
    auto neighbors = index_->query(embedding, config_.top_k);
    if (!neighbors.ok()) {
        GEOINSIGHT_WARN("Similarity lookup failed: {}", neighbors.error());
        return std::nullopt;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& neighbor : neighbors.value()) {
        if (neighbor.distance > config_.max_distance) break;
        auto it = entries_.find(neighbor.id);
        if (it == entries_.end()) continue;
        const CacheEntry& entry = it->second;
        if (entry.alias_of || !is_current(entry)) continue;
        return Candidate{entry.fingerprint, entry.query, neighbor.distance};
    }
    return std::nullopt;
}

void QueryMappingCache::record_alias(const std::string& fingerprint, const std::string& text,
                                     const Embedding& embedding, const Candidate& match) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto now = core::NowMillis();
    auto it = entries_.find(fingerprint);
    if (it != entries_.end() && is_current(it->second)) {
        it->second.updated_at = now;
        dirty_ = true;
        return;
    }

    CacheEntry alias;
    alias.fingerprint = fingerprint;
    alias.request_text = text;
    alias.embedding = embedding;
    alias.query = match.query;
    alias.schema_version = config_.schema_version;
    alias.parser_identity = parser_identity_;
    alias.created_at = now;
    alias.updated_at = now;
    alias.alias_of = match.fingerprint;
    entries_[fingerprint] = std::move(alias);
    dirty_ = true;
}

core::Result<StructuredQuery> QueryMappingCache::store(const std::string& text,
                                                       const StructuredQuery& query,
                                                       const std::optional<Embedding>& embedding) {
    auto valid = query.validate();
    if (!valid.ok()) {
        return core::Result<StructuredQuery>(valid.error_detail());
    }

    const std::string key = fingerprint(text);
    const auto now = core::NowMillis();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && is_current(it->second)) {
        CacheEntry& existing = it->second;
        if (existing.query != query) {
            GEOINSIGHT_DEBUG("Keeping first translation for {}; discarding a different one", key);
        }
        existing.updated_at = now;
        dirty_ = true;
        return existing.query;
    }

    CacheEntry entry;
    entry.fingerprint = key;
    entry.request_text = text;
    entry.query = query;
    entry.schema_version = config_.schema_version;
    entry.parser_identity = parser_identity_;
    entry.created_at = now;
    entry.updated_at = now;
    if (embedding) {
        entry.embedding = *embedding;
    }
    entries_[key] = entry;
    dirty_ = true;

    if (!entry.embedding.empty()) {
        auto inserted = index_->insert(entry.embedding, key);
        if (!inserted.ok()) {
            return core::Result<StructuredQuery>(inserted.error_detail());
        }
    }
    return entry.query;
}

core::Result<void> QueryMappingCache::flush() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (config_.persistence_path.empty() || !dirty_) {
        return core::Result<void>();
    }
    auto written = write(config_.persistence_path);
    if (written.ok()) {
        dirty_ = false;
        GEOINSIGHT_DEBUG("Flushed {} query mappings to {}", entries_.size(),
                         config_.persistence_path);
    }
    return written;
}

core::Result<void> QueryMappingCache::write(const std::string& path) const {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return core::Result<void>::error("Cannot open " + tmp + " for writing",
                                             core::Error::Code::INTERNAL);
        }
        for (const auto& [key, entry] : entries_) {
            out << SerializeEntry(entry) << '\n';
        }
        out.flush();
        if (!out) {
            return core::Result<void>::error("Failed writing " + tmp, core::Error::Code::INTERNAL);
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        return core::Result<void>::error("Cannot replace " + path, core::Error::Code::INTERNAL);
    }
    return core::Result<void>();
}

core::Result<void> QueryMappingCache::shutdown() {
    auto flushed = flush();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (initialized_) {
        initialized_ = false;
        GEOINSIGHT_INFO("Query mapping cache shut down (exact={}, near={}, miss={}, fallback={})",
                        exact_hits_.load(), near_hits_.load(), misses_.load(), fallbacks_.load());
    }
    return flushed;
}

std::optional<CacheEntry> QueryMappingCache::entry(const std::string& fingerprint) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

CacheStats QueryMappingCache::stats() const {
    CacheStats stats;
    stats.exact_hits = exact_hits_.load();
    stats.near_hits = near_hits_.load();
    stats.misses = misses_.load();
    stats.translator_calls = translator_calls_.load();
    stats.fallbacks = fallbacks_.load();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.entries = entries_.size();
    return stats;
}

size_t QueryMappingCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace semantic_cache
} // namespace geoinsight
