#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "geoinsight/analytics/advanced_insight.h"
#include "geoinsight/analytics/insight_candidates.h"
#include "geoinsight/common/logger.h"
#include "geoinsight/core/config.h"
#include "geoinsight/query/command_line.h"
#include "geoinsight/query/insight_service.h"
#include "geoinsight/query/request_pipeline.h"
#include "geoinsight/query/response_writer.h"
#include "geoinsight/semantic_cache/query_mapping_cache.h"
#include "geoinsight/semantic_cache/query_translator.h"
#include "geoinsight/semantic_cache/text_embedder.h"
#include "geoinsight/spatial/spatial_resolver.h"
#include "geoinsight/storage/dataset_loader.h"
#include "geoinsight/storage/fact_store.h"

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " --dataset FILE [OPTIONS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --dataset FILE       JSON dataset (spatial directory and facts)" << std::endl;
    std::cout << "  --config FILE        JSON configuration" << std::endl;
    std::cout << "  --query TEXT         Free-text request resolved through the semantic cache" << std::endl;
    std::cout << "  --operation NAME     compare_domains, get_rankings, detect_anomaly," << std::endl;
    std::cout << "                       get_advanced_insight or summarize_series" << std::endl;
    std::cout << "  --region NAME        Spatial unit name or raw key" << std::endl;
    std::cout << "  --period P           YYYY, YYYY-MM or YYYY-MM-DD" << std::endl;
    std::cout << "  --period-from P      Lower bound for compare_domains" << std::endl;
    std::cout << "  --period-to P        Upper bound for compare_domains" << std::endl;
    std::cout << "  --domains LIST       Comma separated: population,sales" << std::endl;
    std::cout << "  --metric NAME        foot_traffic or sales (default: foot_traffic)" << std::endl;
    std::cout << "  --top-k N            Rankings size (default from config)" << std::endl;
    std::cout << "  --z-threshold Z      Anomaly threshold (default from config)" << std::endl;
    std::cout << "  --level NAME         finest, intermediate or coarsest" << std::endl;
    std::cout << "  --refresh            Refresh advanced insights before answering" << std::endl;
    std::cout << "  --log-level LEVEL    trace, debug, info, warn, error, off" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

template <typename T>
int Print(const geoinsight::core::Result<T>& result) {
    if (!result.ok()) {
        std::cout << geoinsight::query::ResponseWriter::WriteError(result.error_detail()) << std::endl;
        return 1;
    }
    std::cout << geoinsight::query::ResponseWriter::Write(result.value()) << std::endl;
    return 0;
}

int RunOperation(const geoinsight::query::CommandLineOptions& options,
                 const geoinsight::query::InsightService& service) {
    const auto& config = service.config();
    std::vector<std::string> domains = geoinsight::query::SplitList(options.domains);

    if (options.operation == "compare_domains") {
        if (domains.empty()) domains = {"population", "sales"};
        std::string from = options.period_from.empty() ? options.period : options.period_from;
        std::string to = options.period_to.empty() ? options.period : options.period_to;
        return Print(service.compare_domains(options.region, from, to, domains, options.level));
    }
    if (options.operation == "get_rankings") {
        size_t top_k = options.top_k.value_or(config.default_top_k);
        return Print(service.get_rankings(options.metric, options.period, top_k, options.level));
    }
    if (options.operation == "detect_anomaly") {
        std::string domain = domains.empty() ? "population" : domains.front();
        double z = options.z_threshold.value_or(config.default_z_threshold);
        return Print(service.detect_anomaly(options.region, domain, options.period, z, options.level));
    }
    if (options.operation == "get_advanced_insight") {
        if (domains.empty()) domains = {"population", "sales"};
        return Print(service.get_advanced_insight(options.region, options.period, domains,
                                                  options.level));
    }
    if (options.operation == "summarize_series") {
        return Print(service.summarize_series(options.region, options.level));
    }
    std::cerr << "Unknown operation: " << options.operation << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    geoinsight::common::Logger::Init();

    auto parsed = geoinsight::query::ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    if (!parsed.ok()) {
        std::cout << geoinsight::query::ResponseWriter::WriteError(parsed.error_detail()) << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return 1;
    }
    const geoinsight::query::CommandLineOptions& options = parsed.value();
    if (options.help) {
        PrintUsage(argv[0]);
        return 0;
    }

    try {
        using namespace geoinsight;

        core::Config config = core::Config::Default();
        if (!options.config_path.empty()) {
            auto loaded = core::Config::FromJsonFile(options.config_path);
            if (!loaded.ok()) {
                std::cerr << "Failed to load config: " << loaded.error() << std::endl;
                return 1;
            }
            config = loaded.value();
        }
        const std::string& level_name = options.log_level.empty() ? config.log_level : options.log_level;
        if (!common::Logger::SetLevel(level_name)) {
            std::cerr << "Unknown log level: " << level_name << ". Using default (info)." << std::endl;
        }

        auto dataset = storage::LoadDataset(options.dataset_path);
        if (!dataset.ok()) {
            std::cerr << "Failed to load dataset: " << dataset.error() << std::endl;
            return 1;
        }

        auto store = std::make_shared<storage::InMemoryFactStore>();
        store->upsert_batch(dataset.value().activity, dataset.value().demographics);

        auto resolver = std::make_shared<spatial::SpatialResolver>(dataset.value().directory,
                                                                   config.spatial);
        auto candidates = std::make_shared<analytics::InsightCandidateAggregator>(resolver,
                                                                                  config.metrics);
        auto advanced = std::make_shared<analytics::AdvancedInsightAggregator>(store, candidates,
                                                                               config.refresh);
        const bool needs_advanced = options.refresh || !options.query_text.empty() ||
                                    options.operation == "get_advanced_insight";
        if (needs_advanced) {
            auto refreshed = advanced->refresh();
            if (!refreshed.ok()) {
                GEOINSIGHT_WARN("Advanced insight refresh failed: {}", refreshed.error());
            }
        }

        auto service = std::make_shared<query::InsightService>(store, candidates, advanced,
                                                               config.query);

        if (options.query_text.empty()) {
            return RunOperation(options, *service);
        }

        auto translator = std::make_shared<semantic_cache::RuleBasedTranslator>(
            dataset.value().directory->names());
        auto embedder = std::make_shared<semantic_cache::HashingEmbedder>(
            config.cache.embedding_dimension);
        auto cache = std::make_shared<semantic_cache::QueryMappingCache>(translator, embedder,
                                                                         config.cache);
        auto init = cache->init();
        if (!init.ok()) {
            std::cerr << "Failed to initialize query cache: " << init.error() << std::endl;
            return 1;
        }

        query::RequestPipeline pipeline(cache, service);
        auto response = pipeline.run(options.query_text);
        int status = 0;
        if (response.ok()) {
            std::cout << response.value().body << std::endl;
        } else {
            std::cout << query::ResponseWriter::WriteError(response.error_detail()) << std::endl;
            status = 1;
        }

        auto closed = cache->shutdown();
        if (!closed.ok()) {
            std::cerr << "Failed to flush query cache: " << closed.error() << std::endl;
            status = 1;
        }
        return status;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
