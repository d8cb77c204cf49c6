#include "geoinsight/semantic_cache/query_translator.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <regex>

#include "geoinsight/common/logger.h"

namespace geoinsight {
namespace semantic_cache {

namespace {

std::string Lower(const std::string& text) {
    std::string out = text;
    for (auto& c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x80) c = static_cast<char>(std::tolower(u));
    }
    return out;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) return true;
    }
    return false;
}

// Whole-word level keywords; finest wins over coarsest, coarsest over intermediate.
const char* MatchLevel(const std::string& text) {
    static const std::regex kFinest(R"(\b(?:finest|norm|emd)\b)");
    static const std::regex kCoarsest(R"(\b(?:coarsest|province|sido)\b)");
    static const std::regex kIntermediate(R"(\b(?:intermediate|district|sig)\b)");
    if (std::regex_search(text, kFinest)) return "finest";
    if (std::regex_search(text, kCoarsest)) return "coarsest";
    if (std::regex_search(text, kIntermediate)) return "intermediate";
    return nullptr;
}

std::vector<std::string> ExtractPeriods(const std::string& text) {
    static const std::regex kPeriod(R"((?:^|[^0-9])((?:19|20)\d{2}(?:-(?:0[1-9]|1[0-2])(?:-\d{2})?)?)(?![0-9]))");
    std::vector<std::string> periods;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), kPeriod);
         it != std::sregex_iterator(); ++it) {
        periods.push_back((*it)[1].str());
    }
    return periods;
}

} // namespace

RuleBasedTranslator::RuleBasedTranslator(std::vector<std::string> regions)
    : regions_(std::move(regions)) {
    // Longest name first so "Gangnam-gu Yeoksam" wins over "Gangnam-gu".
    std::sort(regions_.begin(), regions_.end(), [](const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a < b;
    });
    regions_.erase(std::unique(regions_.begin(), regions_.end()), regions_.end());
}

core::Result<StructuredQuery> RuleBasedTranslator::translate(const std::string& text,
                                                             const core::CallOptions& options) {
    auto check = options.check("Translation");
    if (!check.ok()) return core::Result<StructuredQuery>(check.error_detail());

    const std::string lower = Lower(text);
    if (lower.find_first_not_of(" \t\r\n") == std::string::npos) {
        return core::Result<StructuredQuery>::error("Empty request text",
                                                    core::Error::Code::INVALID_ARGUMENT);
    }

    StructuredQuery query;
    if (ContainsAny(lower, {"correlat", "impact", "advanced", "상관", "영향"})) {
        query.operation = Operation::GET_ADVANCED_INSIGHT;
    } else if (ContainsAny(lower, {"anomal", "outlier", "unusual", "이상"})) {
        query.operation = Operation::DETECT_ANOMALY;
    } else if (ContainsAny(lower, {"rank", "top", "highest", "best", "순위"})) {
        query.operation = Operation::GET_RANKINGS;
    } else {
        query.operation = Operation::COMPARE_DOMAINS;
    }

    const bool wants_sales = ContainsAny(lower, {"sales", "revenue", "매출"});
    const bool wants_population = ContainsAny(lower, {"population", "foot traffic", "foot_traffic",
                                                      "visitors", "유동"});
    if (wants_population) query.domains.push_back("population");
    if (wants_sales) query.domains.push_back("sales");

    switch (query.operation) {
        case Operation::GET_RANKINGS: {
            query.metric = (wants_sales && !wants_population) ? "sales" : "foot_traffic";
            query.domains.clear();
            std::smatch match;
            static const std::regex kTopK(R"(top\s*(\d{1,3}))");
            if (std::regex_search(lower, match, kTopK)) {
                int k = std::stoi(match[1].str());
                if (k > 0) query.top_k = static_cast<uint32_t>(std::min(k, 100));
            }
            break;
        }
        case Operation::DETECT_ANOMALY: {
            if (query.domains.size() != 1) {
                query.domains = {wants_sales && !wants_population ? "sales" : "population"};
            }
            std::smatch match;
            static const std::regex kThreshold(
                R"((?:z-score|zscore|z|sigma)\s*(?:threshold)?\s*(?:>=|=|of)?\s*(\d+(?:\.\d+)?))");
            if (std::regex_search(lower, match, kThreshold)) {
                double z = std::stod(match[1].str());
                if (z > 0.0) query.z_threshold = z;
            }
            break;
        }
        default:
            if (query.domains.empty()) {
                query.domains = {"population", "sales"};
            }
            break;
    }

    if (const char* level = MatchLevel(lower)) {
        query.level = level;
    }

    for (const auto& region : regions_) {
        if (!region.empty() && text.find(region) != std::string::npos) {
            query.region = region;
            break;
        }
    }

    auto periods = ExtractPeriods(text);
    if (query.operation == Operation::COMPARE_DOMAINS && !periods.empty()) {
        query.period_from = periods.front();
        query.period_to = periods.size() > 1 ? periods[1] : periods.front();
    } else if (!periods.empty()) {
        query.period = periods.back();
    }

    GEOINSIGHT_DEBUG("Rule-based translation: {}", query.ToJson());
    return query;
}

} // namespace semantic_cache
} // namespace geoinsight
