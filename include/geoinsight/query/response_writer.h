#ifndef GEOINSIGHT_QUERY_RESPONSE_WRITER_H_
#define GEOINSIGHT_QUERY_RESPONSE_WRITER_H_

#include <string>

#include "geoinsight/core/error.h"
#include "geoinsight/query/insight_service.h"

namespace geoinsight {
namespace query {

/**
 * @brief JSON rendering of operation results
 *
 * Every document is an object with the operation payload under "data" and
 * the provenance under "metadata". Absent values are written as null,
 * timestamps as ISO-8601 UTC.
 */
class ResponseWriter {
public:
    static std::string Write(const CompareDomainsResult& result);
    static std::string Write(const RankingsResult& result);
    static std::string Write(const AnomalyResult& result);
    static std::string Write(const AdvancedInsightResult& result);
    static std::string Write(const SeriesSummary& result);

    /**
     * @brief {"error": {"code", "message", "retryable"}}
     */
    static std::string WriteError(const core::Error& error);
};

} // namespace query
} // namespace geoinsight

#endif // GEOINSIGHT_QUERY_RESPONSE_WRITER_H_
