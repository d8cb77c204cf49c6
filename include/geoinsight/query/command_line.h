#ifndef GEOINSIGHT_QUERY_COMMAND_LINE_H_
#define GEOINSIGHT_QUERY_COMMAND_LINE_H_

#include <optional>
#include <string>
#include <vector>

#include "geoinsight/core/result.h"

namespace geoinsight {
namespace query {

/**
 * @brief Arguments of the geoinsight_cli front end
 *
 * Numeric options stay unset unless given; explicit values are passed to
 * the service unchanged so that its own validation reports them.
 */
struct CommandLineOptions {
    std::string config_path;
    std::string dataset_path;
    std::string query_text;
    std::string operation;
    std::string region;
    std::string period;
    std::string period_from;
    std::string period_to;
    std::string domains;
    std::string metric = "foot_traffic";
    std::string level;
    std::string log_level;
    std::optional<size_t> top_k;
    std::optional<double> z_threshold;
    bool refresh = false;
    bool help = false;
};

/**
 * @brief Parse arguments, excluding the program name
 *
 * Fails with INVALID_ARGUMENT on an unknown option, a missing value or a
 * value that is not a number where one is expected. A request without a
 * dataset, or with neither --query nor --operation, is also rejected unless
 * --help was given.
 */
core::Result<CommandLineOptions> ParseCommandLine(const std::vector<std::string>& args);

std::vector<std::string> SplitList(const std::string& text);

} // namespace query
} // namespace geoinsight

#endif // GEOINSIGHT_QUERY_COMMAND_LINE_H_
