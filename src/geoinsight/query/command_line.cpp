#include "geoinsight/query/command_line.h"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace geoinsight {
namespace query {

namespace {

core::Result<size_t> ParseCount(const std::string& option, const std::string& text) {
    size_t pos = 0;
    unsigned long value = 0;
    // stoul would wrap "-3" around to a huge count.
    if (!text.empty() && text[0] != '-') {
        try {
            value = std::stoul(text, &pos);
        } catch (const std::logic_error&) {
            pos = 0;
        }
    }
    if (pos == 0 || pos != text.size()) {
        return core::Result<size_t>(core::InvalidArgumentError(
            option + " expects a non-negative integer, got '" + text + "'"));
    }
    return static_cast<size_t>(value);
}

core::Result<double> ParseNumber(const std::string& option, const std::string& text) {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::logic_error&) {
        pos = 0;
    }
    if (pos == 0 || pos != text.size()) {
        return core::Result<double>(
            core::InvalidArgumentError(option + " expects a number, got '" + text + "'"));
    }
    return value;
}

} // namespace

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

core::Result<CommandLineOptions> ParseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;

    const std::vector<std::pair<const char*, std::string CommandLineOptions::*>> text_options = {
        {"--dataset", &CommandLineOptions::dataset_path},
        {"--config", &CommandLineOptions::config_path},
        {"--query", &CommandLineOptions::query_text},
        {"--operation", &CommandLineOptions::operation},
        {"--region", &CommandLineOptions::region},
        {"--period", &CommandLineOptions::period},
        {"--period-from", &CommandLineOptions::period_from},
        {"--period-to", &CommandLineOptions::period_to},
        {"--domains", &CommandLineOptions::domains},
        {"--metric", &CommandLineOptions::metric},
        {"--level", &CommandLineOptions::level},
        {"--log-level", &CommandLineOptions::log_level},
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
            return options;
        }
        if (arg == "--refresh") {
            options.refresh = true;
            continue;
        }

        bool takes_value = arg == "--top-k" || arg == "--z-threshold";
        std::string CommandLineOptions::*field = nullptr;
        for (const auto& [name, member] : text_options) {
            if (arg == name) {
                field = member;
                takes_value = true;
                break;
            }
        }
        if (!takes_value) {
            return core::Result<CommandLineOptions>(
                core::InvalidArgumentError("Unknown option: " + arg));
        }
        if (i + 1 >= args.size()) {
            return core::Result<CommandLineOptions>(
                core::InvalidArgumentError(arg + " requires a value"));
        }
        const std::string& value = args[++i];

        if (field) {
            options.*field = value;
        } else if (arg == "--top-k") {
            auto parsed = ParseCount(arg, value);
            if (!parsed.ok()) return core::Result<CommandLineOptions>(parsed.error_detail());
            options.top_k = parsed.value();
        } else {
            auto parsed = ParseNumber(arg, value);
            if (!parsed.ok()) return core::Result<CommandLineOptions>(parsed.error_detail());
            options.z_threshold = parsed.value();
        }
    }

    if (options.dataset_path.empty()) {
        return core::Result<CommandLineOptions>(core::InvalidArgumentError("--dataset is required"));
    }
    if (options.query_text.empty() && options.operation.empty()) {
        return core::Result<CommandLineOptions>(
            core::InvalidArgumentError("Either --query or --operation is required"));
    }
    return options;
}

} // namespace query
} // namespace geoinsight
