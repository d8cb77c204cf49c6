#ifndef GEOINSIGHT_COMMON_LOGGER_H_
#define GEOINSIGHT_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace geoinsight {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Set the level from its name ("trace" .. "critical", "off")
     * @return false if the name is unknown; the level is left unchanged
     */
    static bool SetLevel(const std::string& level_name);
};

/**
 * @brief Restores the global level on scope exit
 */
class ScopedLogLevel {
public:
    explicit ScopedLogLevel(spdlog::level::level_enum level) : previous_(spdlog::get_level()) {
        spdlog::set_level(level);
    }
    ~ScopedLogLevel() { spdlog::set_level(previous_); }

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    spdlog::level::level_enum previous_;
};

} // namespace common
} // namespace geoinsight

// Macros for convenient logging
#define GEOINSIGHT_TRACE(...) spdlog::trace(__VA_ARGS__)
#define GEOINSIGHT_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define GEOINSIGHT_INFO(...)  spdlog::info(__VA_ARGS__)
#define GEOINSIGHT_WARN(...)  spdlog::warn(__VA_ARGS__)
#define GEOINSIGHT_ERROR(...) spdlog::error(__VA_ARGS__)
#define GEOINSIGHT_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // GEOINSIGHT_COMMON_LOGGER_H_
