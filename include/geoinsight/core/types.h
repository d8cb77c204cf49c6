#ifndef GEOINSIGHT_CORE_TYPES_H_
#define GEOINSIGHT_CORE_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "geoinsight/core/result.h"

namespace geoinsight {
namespace core {

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief A metric value that may be absent (SQL NULL semantics)
 */
using OptionalValue = std::optional<double>;

/**
 * @brief Temporal bucket of facts consumed by the metrics engine
 */
constexpr const char* kMonthlyGranularity = "month";

/**
 * @brief Calendar date, the temporal axis of every fact
 */
class Date {
public:
    Date() = default;
    Date(int year, int month, int day);

    /**
     * @brief Parse a strict ISO-8601 "YYYY-MM-DD" date
     */
    static Result<Date> Parse(const std::string& text);

    static bool IsValid(int year, int month, int day);
    static int DaysInMonth(int year, int month);

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }

    Date first_of_month() const { return Date(year_, month_, 1); }
    Date last_of_month() const { return Date(year_, month_, DaysInMonth(year_, month_)); }

    std::string to_string() const;

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const;
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const;
    bool operator>(const Date& other) const;
    bool operator>=(const Date& other) const;

private:
    int year_ = 1970;
    int month_ = 1;
    int day_ = 1;
};

/**
 * @brief Inclusive date range a period expression normalizes to
 */
struct PeriodRange {
    Date from;
    Date to;

    bool contains(const Date& date) const { return from <= date && date <= to; }
};

/**
 * @brief Normalize "YYYY", "YYYY-MM" or "YYYY-MM-DD" to an inclusive range
 */
Result<PeriodRange> ParsePeriod(const std::string& period);

/**
 * @brief Range between two optional period bounds; either bound may be empty
 *
 * The lower bound snaps to the start of its period and the upper bound to
 * its end. Swapped bounds are reordered.
 */
Result<std::pair<std::optional<Date>, std::optional<Date>>> ParsePeriodBounds(
    const std::string& period_from, const std::string& period_to);

/**
 * @brief Nested spatial granularity
 */
enum class Level {
    FINEST,
    INTERMEDIATE,
    COARSEST
};

constexpr Level kAllLevels[] = {Level::FINEST, Level::INTERMEDIATE, Level::COARSEST};

const char* LevelName(Level level);

/**
 * @brief Parse a level name; accepts "finest"/"norm"/"emd",
 * "intermediate"/"sig" and "coarsest"/"sido"
 */
std::optional<Level> ParseLevel(const std::string& name);

/**
 * @brief Activity metrics carrying windowed statistics
 */
enum class Metric {
    FOOT_TRAFFIC,
    SALES
};

const char* MetricName(Metric metric);

/**
 * @brief Parse a metric name; "activity_volume" is an alias of foot_traffic
 */
std::optional<Metric> ParseMetric(const std::string& name);

/**
 * @brief Map an analytical domain ("population", "sales") to its metric
 */
std::optional<Metric> DomainMetric(const std::string& domain);

/**
 * @brief Current wall-clock time in milliseconds
 */
Timestamp NowMillis();

/**
 * @brief Format a timestamp as ISO-8601 UTC with millisecond precision
 */
std::string FormatTimestamp(Timestamp ts);

} // namespace core
} // namespace geoinsight

#endif // GEOINSIGHT_CORE_TYPES_H_
