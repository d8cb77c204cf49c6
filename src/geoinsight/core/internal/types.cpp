#include "geoinsight/core/types.h"
#include "geoinsight/core/error.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <tuple>

namespace geoinsight {
namespace core {

namespace {

bool AllDigits(const std::string& s, size_t pos, size_t len) {
    if (pos + len > s.size()) return false;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

std::string Trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const char* CodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case Error::Code::TIMEOUT: return "TIMEOUT";
        case Error::Code::CANCELLED: return "CANCELLED";
        case Error::Code::UPSTREAM_UNAVAILABLE: return "UPSTREAM_UNAVAILABLE";
        case Error::Code::INTERNAL: return "INTERNAL";
    }
    return "UNKNOWN";
}

// Date

Date::Date(int year, int month, int day) : year_(year), month_(month), day_(day) {
    if (!IsValid(year, month, day)) {
        throw InvalidArgumentError("Invalid calendar date: " + std::to_string(year) + "-" +
                                   std::to_string(month) + "-" + std::to_string(day));
    }
}

bool Date::IsValid(int year, int month, int day) {
    if (year < 1 || year > 9999) return false;
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= DaysInMonth(year, month);
}

int Date::DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

Result<Date> Date::Parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
        !AllDigits(text, 0, 4) || !AllDigits(text, 5, 2) || !AllDigits(text, 8, 2)) {
        return Result<Date>::error("Malformed date '" + text + "', expected YYYY-MM-DD",
                                   Error::Code::INVALID_ARGUMENT);
    }
    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));
    int day = std::stoi(text.substr(8, 2));
    if (!IsValid(year, month, day)) {
        return Result<Date>::error("Date out of range: " + text, Error::Code::INVALID_ARGUMENT);
    }
    return Date(year, month, day);
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year_, month_, day_);
    return buf;
}

bool Date::operator==(const Date& other) const {
    return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
}

bool Date::operator!=(const Date& other) const {
    return !(*this == other);
}

bool Date::operator<(const Date& other) const {
    return std::tie(year_, month_, day_) < std::tie(other.year_, other.month_, other.day_);
}

bool Date::operator<=(const Date& other) const {
    return !(other < *this);
}

bool Date::operator>(const Date& other) const {
    return other < *this;
}

bool Date::operator>=(const Date& other) const {
    return !(*this < other);
}

// Periods

Result<PeriodRange> ParsePeriod(const std::string& period) {
    std::string text = Trim(period);
    if (text.size() == 4 && AllDigits(text, 0, 4)) {
        int year = std::stoi(text);
        if (!Date::IsValid(year, 1, 1)) {
            return Result<PeriodRange>::error("Year out of range: " + text,
                                              Error::Code::INVALID_ARGUMENT);
        }
        return PeriodRange{Date(year, 1, 1), Date(year, 12, 31)};
    }
    if (text.size() == 7 && text[4] == '-' && AllDigits(text, 0, 4) && AllDigits(text, 5, 2)) {
        int year = std::stoi(text.substr(0, 4));
        int month = std::stoi(text.substr(5, 2));
        if (!Date::IsValid(year, month, 1)) {
            return Result<PeriodRange>::error("Month out of range: " + text,
                                              Error::Code::INVALID_ARGUMENT);
        }
        Date first(year, month, 1);
        return PeriodRange{first, first.last_of_month()};
    }
    auto date = Date::Parse(text);
    if (!date.ok()) {
        return Result<PeriodRange>::error(
            "period must be YYYY, YYYY-MM, or YYYY-MM-DD (got '" + period + "')",
            Error::Code::INVALID_ARGUMENT);
    }
    return PeriodRange{date.value(), date.value()};
}

Result<std::pair<std::optional<Date>, std::optional<Date>>> ParsePeriodBounds(
    const std::string& period_from, const std::string& period_to) {
    using Bounds = std::pair<std::optional<Date>, std::optional<Date>>;
    Bounds bounds;
    if (!Trim(period_from).empty()) {
        auto range = ParsePeriod(period_from);
        if (!range.ok()) return Result<Bounds>(range.error_detail());
        bounds.first = range.value().from;
    }
    if (!Trim(period_to).empty()) {
        auto range = ParsePeriod(period_to);
        if (!range.ok()) return Result<Bounds>(range.error_detail());
        bounds.second = range.value().to;
    }
    if (bounds.first && bounds.second && *bounds.second < *bounds.first) {
        // Reordered bounds cover both periods entirely.
        auto low = ParsePeriod(period_to).value().from;
        auto high = ParsePeriod(period_from).value().to;
        bounds = Bounds(low, high);
    }
    return bounds;
}

// Levels, metrics, domains

const char* LevelName(Level level) {
    switch (level) {
        case Level::FINEST: return "finest";
        case Level::INTERMEDIATE: return "intermediate";
        case Level::COARSEST: return "coarsest";
    }
    return "intermediate";
}

std::optional<Level> ParseLevel(const std::string& name) {
    std::string key = Lower(Trim(name));
    if (key == "finest" || key == "norm" || key == "emd") return Level::FINEST;
    if (key == "intermediate" || key == "sig") return Level::INTERMEDIATE;
    if (key == "coarsest" || key == "sido") return Level::COARSEST;
    return std::nullopt;
}

const char* MetricName(Metric metric) {
    switch (metric) {
        case Metric::FOOT_TRAFFIC: return "foot_traffic";
        case Metric::SALES: return "sales";
    }
    return "foot_traffic";
}

std::optional<Metric> ParseMetric(const std::string& name) {
    std::string key = Lower(Trim(name));
    if (key == "foot_traffic" || key == "activity_volume") return Metric::FOOT_TRAFFIC;
    if (key == "sales") return Metric::SALES;
    return std::nullopt;
}

std::optional<Metric> DomainMetric(const std::string& domain) {
    std::string key = Lower(Trim(domain));
    if (key == "population") return Metric::FOOT_TRAFFIC;
    if (key == "sales") return Metric::SALES;
    return std::nullopt;
}

// Time

Timestamp NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatTimestamp(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

} // namespace core
} // namespace geoinsight
