#ifndef GEOINSIGHT_ANALYTICS_STATISTICS_H_
#define GEOINSIGHT_ANALYTICS_STATISTICS_H_

#include <cmath>
#include <cstddef>

#include "geoinsight/core/types.h"

namespace geoinsight {
namespace analytics {

/**
 * @brief Add `value` into `acc` with SQL SUM semantics: absent inputs are
 * ignored and an all-absent sum stays absent
 */
inline void AccumulateOptional(core::OptionalValue& acc, const core::OptionalValue& value) {
    if (!value) return;
    acc = acc ? *acc + *value : *value;
}

/**
 * @brief (current - base) / base; absent if either side is absent or the
 * base is exactly zero
 */
inline core::OptionalValue RelativeChange(const core::OptionalValue& current,
                                          const core::OptionalValue& base) {
    if (!current || !base || *base == 0.0) return std::nullopt;
    return (*current - *base) / *base;
}

/**
 * @brief Single-pass mean and sample variance (Welford)
 */
class RunningStats {
public:
    void add(double x) {
        ++count_;
        double delta = x - mean_;
        mean_ += delta / static_cast<double>(count_);
        m2_ += delta * (x - mean_);
    }

    void add(const core::OptionalValue& x) {
        if (x) add(*x);
    }

    size_t count() const { return count_; }

    core::OptionalValue mean() const {
        if (count_ == 0) return std::nullopt;
        return mean_;
    }

    /**
     * @brief Sample standard deviation (n - 1); absent below 2 observations
     */
    core::OptionalValue sample_stddev() const {
        if (count_ < 2) return std::nullopt;
        return std::sqrt(m2_ / static_cast<double>(count_ - 1));
    }

private:
    size_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
};

/**
 * @brief (x - mean) / stddev; absent when any input is absent or the
 * deviation is zero
 */
inline core::OptionalValue ZScore(const core::OptionalValue& x, const core::OptionalValue& mean,
                                  const core::OptionalValue& stddev) {
    if (!x || !mean || !stddev || *stddev == 0.0) return std::nullopt;
    return (*x - *mean) / *stddev;
}

/**
 * @brief Single-pass co-moments of (x, y) pairs for correlation and
 * least-squares slope
 */
class PairedStats {
public:
    void add(double x, double y) {
        ++count_;
        double n = static_cast<double>(count_);
        double dx = x - mean_x_;
        mean_x_ += dx / n;
        double dy = y - mean_y_;
        mean_y_ += dy / n;
        m2_x_ += dx * (x - mean_x_);
        m2_y_ += dy * (y - mean_y_);
        c_xy_ += dx * (y - mean_y_);
    }

    size_t count() const { return count_; }

    /**
     * @brief Pearson correlation; absent below 2 pairs or with zero variance
     */
    core::OptionalValue correlation() const {
        if (count_ < 2 || m2_x_ <= 0.0 || m2_y_ <= 0.0) return std::nullopt;
        return c_xy_ / std::sqrt(m2_x_ * m2_y_);
    }

    /**
     * @brief Ordinary least-squares slope of y on x
     */
    core::OptionalValue slope() const {
        if (count_ < 2 || m2_x_ <= 0.0) return std::nullopt;
        return c_xy_ / m2_x_;
    }

private:
    size_t count_ = 0;
    double mean_x_ = 0.0;
    double mean_y_ = 0.0;
    double m2_x_ = 0.0;
    double m2_y_ = 0.0;
    double c_xy_ = 0.0;
};

} // namespace analytics
} // namespace geoinsight

#endif // GEOINSIGHT_ANALYTICS_STATISTICS_H_
