// src/capture/rolling_stats.hpp
#pragma once

#include <cstddef>
#include <string>

namespace radiohal {

/**
 * @brief Online statistics over a numeric series
 *
 * Updated one sample at a time with Welford's algorithm; samples are not
 * stored and cannot be removed.
 */
class RollingStats {
   public:
    RollingStats() = default;

    /**
     * @brief Add one sample
     */
    void Update(double value);

    size_t getCount() const { return count_; }

    /**
     * @brief Mean of all samples, 0 when empty
     */
    double getMean() const { return mean_; }

    /**
     * @brief Sample variance (n - 1 denominator), 0 with fewer than 2 samples
     */
    double getVariance() const;

    /**
     * @brief Sample standard deviation
     */
    double getStdDev() const;

    /**
     * @brief Smallest sample, 0 when empty
     */
    double getMin() const { return count_ == 0 ? 0.0 : min_; }

    /**
     * @brief Largest sample, 0 when empty
     */
    double getMax() const { return count_ == 0 ? 0.0 : max_; }

    /**
     * @brief One-line summary for logs
     */
    std::string ToString() const;

   private:
    size_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;  ///< Sum of squared distances from the mean
    double min_ = 0.0;
    double max_ = 0.0;
};

}  // namespace radiohal
