#include "rolling_stats.hpp"

#include <cmath>
#include <cstdio>

namespace radiohal {

void RollingStats::Update(double value) {
    if (count_ == 0) {
        min_ = value;
        max_ = value;
    } else {
        if (value < min_) {
            min_ = value;
        }
        if (value > max_) {
            max_ = value;
        }
    }

    count_++;
    double delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    m2_ += delta * (value - mean_);
}

double RollingStats::getVariance() const {
    if (count_ < 2) {
        return 0.0;
    }
    return m2_ / static_cast<double>(count_ - 1);
}

double RollingStats::getStdDev() const {
    return std::sqrt(getVariance());
}

std::string RollingStats::ToString() const {
    char buffer[128];
    snprintf(buffer, sizeof(buffer),
             "n=%zu mean=%.2f std=%.2f min=%.2f max=%.2f", count_, mean_,
             getStdDev(), getMin(), getMax());
    return buffer;
}

}  // namespace radiohal
