#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace optionlab::math {

template<typename T>
class FastStatistics {
public:
    static T mean(const std::vector<T>& data) {
        if (data.empty()) return T{0};
        return std::accumulate(data.begin(), data.end(), T{0}) / data.size();
    }

    // Linear interpolation between order statistics of data sorted ascending.
    static T sorted_percentile(const std::vector<T>& sorted, T p) {
        if (sorted.empty()) return T{0};
        if (p <= T{0}) return sorted.front();
        if (p >= T{1}) return sorted.back();

        const T index = p * (sorted.size() - 1);
        const std::size_t lower_index = static_cast<std::size_t>(std::floor(index));
        const std::size_t upper_index = static_cast<std::size_t>(std::ceil(index));

        if (lower_index == upper_index) {
            return sorted[lower_index];
        }

        const T weight = index - lower_index;
        return sorted[lower_index] * (T{1} - weight) + sorted[upper_index] * weight;
    }
};

// Count, sum and sum of squares. Partials merged in a fixed order give
// bit-identical totals whatever thread produced each one.
class RunningStatistics {
public:
    void add(double x) noexcept {
        ++count_;
        sum_ += x;
        sum_sq_ += x * x;
    }

    void merge(const RunningStatistics& other) noexcept {
        count_ += other.count_;
        sum_ += other.sum_;
        sum_sq_ += other.sum_sq_;
    }

    std::size_t count() const noexcept { return count_; }
    double sum() const noexcept { return sum_; }
    double sum_of_squares() const noexcept { return sum_sq_; }

    double mean() const noexcept {
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    // Unbiased sample variance; rounding can push the raw difference below zero.
    double variance() const noexcept {
        if (count_ < 2) return 0.0;
        const double n = static_cast<double>(count_);
        const double centered = sum_sq_ - sum_ * sum_ / n;
        return std::max(centered, 0.0) / (n - 1.0);
    }

    double standard_deviation() const noexcept { return std::sqrt(variance()); }

    double standard_error() const noexcept {
        return count_ > 0 ? standard_deviation() / std::sqrt(static_cast<double>(count_)) : 0.0;
    }

private:
    std::size_t count_ = 0;
    double sum_ = 0.0;
    double sum_sq_ = 0.0;
};

}
