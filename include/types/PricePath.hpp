#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace optionlab {

class PathSimulator;

// Simulated prices at t = 0, dt, ..., N*dt. Only the simulator writes one.
class PricePath {
public:
    using const_iterator = std::vector<double>::const_iterator;

    PricePath() = default;

    PricePath(std::vector<double> prices, double time_step)
        : prices_(std::move(prices)), time_step_(time_step) {}

    std::size_t size() const noexcept { return prices_.size(); }
    std::size_t steps() const noexcept { return prices_.empty() ? 0 : prices_.size() - 1; }
    bool empty() const noexcept { return prices_.empty(); }

    double operator[](std::size_t i) const noexcept { return prices_[i]; }
    double initial() const noexcept { return prices_.front(); }
    double terminal() const noexcept { return prices_.back(); }
    double time_step() const noexcept { return time_step_; }
    double time_at(std::size_t i) const noexcept { return static_cast<double>(i) * time_step_; }

    const_iterator begin() const noexcept { return prices_.begin(); }
    const_iterator end() const noexcept { return prices_.end(); }
    const std::vector<double>& prices() const noexcept { return prices_; }

private:
    friend class PathSimulator;

    std::vector<double> prices_;
    double time_step_ = 0.0;
};

}
