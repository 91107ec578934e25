#pragma once

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace optionlab {

class PricingError : public std::runtime_error {
public:
    explicit PricingError(const std::string& what) : std::runtime_error(what) {}
};

// Rejected input, raised before any computation starts.
class InvalidParameter : public PricingError {
public:
    InvalidParameter(std::string parameter, const std::string& reason)
        : PricingError("invalid parameter '" + parameter + "': " + reason),
          parameter_(std::move(parameter)) {}

    const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

// CRR risk-neutral probability outside (0, 1).
class ArbitrageViolation : public PricingError {
public:
    struct Details {
        double dt = 0.0;
        double up = 0.0;
        double down = 0.0;
        double probability = 0.0;
        double volatility = 0.0;
        double risk_free_rate = 0.0;
        double dividend_yield = 0.0;
    };

    explicit ArbitrageViolation(const Details& details)
        : PricingError(describe(details)), details_(details) {}

    const Details& details() const noexcept { return details_; }

private:
    Details details_;

    static std::string describe(const Details& d) {
        std::ostringstream os;
        os << "risk-neutral probability p=" << d.probability << " outside (0,1)"
           << " [dt=" << d.dt << ", u=" << d.up << ", d=" << d.down
           << ", sigma=" << d.volatility << ", r=" << d.risk_free_rate
           << ", q=" << d.dividend_yield << "]; use more time steps";
        return os.str();
    }
};

// Finite-difference grid that violates its stability condition or diverged.
class NumericalInstability : public PricingError {
public:
    struct GridConfiguration {
        std::size_t price_steps = 0;
        std::size_t time_steps = 0;
        double s_max = 0.0;
        double dt = 0.0;
        double ds = 0.0;
        double stability_ratio = 0.0;
        std::size_t failed_step = 0;
    };

    NumericalInstability(const std::string& reason, const GridConfiguration& grid)
        : PricingError(describe(reason, grid)), grid_(grid) {}

    const GridConfiguration& grid() const noexcept { return grid_; }

private:
    GridConfiguration grid_;

    static std::string describe(const std::string& reason, const GridConfiguration& g) {
        std::ostringstream os;
        os << reason << " [price_steps=" << g.price_steps << ", time_steps=" << g.time_steps
           << ", s_max=" << g.s_max << ", dt=" << g.dt << ", dS=" << g.ds
           << ", stability_ratio=" << g.stability_ratio << ", step=" << g.failed_step << "]";
        return os.str();
    }
};

}
