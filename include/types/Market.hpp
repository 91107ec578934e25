#pragma once

#include "Errors.hpp"
#include <cmath>

namespace optionlab {

struct MarketParameters {
    double spot_price = 0.0;
    double volatility = 0.0;
    double risk_free_rate = 0.0;
    double dividend_yield = 0.0;
    double time_to_expiry = 0.0;

    MarketParameters() = default;

    MarketParameters(double S, double vol, double r, double q, double T)
        : spot_price(S), volatility(vol), risk_free_rate(r), dividend_yield(q),
          time_to_expiry(T) {}

    void validate() const {
        if (!std::isfinite(spot_price) || spot_price <= 0.0) {
            throw InvalidParameter("spot_price", "must be finite and > 0");
        }
        if (!std::isfinite(volatility) || volatility <= 0.0) {
            throw InvalidParameter("volatility", "must be finite and > 0");
        }
        if (!std::isfinite(time_to_expiry) || time_to_expiry <= 0.0) {
            throw InvalidParameter("time_to_expiry", "must be finite and > 0");
        }
        if (!std::isfinite(risk_free_rate)) {
            throw InvalidParameter("risk_free_rate", "must be finite");
        }
        if (!std::isfinite(dividend_yield)) {
            throw InvalidParameter("dividend_yield", "must be finite");
        }
    }

    double discount_factor(double t) const noexcept {
        return std::exp(-risk_free_rate * t);
    }

    double dividend_factor(double t) const noexcept {
        return std::exp(-dividend_yield * t);
    }

    // Risk-neutral drift of log S per unit time.
    double log_drift() const noexcept {
        return risk_free_rate - dividend_yield - 0.5 * volatility * volatility;
    }

    MarketParameters with_spot(double S) const {
        MarketParameters copy = *this;
        copy.spot_price = S;
        return copy;
    }
};

}
