#pragma once

#include "Errors.hpp"
#include "Market.hpp"
#include "PricePath.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>
#include <variant>

namespace optionlab {

enum class OptionType {
    CALL,
    PUT
};

enum class PayoffKind {
    VANILLA_CALL,
    VANILLA_PUT,
    CASH_OR_NOTHING,
    ASIAN_CALL,
    LOOKBACK_CALL
};

// Direction of the payoff in the terminal price; tells the lattice on which
// side of the exercise region the boundary sits.
enum class Monotonicity {
    INCREASING,
    DECREASING,
    NONE
};

struct VanillaTerms {
    OptionType type;
    double strike;
};

namespace detail {

inline void validate_strike(double K) {
    if (!std::isfinite(K) || K < 0.0) {
        throw InvalidParameter("strike", "must be finite and >= 0");
    }
}

}

struct VanillaCall {
    static constexpr PayoffKind kind = PayoffKind::VANILLA_CALL;
    static constexpr bool path_dependent = false;
    static constexpr Monotonicity monotonicity = Monotonicity::INCREASING;

    double strike;

    explicit VanillaCall(double K) : strike(K) {}

    const char* name() const noexcept { return "vanilla call"; }
    void validate() const { detail::validate_strike(strike); }

    double terminal(double S) const noexcept { return std::max(S - strike, 0.0); }
    double operator()(const PricePath& path) const noexcept { return terminal(path.terminal()); }

    double reference_level() const noexcept { return strike; }

    double lower_boundary(const MarketParameters&, double) const noexcept { return 0.0; }

    double upper_boundary(const MarketParameters& market, double s_max, double tau) const noexcept {
        return std::max(s_max * market.dividend_factor(tau) - strike * market.discount_factor(tau), 0.0);
    }

    std::optional<VanillaTerms> vanilla_terms() const noexcept {
        return VanillaTerms{OptionType::CALL, strike};
    }
};

struct VanillaPut {
    static constexpr PayoffKind kind = PayoffKind::VANILLA_PUT;
    static constexpr bool path_dependent = false;
    static constexpr Monotonicity monotonicity = Monotonicity::DECREASING;

    double strike;

    explicit VanillaPut(double K) : strike(K) {}

    const char* name() const noexcept { return "vanilla put"; }
    void validate() const { detail::validate_strike(strike); }

    double terminal(double S) const noexcept { return std::max(strike - S, 0.0); }
    double operator()(const PricePath& path) const noexcept { return terminal(path.terminal()); }

    double reference_level() const noexcept { return strike; }

    double lower_boundary(const MarketParameters& market, double tau) const noexcept {
        return strike * market.discount_factor(tau);
    }

    double upper_boundary(const MarketParameters&, double, double) const noexcept { return 0.0; }

    std::optional<VanillaTerms> vanilla_terms() const noexcept {
        return VanillaTerms{OptionType::PUT, strike};
    }
};

// Pays `cash` when lower < S_T <= upper. An infinite upper bound gives the
// plain cash-or-nothing call.
struct CashOrNothing {
    static constexpr PayoffKind kind = PayoffKind::CASH_OR_NOTHING;
    static constexpr bool path_dependent = false;
    static constexpr Monotonicity monotonicity = Monotonicity::NONE;

    double lower;
    double upper;
    double cash;

    CashOrNothing(double lower_bound, double upper_bound, double amount)
        : lower(lower_bound), upper(upper_bound), cash(amount) {}

    const char* name() const noexcept { return "cash-or-nothing"; }

    void validate() const {
        if (!std::isfinite(lower) || lower < 0.0) {
            throw InvalidParameter("lower", "must be finite and >= 0");
        }
        if (std::isnan(upper) || upper <= lower) {
            throw InvalidParameter("upper", "must be greater than the lower bound");
        }
        if (!std::isfinite(cash) || cash < 0.0) {
            throw InvalidParameter("cash", "must be finite and >= 0");
        }
    }

    double terminal(double S) const noexcept {
        return (S > lower && S <= upper) ? cash : 0.0;
    }

    double operator()(const PricePath& path) const noexcept { return terminal(path.terminal()); }

    // Sizes the PDE grid: the whole paying range must sit inside it.
    double reference_level() const noexcept {
        return std::isfinite(upper) ? upper : lower;
    }

    double lower_boundary(const MarketParameters& market, double tau) const noexcept {
        return terminal(0.0) * market.discount_factor(tau);
    }

    double upper_boundary(const MarketParameters& market, double s_max, double tau) const noexcept {
        return terminal(s_max) * market.discount_factor(tau);
    }

    std::optional<VanillaTerms> vanilla_terms() const noexcept { return std::nullopt; }
};

// Arithmetic average over every simulated price, S_0 included.
struct AsianCall {
    static constexpr PayoffKind kind = PayoffKind::ASIAN_CALL;
    static constexpr bool path_dependent = true;
    static constexpr Monotonicity monotonicity = Monotonicity::INCREASING;

    double strike;

    explicit AsianCall(double K) : strike(K) {}

    const char* name() const noexcept { return "asian call"; }
    void validate() const { detail::validate_strike(strike); }

    double operator()(const PricePath& path) const noexcept {
        const double average = std::accumulate(path.begin(), path.end(), 0.0) /
                               static_cast<double>(path.size());
        return std::max(average - strike, 0.0);
    }

    double reference_level() const noexcept { return strike; }

    std::optional<VanillaTerms> vanilla_terms() const noexcept { return std::nullopt; }
};

// Fixed-strike lookback on the running maximum, S_0 included.
struct LookbackCall {
    static constexpr PayoffKind kind = PayoffKind::LOOKBACK_CALL;
    static constexpr bool path_dependent = true;
    static constexpr Monotonicity monotonicity = Monotonicity::INCREASING;

    double strike;

    explicit LookbackCall(double K) : strike(K) {}

    const char* name() const noexcept { return "lookback call"; }
    void validate() const { detail::validate_strike(strike); }

    double operator()(const PricePath& path) const noexcept {
        const double maximum = *std::max_element(path.begin(), path.end());
        return std::max(maximum - strike, 0.0);
    }

    double reference_level() const noexcept { return strike; }

    std::optional<VanillaTerms> vanilla_terms() const noexcept { return std::nullopt; }
};

using Payoff = std::variant<VanillaCall, VanillaPut, CashOrNothing, AsianCall, LookbackCall>;

}
