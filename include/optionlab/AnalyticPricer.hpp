#pragma once

#include "FiniteDifference.hpp"
#include "PayoffLibrary.hpp"
#include "../types/Errors.hpp"
#include "../types/Market.hpp"
#include "../types/Option.hpp"
#include "../types/Results.hpp"
#include "../math/NormalDistribution.hpp"
#include "../utils/Timer.hpp"
#include <cmath>

namespace optionlab {

// Ground truth for the other pricers: Black-Scholes closed form where one
// exists, the finite-difference solver for every other terminal payoff.
class AnalyticPricer {
public:
    using Configuration = FiniteDifferenceSolver::Configuration;

    explicit AnalyticPricer(const Configuration& pde_config = Configuration{})
        : solver_(pde_config) {}

    const FiniteDifferenceSolver& solver() const noexcept { return solver_; }

    PricingResult price(const OptionSpec& option, const MarketParameters& market) const {
        OPTIONLAB_PROFILE_SCOPE("AnalyticPricer::price");

        market.validate();
        option.validate();
        if (payoffs::is_path_dependent(option.payoff)) {
            throw InvalidParameter("payoff", payoffs::name(option.payoff) + " has no analytic or PDE price");
        }

        if (has_closed_form(option)) {
            return price_closed_form(option, market);
        }
        return solver_.solve(option, market);
    }

    static bool has_closed_form(const OptionSpec& option) noexcept {
        return !option.is_american() && payoffs::vanilla_terms(option.payoff).has_value();
    }

    static PricingResult price_closed_form(const OptionSpec& option, const MarketParameters& market) {
        utils::HighResolutionTimer timer;

        market.validate();
        option.validate();
        const auto terms = payoffs::vanilla_terms(option.payoff);
        if (option.is_american() || !terms) {
            throw InvalidParameter("option", "closed form covers European vanilla calls and puts only, got "
                                   + option.description());
        }

        PricingResult result(black_scholes(terms->type, terms->strike, market), PricingMethod::CLOSED_FORM);
        result.computation_time = timer.elapsed();
        return result;
    }

    // call = S e^{-qT} N(d1) - K e^{-rT} N(d2)
    // put  = K e^{-rT} N(-d2) - S e^{-qT} N(-d1)
    static double black_scholes(OptionType type, double K, const MarketParameters& market) noexcept {
        const double S = market.spot_price;
        const double T = market.time_to_expiry;
        const double discounted_spot = S * market.dividend_factor(T);
        const double discounted_strike = K * market.discount_factor(T);

        if (K == 0.0) {
            return type == OptionType::CALL ? discounted_spot : 0.0;
        }

        const double d1 = math::NormalDistribution::d1(S, K, T, market.risk_free_rate, market.volatility,
                                                       market.dividend_yield);
        const double d2 = d1 - market.volatility * std::sqrt(T);

        if (type == OptionType::CALL) {
            return discounted_spot * math::NormalDistribution::cdf(d1)
                 - discounted_strike * math::NormalDistribution::cdf(d2);
        }
        return discounted_strike * math::NormalDistribution::cdf(-d2)
             - discounted_spot * math::NormalDistribution::cdf(-d1);
    }

private:
    FiniteDifferenceSolver solver_;
};

}
