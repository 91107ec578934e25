#pragma once

#include "PayoffLibrary.hpp"
#include "../types/Errors.hpp"
#include "../types/Market.hpp"
#include "../types/Option.hpp"
#include "../types/Results.hpp"
#include "../utils/ThreadPool.hpp"
#include "../utils/Timer.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace optionlab {

// Cox-Ross-Rubinstein binomial tree with optional early exercise.
class LatticePricer {
public:
    struct Configuration {
        std::size_t time_steps = 500;
        std::size_t num_threads = 1;
        std::size_t parallel_threshold = 4096;  // smallest layer split across workers
        bool track_exercise_boundary = true;

        void validate() const {
            if (time_steps < 1) {
                throw InvalidParameter("time_steps", "must be >= 1");
            }
            if (num_threads < 1) {
                throw InvalidParameter("num_threads", "must be >= 1");
            }
        }
    };

    struct TreeParameters {
        double dt = 0.0;
        double up = 0.0;
        double down = 0.0;
        double probability = 0.0;
        double discount = 0.0;      // e^{-r dt}
        double log_up = 0.0;        // sigma sqrt(dt)
    };

    LatticePricer() : LatticePricer(Configuration{}) {}

    explicit LatticePricer(const Configuration& config)
        : config_(config) {
        config_.validate();
        if (config_.num_threads > 1) {
            pool_ = std::make_unique<utils::ThreadPool>(config_.num_threads);
        }
    }

    const Configuration& config() const noexcept { return config_; }

    // Throws ArbitrageViolation unless 0 < p < 1.
    static TreeParameters tree_parameters(const MarketParameters& market, std::size_t steps) {
        TreeParameters tree;
        tree.dt = market.time_to_expiry / static_cast<double>(steps);
        tree.log_up = market.volatility * std::sqrt(tree.dt);
        tree.up = std::exp(tree.log_up);
        tree.down = 1.0 / tree.up;
        tree.probability = (std::exp((market.risk_free_rate - market.dividend_yield) * tree.dt) - tree.down)
                         / (tree.up - tree.down);
        tree.discount = market.discount_factor(tree.dt);

        if (!(tree.probability > 0.0 && tree.probability < 1.0)) {
            ArbitrageViolation::Details details;
            details.dt = tree.dt;
            details.up = tree.up;
            details.down = tree.down;
            details.probability = tree.probability;
            details.volatility = market.volatility;
            details.risk_free_rate = market.risk_free_rate;
            details.dividend_yield = market.dividend_yield;
            throw ArbitrageViolation(details);
        }
        return tree;
    }

    PricingResult price(const OptionSpec& option, const MarketParameters& market) const {
        OPTIONLAB_PROFILE_SCOPE("LatticePricer::price");
        utils::HighResolutionTimer timer;

        market.validate();
        option.validate();
        if (payoffs::is_path_dependent(option.payoff)) {
            throw InvalidParameter("payoff", payoffs::name(option.payoff) + " cannot be priced on a recombining tree");
        }

        const std::size_t N = config_.time_steps;
        const TreeParameters tree = tree_parameters(market, N);
        const bool american = option.is_american();
        const bool track = american && config_.track_exercise_boundary;
        const Monotonicity shape = payoffs::monotonicity(option.payoff);

        std::vector<double> values(N + 1);
        std::vector<double> next(N + 1);
        std::vector<char> exercised(track ? N + 1 : 0, 0);
        ExerciseBoundary boundary;

        for_layer(N + 1, [&](std::size_t begin, std::size_t end) {
            for (std::size_t i = begin; i < end; ++i) {
                values[i] = payoffs::evaluate_terminal(option.payoff, node_price(market.spot_price, tree, N, i));
            }
        });

        const double p = tree.probability;
        const double p_down = 1.0 - p;

        for (std::size_t m = N; m-- > 0;) {
            for_layer(m + 1, [&](std::size_t begin, std::size_t end) {
                for (std::size_t i = begin; i < end; ++i) {
                    const double continuation = tree.discount * (p * values[i + 1] + p_down * values[i]);
                    if (!american) {
                        next[i] = continuation;
                        continue;
                    }
                    const double intrinsic =
                        payoffs::evaluate_terminal(option.payoff, node_price(market.spot_price, tree, m, i));
                    const bool exercise = intrinsic > continuation;
                    next[i] = exercise ? intrinsic : continuation;
                    if (track) {
                        exercised[i] = exercise ? 1 : 0;
                    }
                }
            });

            if (track) {
                if (auto node = boundary_node(exercised, m + 1, shape)) {
                    boundary.push_back({static_cast<double>(m) * tree.dt,
                                        node_price(market.spot_price, tree, m, *node)});
                }
            }

            values.swap(next);
        }

        PricingResult result(values[0], PricingMethod::LATTICE);
        result.iterations_used = N;
        if (track) {
            std::reverse(boundary.begin(), boundary.end());
            result.exercise_boundary = std::move(boundary);
        }
        result.computation_time = timer.elapsed();
        return result;
    }

    // American value minus European value on the same tree.
    double early_exercise_premium(const OptionSpec& option, const MarketParameters& market) const {
        OPTIONLAB_PROFILE_SCOPE("LatticePricer::early_exercise_premium");

        const double american = price(option.with_style(ExerciseStyle::AMERICAN), market).value;
        const double european = price(option.with_style(ExerciseStyle::EUROPEAN), market).value;
        return american - european;
    }

private:
    static constexpr std::size_t MIN_CHUNK = 512;

    Configuration config_;
    std::unique_ptr<utils::ThreadPool> pool_;

    // S0 u^i d^{m-i}, written as one exponential so every worker gets the same bits.
    static double node_price(double S0, const TreeParameters& tree, std::size_t m, std::size_t i) noexcept {
        const double ups = 2.0 * static_cast<double>(i) - static_cast<double>(m);
        return S0 * std::exp(ups * tree.log_up);
    }

    template<typename Function>
    void for_layer(std::size_t count, Function&& func) const {
        utils::ThreadPool* pool = (pool_ && count >= config_.parallel_threshold) ? pool_.get() : nullptr;
        utils::ParallelExecutor::parallel_for(pool, count, MIN_CHUNK, std::forward<Function>(func));
    }

    // Put-like payoffs exercise below the boundary, so the highest flagged node
    // is the transition; call-like payoffs the other way round.
    static std::optional<std::size_t> boundary_node(const std::vector<char>& exercised, std::size_t count,
                                                    Monotonicity shape) {
        if (shape == Monotonicity::DECREASING) {
            for (std::size_t i = count; i-- > 0;) {
                if (exercised[i]) return i;
            }
        } else {
            for (std::size_t i = 0; i < count; ++i) {
                if (exercised[i]) return i;
            }
        }
        return std::nullopt;
    }
};

}
