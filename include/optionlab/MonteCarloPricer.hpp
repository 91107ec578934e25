#pragma once

#include "AnalyticPricer.hpp"
#include "PathSimulator.hpp"
#include "PayoffLibrary.hpp"
#include "../types/Errors.hpp"
#include "../types/Market.hpp"
#include "../types/Option.hpp"
#include "../types/PricePath.hpp"
#include "../types/Results.hpp"
#include "../math/NormalDistribution.hpp"
#include "../math/Statistics.hpp"
#include "../utils/ThreadPool.hpp"
#include "../utils/Timer.hpp"
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace optionlab {

enum class VarianceReduction {
    NONE,
    ANTITHETIC_VARIATES
};

class MonteCarloPricer {
public:
    struct Configuration {
        std::size_t steps = 252;
        std::size_t paths = 100000;
        std::optional<std::uint64_t> seed;
        std::size_t num_threads = 1;
        std::size_t block_size = 4096;
        VarianceReduction variance_reduction = VarianceReduction::NONE;
        double tolerance = 0.0;             // 0 disables the convergence check
        double confidence_level = 0.95;
        bool compare_to_analytic = true;

        void validate() const {
            if (steps < 1) {
                throw InvalidParameter("steps", "must be >= 1");
            }
            if (paths < 1) {
                throw InvalidParameter("paths", "must be >= 1");
            }
            if (variance_reduction == VarianceReduction::ANTITHETIC_VARIATES && paths % 2 != 0) {
                throw InvalidParameter("paths", "must be even with antithetic variates");
            }
            if (num_threads < 1) {
                throw InvalidParameter("num_threads", "must be >= 1");
            }
            if (block_size < 1) {
                throw InvalidParameter("block_size", "must be >= 1");
            }
            if (!std::isfinite(tolerance) || tolerance < 0.0) {
                throw InvalidParameter("tolerance", "must be finite and >= 0");
            }
            if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
                throw InvalidParameter("confidence_level", "must lie in (0, 1)");
            }
        }

        // Antithetic runs draw paths in pairs; each pair is one sample.
        std::size_t samples() const noexcept {
            return variance_reduction == VarianceReduction::ANTITHETIC_VARIATES ? paths / 2 : paths;
        }

        SimulationConfig simulation() const {
            SimulationConfig sim;
            sim.steps = steps;
            sim.paths = samples();
            sim.seed = seed;
            sim.block_size = block_size;
            return sim;
        }
    };

    MonteCarloPricer() : MonteCarloPricer(Configuration{}) {}

    explicit MonteCarloPricer(const Configuration& config)
        : config_(config) {
        config_.validate();
        if (config_.num_threads > 1) {
            pool_ = std::make_unique<utils::ThreadPool>(config_.num_threads);
        }
    }

    const Configuration& config() const noexcept { return config_; }

    PricingResult price(const OptionSpec& option, const MarketParameters& market) const {
        OPTIONLAB_PROFILE_SCOPE("MonteCarloPricer::price");
        utils::HighResolutionTimer timer;

        market.validate();
        option.validate();
        if (option.is_american()) {
            throw InvalidParameter("exercise_style", "Monte Carlo prices European exercise only");
        }

        const PathSimulator simulator(market, config_.simulation());
        const double discount = market.discount_factor(market.time_to_expiry);
        const bool antithetic = config_.variance_reduction == VarianceReduction::ANTITHETIC_VARIATES;

        // One partial per block, merged in block order: the totals do not
        // depend on which worker ran which block.
        std::vector<math::RunningStatistics> partials(simulator.block_count());
        utils::ParallelExecutor::parallel_for(pool_.get(), partials.size(), 1,
            [&](std::size_t begin, std::size_t end) {
                for (std::size_t block = begin; block < end; ++block) {
                    partials[block] = antithetic
                        ? simulate_antithetic_block(simulator, option.payoff, block, discount)
                        : simulate_block(simulator, option.payoff, block, discount);
                }
            });

        math::RunningStatistics stats;
        for (const auto& partial : partials) {
            stats.merge(partial);
        }

        const double value = stats.mean();
        const double standard_error = stats.standard_error();

        PricingResult result(value, PricingMethod::MONTE_CARLO);
        result.standard_error = standard_error;
        result.seed = simulator.seed();
        result.iterations_used = antithetic ? 2 * stats.count() : stats.count();

        const double z = math::NormalDistribution::inverse_cdf(0.5 * (1.0 + config_.confidence_level));
        result.confidence_interval = std::make_pair(value - z * standard_error, value + z * standard_error);

        if (config_.compare_to_analytic && AnalyticPricer::has_closed_form(option) && standard_error > 0.0) {
            const double analytic = AnalyticPricer::price_closed_form(option, market).value;
            result.reference_deviation = (value - analytic) / standard_error;
        }

        if (config_.tolerance > 0.0 && standard_error > config_.tolerance) {
            result.convergence_warning = ConvergenceWarning{standard_error, config_.tolerance, result.iterations_used};
            result.converged = false;
        }

        result.computation_time = timer.elapsed();
        return result;
    }

private:
    Configuration config_;
    std::unique_ptr<utils::ThreadPool> pool_;

    static math::RunningStatistics simulate_block(const PathSimulator& simulator, const Payoff& payoff,
                                                  std::size_t block, double discount) {
        math::RunningStatistics stats;
        simulator.for_each_path(block, [&](const PricePath& path) {
            stats.add(discount * payoffs::evaluate(payoff, path));
        });
        return stats;
    }

    static math::RunningStatistics simulate_antithetic_block(const PathSimulator& simulator, const Payoff& payoff,
                                                             std::size_t block, double discount) {
        math::RunningStatistics stats;
        auto rng = simulator.block_generator(block);
        PricePath path;
        PricePath mirror;
        const std::size_t pairs = simulator.block_size(block);
        for (std::size_t i = 0; i < pairs; ++i) {
            simulator.simulate_antithetic(rng, path, mirror);
            stats.add(0.5 * discount * (payoffs::evaluate(payoff, path) + payoffs::evaluate(payoff, mirror)));
        }
        return stats;
    }
};

}
