#pragma once

#include "AnalyticPricer.hpp"
#include "FiniteDifference.hpp"
#include "LatticePricer.hpp"
#include "MonteCarloPricer.hpp"
#include "PayoffLibrary.hpp"
#include "../types/Errors.hpp"
#include "../types/Market.hpp"
#include "../types/Option.hpp"
#include "../types/Results.hpp"
#include "../utils/ThreadPool.hpp"
#include "../utils/Timer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace optionlab {

// Front door over the three pricers. Holds one instance of each, so pools
// and configuration are shared by every call.
class PricingEngine {
public:
    struct Configuration {
        AnalyticPricer::Configuration finite_difference;
        LatticePricer::Configuration lattice;
        MonteCarloPricer::Configuration monte_carlo;
        std::size_t num_threads = 1;                // workers for price_curve
        bool report_early_exercise_premium = false; // lattice, American specs

        void validate() const {
            finite_difference.validate();
            lattice.validate();
            monte_carlo.validate();
            if (num_threads < 1) {
                throw InvalidParameter("num_threads", "must be >= 1");
            }
        }
    };

    struct CrossCheckEntry {
        PricingMethod method = PricingMethod::CLOSED_FORM;
        PricingResult result;
        std::optional<double> difference;       // value - reference
        std::optional<double> standard_errors;  // difference / standard error, Monte Carlo only
    };

    struct CrossCheckReport {
        std::optional<PricingMethod> reference_method;
        std::optional<double> reference_value;
        std::vector<CrossCheckEntry> entries;

        double max_abs_difference() const noexcept {
            double worst = 0.0;
            for (const auto& entry : entries) {
                if (entry.difference) {
                    worst = std::max(worst, std::abs(*entry.difference));
                }
            }
            return worst;
        }
    };

    PricingEngine() : PricingEngine(Configuration{}) {}

    explicit PricingEngine(const Configuration& config)
        : config_(validated(config)),
          analytic_(config_.finite_difference),
          lattice_(config_.lattice),
          monte_carlo_(config_.monte_carlo) {
        if (config_.num_threads > 1) {
            pool_ = std::make_unique<utils::ThreadPool>(config_.num_threads);
        }
    }

    const Configuration& config() const noexcept { return config_; }

    // Closed form or PDE for terminal European payoffs, the lattice for
    // American ones, Monte Carlo for path-dependent payoffs.
    static PricingMethod default_method(const OptionSpec& option) noexcept {
        if (payoffs::is_path_dependent(option.payoff)) return PricingMethod::MONTE_CARLO;
        if (option.is_american()) return PricingMethod::LATTICE;
        if (AnalyticPricer::has_closed_form(option)) return PricingMethod::CLOSED_FORM;
        return PricingMethod::FINITE_DIFFERENCE;
    }

    PricingResult price(const OptionSpec& option, const MarketParameters& market) {
        return price(option, market, default_method(option));
    }

    PricingResult price(const OptionSpec& option, const MarketParameters& market, PricingMethod method) {
        OPTIONLAB_PROFILE_SCOPE("PricingEngine::price");

        PricingResult result = dispatch(option, market, method);
        update_performance_metrics(result.computation_time);
        return result;
    }

    // Same contract across a range of spot prices; result order follows `spots`.
    std::vector<PricingResult> price_curve(const OptionSpec& option,
                                           const MarketParameters& market,
                                           const std::vector<double>& spots,
                                           PricingMethod method) {
        OPTIONLAB_PROFILE_SCOPE("PricingEngine::price_curve");

        market.validate();
        option.validate();
        for (double S : spots) {
            if (!std::isfinite(S) || S <= 0.0) {
                throw InvalidParameter("spots", "every spot must be finite and > 0");
            }
        }

        return utils::ParallelExecutor::parallel_transform(pool_.get(), spots, [&](double S) {
            return price(option, market.with_spot(S), method);
        });
    }

    // Prices `option` with every method that supports it and measures each
    // against the closed form, or the PDE when there is no closed form.
    CrossCheckReport cross_check(const OptionSpec& option, const MarketParameters& market) {
        OPTIONLAB_PROFILE_SCOPE("PricingEngine::cross_check");

        market.validate();
        option.validate();

        const bool path_dependent = payoffs::is_path_dependent(option.payoff);
        std::vector<PricingMethod> methods;
        if (AnalyticPricer::has_closed_form(option)) methods.push_back(PricingMethod::CLOSED_FORM);
        if (!path_dependent) {
            methods.push_back(PricingMethod::FINITE_DIFFERENCE);
            methods.push_back(PricingMethod::LATTICE);
        }
        if (!option.is_american()) methods.push_back(PricingMethod::MONTE_CARLO);

        CrossCheckReport report;
        for (PricingMethod method : methods) {
            CrossCheckEntry entry;
            entry.method = method;
            entry.result = price(option, market, method);
            if (!report.reference_value && method != PricingMethod::MONTE_CARLO) {
                report.reference_method = method;
                report.reference_value = entry.result.value;
            }
            report.entries.push_back(std::move(entry));
        }

        if (report.reference_value) {
            for (auto& entry : report.entries) {
                entry.difference = entry.result.value - *report.reference_value;
                if (entry.result.standard_error && *entry.result.standard_error > 0.0) {
                    entry.standard_errors = *entry.difference / *entry.result.standard_error;
                }
            }
        }
        return report;
    }

    const AnalyticPricer& analytic() const noexcept { return analytic_; }
    const LatticePricer& lattice() const noexcept { return lattice_; }
    const MonteCarloPricer& monte_carlo() const noexcept { return monte_carlo_; }

    PerformanceMetrics get_performance_metrics() const {
        std::lock_guard<std::mutex> lock(performance_mutex_);
        return performance_metrics_;
    }

    void reset_performance_metrics() {
        std::lock_guard<std::mutex> lock(performance_mutex_);
        performance_metrics_.reset();
    }

private:
    Configuration config_;
    AnalyticPricer analytic_;
    LatticePricer lattice_;
    MonteCarloPricer monte_carlo_;
    std::unique_ptr<utils::ThreadPool> pool_;

    mutable std::mutex performance_mutex_;
    PerformanceMetrics performance_metrics_;

    static const Configuration& validated(const Configuration& config) {
        config.validate();
        return config;
    }

    PricingResult dispatch(const OptionSpec& option, const MarketParameters& market, PricingMethod method) const {
        switch (method) {
            case PricingMethod::CLOSED_FORM:
                return AnalyticPricer::price_closed_form(option, market);

            case PricingMethod::FINITE_DIFFERENCE:
                return analytic_.solver().solve(option, market);

            case PricingMethod::LATTICE: {
                PricingResult result = lattice_.price(option, market);
                if (config_.report_early_exercise_premium && option.is_american()) {
                    const auto european = lattice_.price(option.with_style(ExerciseStyle::EUROPEAN), market);
                    result.early_exercise_premium = result.value - european.value;
                }
                return result;
            }

            case PricingMethod::MONTE_CARLO:
                return monte_carlo_.price(option, market);
        }
        throw InvalidParameter("method", "unknown pricing method");
    }

    void update_performance_metrics(std::chrono::nanoseconds computation_time) {
        std::lock_guard<std::mutex> lock(performance_mutex_);
        performance_metrics_.update(computation_time);
    }
};

}
