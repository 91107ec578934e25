#pragma once

#include "PayoffLibrary.hpp"
#include "../types/Errors.hpp"
#include "../types/Market.hpp"
#include "../types/Option.hpp"
#include "../types/Results.hpp"
#include "../math/TridiagonalSolver.hpp"
#include "../utils/Timer.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace optionlab {

// Black-Scholes PDE
//   dV/dtau = 1/2 sigma^2 S^2 V_SS + (r - q) S V_S - r V,   tau = T - t
// on a uniform grid S_i = i dS, i = 0..M, marched from the payoff at tau = 0
// to tau = T with the theta scheme
//   (I - theta L) V^{n+1} = (I + (1 - theta) L) V^n.
class FiniteDifferenceSolver {
public:
    struct Configuration {
        std::size_t price_steps = 400;
        std::size_t time_steps = 400;
        FiniteDifferenceScheme scheme = FiniteDifferenceScheme::CRANK_NICOLSON;
        std::size_t rannacher_steps = 4;    // implicit start-up steps for CRANK_NICOLSON
        double grid_width = 5.0;            // S_max in standard deviations of log S_T
        double min_nodes_per_deviation = 20.0;  // implicit schemes only; 0 keeps price_steps as is
        bool record_grid = false;
        std::size_t grid_snapshots = 10;

        void validate() const {
            if (price_steps < 3) {
                throw InvalidParameter("price_steps", "must be >= 3");
            }
            if (time_steps < 1) {
                throw InvalidParameter("time_steps", "must be >= 1");
            }
            if (!std::isfinite(grid_width) || grid_width <= 0.0) {
                throw InvalidParameter("grid_width", "must be finite and > 0");
            }
            if (!std::isfinite(min_nodes_per_deviation) || min_nodes_per_deviation < 0.0) {
                throw InvalidParameter("min_nodes_per_deviation", "must be finite and >= 0");
            }
            if (record_grid && grid_snapshots < 1) {
                throw InvalidParameter("grid_snapshots", "must be >= 1 when the grid is recorded");
            }
        }
    };

    FiniteDifferenceSolver() : FiniteDifferenceSolver(Configuration{}) {}

    explicit FiniteDifferenceSolver(const Configuration& config)
        : config_(config) {
        config_.validate();
    }

    const Configuration& config() const noexcept { return config_; }

    double s_max(const OptionSpec& option, const MarketParameters& market) const {
        const double level = std::max(market.spot_price, payoffs::reference_level(option.payoff));
        return level * std::exp(config_.grid_width * market.volatility * std::sqrt(market.time_to_expiry));
    }

    static constexpr std::size_t MAX_PRICE_STEPS = 20000;

    // Price steps actually used. Implicit and Crank-Nicolson grids are refined
    // until one standard deviation of S_T (S0 sigma sqrt(T)) spans at least
    // min_nodes_per_deviation nodes; explicit grids keep the configured size
    // so the stability check stays the caller's.
    std::size_t price_steps(const OptionSpec& option, const MarketParameters& market) const {
        if (config_.scheme == FiniteDifferenceScheme::EXPLICIT || config_.min_nodes_per_deviation == 0.0) {
            return config_.price_steps;
        }
        const double deviation = market.spot_price * market.volatility * std::sqrt(market.time_to_expiry);
        const double wanted = std::ceil(config_.min_nodes_per_deviation * s_max(option, market) / deviation);
        if (!(wanted > static_cast<double>(config_.price_steps))) {
            return config_.price_steps;
        }
        return std::max(config_.price_steps,
                        static_cast<std::size_t>(std::min(wanted, static_cast<double>(MAX_PRICE_STEPS))));
    }

    // sigma^2 S_max^2 dt / dS^2 on the configured grid; the explicit scheme needs it <= 1.
    double stability_ratio(const MarketParameters& market) const noexcept {
        const double M = static_cast<double>(config_.price_steps);
        const double dt = market.time_to_expiry / static_cast<double>(config_.time_steps);
        return market.volatility * market.volatility * M * M * dt;
    }

    PricingResult solve(const OptionSpec& option, const MarketParameters& market) const {
        OPTIONLAB_PROFILE_SCOPE("FiniteDifferenceSolver::solve");
        utils::HighResolutionTimer timer;

        market.validate();
        option.validate();
        if (payoffs::is_path_dependent(option.payoff)) {
            throw InvalidParameter("payoff", payoffs::name(option.payoff) + " cannot be priced on a PDE grid");
        }

        const std::size_t M = price_steps(option, market);
        const std::size_t N = config_.time_steps;
        const double T = market.time_to_expiry;
        const double r = market.risk_free_rate;
        const double q = market.dividend_yield;
        const double vol2 = market.volatility * market.volatility;

        NumericalInstability::GridConfiguration grid;
        grid.price_steps = M;
        grid.time_steps = N;
        grid.s_max = s_max(option, market);
        grid.dt = T / static_cast<double>(N);
        grid.ds = grid.s_max / static_cast<double>(M);
        grid.stability_ratio = stability_ratio(market);

        if (config_.scheme == FiniteDifferenceScheme::EXPLICIT && grid.stability_ratio > 1.0) {
            throw NumericalInstability("explicit scheme is unstable for this grid", grid);
        }

        const double dt = grid.dt;
        const double dS = grid.ds;

        std::vector<double> spots(M + 1);
        std::vector<double> intrinsic(M + 1);
        for (std::size_t i = 0; i <= M; ++i) {
            spots[i] = static_cast<double>(i) * dS;
            intrinsic[i] = payoffs::evaluate_terminal(option.payoff, spots[i]);
        }

        // L V_i = alpha_i V_{i-1} + beta_i V_i + gamma_i V_{i+1}, already scaled by dt
        std::vector<double> alpha(M + 1), beta(M + 1), gamma(M + 1);
        for (std::size_t i = 0; i <= M; ++i) {
            const double x = static_cast<double>(i);
            alpha[i] = 0.5 * dt * (vol2 * x * x - (r - q) * x);
            beta[i] = -dt * (vol2 * x * x + r);
            gamma[i] = 0.5 * dt * (vol2 * x * x + (r - q) * x);
        }

        std::vector<double> current = intrinsic;
        std::vector<double> next(M + 1, 0.0);

        const std::size_t interior = M - 1;
        std::vector<double> lower(interior), diag(interior), upper(interior), rhs(interior), solution(interior);
        math::TridiagonalSolver tridiagonal(interior);
        double assembled_theta = -1.0;

        const std::size_t snapshot_interval = config_.record_grid
            ? std::max<std::size_t>(N / config_.grid_snapshots, 1) : 0;

        DiagnosticGrid diagnostics;
        if (config_.record_grid) {
            diagnostics.scheme = config_.scheme;
            diagnostics.spot_grid = spots;
            diagnostics.s_max = grid.s_max;
            diagnostics.stability_ratio = grid.stability_ratio;
            diagnostics.times.push_back(T);
            diagnostics.values.push_back(current);
        }

        for (std::size_t n = 1; n <= N; ++n) {
            const double tau = static_cast<double>(n) * dt;
            const double theta = theta_for_step(n);

            double low = payoffs::lower_boundary(option.payoff, market, tau);
            double high = payoffs::upper_boundary(option.payoff, market, grid.s_max, tau);
            if (option.is_american()) {
                low = std::max(low, intrinsic[0]);
                high = std::max(high, intrinsic[M]);
            }

            if (theta == 0.0) {
                for (std::size_t i = 1; i < M; ++i) {
                    next[i] = current[i] + alpha[i] * current[i - 1] + beta[i] * current[i]
                              + gamma[i] * current[i + 1];
                }
            } else {
                if (theta != assembled_theta) {
                    for (std::size_t i = 1; i < M; ++i) {
                        lower[i - 1] = -theta * alpha[i];
                        diag[i - 1] = 1.0 - theta * beta[i];
                        upper[i - 1] = -theta * gamma[i];
                    }
                    assembled_theta = theta;
                }

                const double explicit_weight = 1.0 - theta;
                for (std::size_t i = 1; i < M; ++i) {
                    rhs[i - 1] = current[i] + explicit_weight * (alpha[i] * current[i - 1] + beta[i] * current[i]
                                                                 + gamma[i] * current[i + 1]);
                }
                rhs[0] += theta * alpha[1] * low;
                rhs[interior - 1] += theta * gamma[M - 1] * high;

                if (!tridiagonal.solve(lower, diag, upper, rhs, solution)) {
                    grid.failed_step = n;
                    throw NumericalInstability("singular tridiagonal system", grid);
                }
                std::copy(solution.begin(), solution.end(), next.begin() + 1);
            }

            next[0] = low;
            next[M] = high;

            if (option.is_american()) {
                for (std::size_t i = 0; i <= M; ++i) {
                    next[i] = std::max(next[i], intrinsic[i]);
                }
            }

            for (std::size_t i = 0; i <= M; ++i) {
                if (!std::isfinite(next[i])) {
                    grid.failed_step = n;
                    throw NumericalInstability("non-finite value in the solution grid", grid);
                }
            }

            current.swap(next);

            if (config_.record_grid && (n % snapshot_interval == 0 || n == N)) {
                diagnostics.times.push_back(T - tau);
                diagnostics.values.push_back(current);
            }
        }

        PricingResult result(interpolate(spots, current, market.spot_price), PricingMethod::FINITE_DIFFERENCE);
        result.iterations_used = N;
        if (config_.record_grid) {
            result.diagnostic_grid = std::move(diagnostics);
        }
        result.computation_time = timer.elapsed();
        return result;
    }

private:
    Configuration config_;

    double theta_for_step(std::size_t n) const noexcept {
        switch (config_.scheme) {
            case FiniteDifferenceScheme::EXPLICIT: return 0.0;
            case FiniteDifferenceScheme::IMPLICIT: return 1.0;
            case FiniteDifferenceScheme::CRANK_NICOLSON:
                return n <= config_.rannacher_steps ? 1.0 : 0.5;
        }
        return 0.5;
    }

    // S lies strictly inside [0, S_max) because S_max > S0.
    static double interpolate(const std::vector<double>& spots, const std::vector<double>& values, double S) {
        const double dS = spots[1] - spots[0];
        const std::size_t last = spots.size() - 1;
        const std::size_t i = std::min(static_cast<std::size_t>(S / dS), last - 1);
        const double w = (S - spots[i]) / dS;
        return (1.0 - w) * values[i] + w * values[i + 1];
    }
};

}
