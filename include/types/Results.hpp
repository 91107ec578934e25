#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace optionlab {

enum class PricingMethod {
    CLOSED_FORM,
    FINITE_DIFFERENCE,
    LATTICE,
    MONTE_CARLO
};

inline const char* to_string(PricingMethod method) noexcept {
    switch (method) {
        case PricingMethod::CLOSED_FORM: return "closed-form";
        case PricingMethod::FINITE_DIFFERENCE: return "finite-difference";
        case PricingMethod::LATTICE: return "lattice";
        case PricingMethod::MONTE_CARLO: return "monte-carlo";
    }
    return "unknown";
}

enum class FiniteDifferenceScheme {
    EXPLICIT,
    IMPLICIT,
    CRANK_NICOLSON
};

inline const char* to_string(FiniteDifferenceScheme scheme) noexcept {
    switch (scheme) {
        case FiniteDifferenceScheme::EXPLICIT: return "explicit";
        case FiniteDifferenceScheme::IMPLICIT: return "implicit";
        case FiniteDifferenceScheme::CRANK_NICOLSON: return "crank-nicolson";
    }
    return "unknown";
}

struct ExercisePoint {
    double time = 0.0;
    double price = 0.0;
};

using ExerciseBoundary = std::vector<ExercisePoint>;

// Value slices V(S, t) kept while the PDE was stepped back from expiry.
struct DiagnosticGrid {
    FiniteDifferenceScheme scheme = FiniteDifferenceScheme::CRANK_NICOLSON;
    std::vector<double> spot_grid;
    std::vector<double> times;                  // calendar time of each slice, T first
    std::vector<std::vector<double>> values;    // values[k][i] = V(spot_grid[i], times[k])
    double s_max = 0.0;
    double stability_ratio = 0.0;
};

// Non-fatal: the Monte Carlo estimate is returned but is less precise than asked.
struct ConvergenceWarning {
    double standard_error = 0.0;
    double tolerance = 0.0;
    std::size_t paths = 0;

    std::string message() const {
        std::ostringstream os;
        os << "standard error " << standard_error << " exceeds tolerance " << tolerance
           << " after " << paths << " paths";
        return os.str();
    }
};

struct PricingResult {
    double value = 0.0;
    PricingMethod method = PricingMethod::CLOSED_FORM;

    std::optional<double> standard_error;
    std::optional<ExerciseBoundary> exercise_boundary;
    std::optional<DiagnosticGrid> diagnostic_grid;

    // Monte Carlo
    std::optional<std::pair<double, double>> confidence_interval;
    std::optional<double> reference_deviation;  // (value - analytic) in standard errors
    std::optional<ConvergenceWarning> convergence_warning;
    std::optional<std::uint64_t> seed;         // replays the run when fed back in

    // Lattice, American only
    std::optional<double> early_exercise_premium;

    std::size_t iterations_used = 0;  // tree steps, PDE time steps or paths
    std::chrono::nanoseconds computation_time{0};
    bool converged = true;

    PricingResult() = default;

    PricingResult(double v, PricingMethod m) : value(v), method(m) {}
};

struct PerformanceMetrics {
    std::chrono::nanoseconds total_time{0};
    std::chrono::nanoseconds avg_pricing_time{0};
    std::chrono::nanoseconds min_pricing_time{std::chrono::nanoseconds::max()};
    std::chrono::nanoseconds max_pricing_time{0};
    std::size_t total_options_priced = 0;
    double throughput_per_second = 0.0;

    void update(std::chrono::nanoseconds pricing_time) {
        total_time += pricing_time;
        ++total_options_priced;

        if (pricing_time < min_pricing_time) {
            min_pricing_time = pricing_time;
        }
        if (pricing_time > max_pricing_time) {
            max_pricing_time = pricing_time;
        }

        avg_pricing_time = total_time / total_options_priced;
        throughput_per_second = avg_pricing_time.count() > 0 ? 1e9 / avg_pricing_time.count() : 0.0;
    }

    void reset() {
        *this = PerformanceMetrics{};
    }
};

}
