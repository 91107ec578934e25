#include "optionlab/AnalyticPricer.hpp"
#include "optionlab/LatticePricer.hpp"
#include "optionlab/MonteCarloPricer.hpp"
#include "optionlab/PathStatistics.hpp"
#include "optionlab/PricingEngine.hpp"
#include "utils/Timer.hpp"
#include <iomanip>
#include <iostream>
#include <algorithm>
#include <vector>

using namespace optionlab;
using namespace optionlab::utils;

void demonstrate_cross_check() {
    std::cout << "\n=== Cross-Check Demo ===\n";

    const MarketParameters market(100.0, 0.20, 0.05, 0.0, 1.0);
    const auto call = OptionSpec::european(VanillaCall(100.0));

    PricingEngine::Configuration config;
    config.lattice.time_steps = 2000;
    config.monte_carlo.paths = 200000;
    config.monte_carlo.steps = 1;
    config.monte_carlo.seed = 20240601;
    PricingEngine engine(config);

    const auto report = engine.cross_check(call, market);

    std::cout << std::fixed << std::setprecision(6);
    std::cout << call.description() << " (S=100, K=100, r=5%, sigma=20%, T=1)\n";
    for (const auto& entry : report.entries) {
        std::cout << "  " << std::setw(18) << std::left << to_string(entry.method) << std::right
                  << " value " << entry.result.value;
        if (entry.difference) {
            std::cout << "  diff " << std::setw(10) << *entry.difference;
        }
        if (entry.result.standard_error) {
            std::cout << "  s.e. " << *entry.result.standard_error;
        }
        if (entry.standard_errors) {
            std::cout << "  (" << std::setprecision(2) << *entry.standard_errors << " s.e.)"
                      << std::setprecision(6);
        }
        std::cout << "  " << entry.result.computation_time.count() << " ns\n";
    }
    std::cout << "  Largest deviation: " << report.max_abs_difference() << "\n";
}

void demonstrate_american_pricing() {
    std::cout << "\n=== American Put Demo ===\n";

    const MarketParameters market(50.0, 0.40, 0.10, 0.0, 0.4167);
    const auto put = OptionSpec::american(VanillaPut(50.0));

    LatticePricer::Configuration config;
    config.time_steps = 500;
    LatticePricer lattice(config);

    const auto american = lattice.price(put, market);
    const auto european = lattice.price(put.with_style(ExerciseStyle::EUROPEAN), market);

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "  American: " << american.value << "\n";
    std::cout << "  European: " << european.value << "\n";
    std::cout << "  Early exercise premium: " << american.value - european.value << "\n";
    std::cout << "  Tree steps: " << american.iterations_used << "\n";
    std::cout << "  Computation time: " << american.computation_time.count() << " ns\n";

    if (american.exercise_boundary && !american.exercise_boundary->empty()) {
        const auto& boundary = *american.exercise_boundary;
        std::cout << "  Exercise boundary (" << boundary.size() << " points):\n";
        const std::size_t stride = std::max<std::size_t>(boundary.size() / 8, 1);
        for (std::size_t i = 0; i < boundary.size(); i += stride) {
            std::cout << "    t=" << std::setprecision(4) << boundary[i].time
                      << "  S*=" << boundary[i].price << "\n";
        }
    }
}

void demonstrate_digital_pde() {
    std::cout << "\n=== Cash-or-Nothing PDE Demo ===\n";

    const MarketParameters market(100.0, 0.10, 0.05, 0.0, 1.0);
    const auto digital = OptionSpec::european(CashOrNothing(110.0, 120.0, 10.0));

    FiniteDifferenceSolver::Configuration config;
    config.record_grid = true;
    config.grid_snapshots = 4;
    AnalyticPricer pricer(config);

    const auto result = pricer.price(digital, market);

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "  Pays 10 when 110 < S_T <= 120\n";
    std::cout << "  Value: " << result.value << " (" << to_string(result.method) << ")\n";

    if (result.diagnostic_grid) {
        const auto& grid = *result.diagnostic_grid;
        std::cout << "  Scheme: " << to_string(grid.scheme) << ", S_max " << grid.s_max
                  << ", stability ratio " << grid.stability_ratio << "\n";
        for (std::size_t k = 0; k < grid.times.size(); ++k) {
            double peak = 0.0;
            double peak_spot = 0.0;
            for (std::size_t i = 0; i < grid.spot_grid.size(); ++i) {
                if (grid.values[k][i] > peak) {
                    peak = grid.values[k][i];
                    peak_spot = grid.spot_grid[i];
                }
            }
            std::cout << "    t=" << std::setprecision(3) << grid.times[k]
                      << "  max V=" << std::setprecision(4) << peak << " at S=" << peak_spot << "\n";
        }
    }
}

void demonstrate_monte_carlo() {
    std::cout << "\n=== Path-Dependent Monte Carlo Demo ===\n";

    const MarketParameters market(100.0, 0.20, 0.05, 0.0, 1.0);

    for (const Payoff& payoff : {Payoff(AsianCall(100.0)), Payoff(LookbackCall(100.0))}) {
        std::cout << payoffs::name(payoff) << ":\n";
        for (std::size_t steps : {10, 50, 200}) {
            MonteCarloPricer::Configuration config;
            config.steps = steps;
            config.paths = 50000;
            config.seed = 7;
            config.num_threads = ThreadPool::default_concurrency();
            MonteCarloPricer pricer(config);

            const auto result = pricer.price(OptionSpec::european(payoff), market);
            std::cout << std::fixed << std::setprecision(4)
                      << "  steps " << std::setw(4) << steps
                      << "  value " << result.value
                      << "  s.e. " << *result.standard_error
                      << "  95% CI [" << result.confidence_interval->first << ", "
                      << result.confidence_interval->second << "]\n";
        }
    }
}

void demonstrate_path_statistics() {
    std::cout << "\n=== Simulated Price Distribution ===\n";

    const MarketParameters market(100.0, 0.05, 0.15, 0.0, 5.0);
    SimulationConfig config;
    config.steps = 100;
    config.paths = 10000;
    config.seed = 42;
    PathSimulator simulator(market, config);

    const auto snapshots = PathStatistics::ensemble(simulator);

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "     t     d1     q1 median     q3     d9 | mean   theory\n";
    for (std::size_t k : {10, 30, 60, 90}) {
        const auto& s = snapshots[k];
        std::cout << std::setw(6) << s.time << ' ' << std::setw(6) << s.decile_1 << ' '
                  << std::setw(6) << s.quartile_1 << ' ' << std::setw(6) << s.median << ' '
                  << std::setw(6) << s.quartile_3 << ' ' << std::setw(6) << s.decile_9 << " | "
                  << std::setw(6) << s.mean << ' '
                  << std::setw(6) << PathStatistics::lognormal_mean(market, s.time) << "\n";
    }
}

void print_profile() {
    std::cout << "\n=== Profile ===\n";
    for (const auto& [name, data] : PerformanceProfiler::instance().get_all_profiles()) {
        std::cout << "  " << std::setw(40) << std::left << name << std::right
                  << std::setw(6) << data.call_count << " calls, avg "
                  << std::fixed << std::setprecision(0) << data.average_time_ns() << " ns\n";
    }
}

int main() {
    std::cout << "=========================================\n";
    std::cout << "optionlab pricing demo\n";
    std::cout << "=========================================\n";

    try {
        demonstrate_cross_check();
        demonstrate_american_pricing();
        demonstrate_digital_pde();
        demonstrate_monte_carlo();
        demonstrate_path_statistics();
        print_profile();

        std::cout << "\n=== Demo Complete ===\n";

    } catch (const PricingError& e) {
        std::cerr << "Pricing error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
