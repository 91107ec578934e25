#include "optionlab/AnalyticPricer.hpp"
#include "optionlab/LatticePricer.hpp"
#include "optionlab/MonteCarloPricer.hpp"
#include "utils/Timer.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

using namespace optionlab;
using namespace optionlab::utils;

int main() {
    std::cout << "=== Basic Options Pricing Example ===\n\n";

    // S=$100, sigma=20%, r=5%, q=0, one year
    const MarketParameters market(100.0, 0.20, 0.05, 0.0, 1.0);
    const auto call = OptionSpec::european(VanillaCall(100.0));
    const auto put = OptionSpec::european(VanillaPut(100.0));

    std::cout << "Market Data:\n";
    std::cout << "  Spot Price: $" << market.spot_price << "\n";
    std::cout << "  Volatility: " << market.volatility * 100 << "%\n";
    std::cout << "  Risk-free Rate: " << market.risk_free_rate * 100 << "%\n";
    std::cout << "  Dividend Yield: " << market.dividend_yield * 100 << "%\n";
    std::cout << "  Strike Price: $" << payoffs::strike(call.payoff) << "\n";
    std::cout << "  Time to Expiry: " << market.time_to_expiry << " years\n\n";

    std::cout << "=== Closed Form ===\n";
    const auto call_result = AnalyticPricer::price_closed_form(call, market);
    const auto put_result = AnalyticPricer::price_closed_form(put, market);

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Call: $" << call_result.value << " (" << call_result.computation_time.count() << " ns)\n";
    std::cout << "Put:  $" << put_result.value << " (" << put_result.computation_time.count() << " ns)\n\n";

    const double forward = market.spot_price * market.dividend_factor(market.time_to_expiry);
    const double pv_strike = 100.0 * market.discount_factor(market.time_to_expiry);
    const double parity = call_result.value - put_result.value - (forward - pv_strike);

    std::cout << "=== Put-Call Parity Verification ===\n";
    std::cout << "C - P - (F - PV(K)) = " << std::scientific << parity << std::fixed << "\n";
    std::cout << (std::abs(parity) < 1e-9 ? "PASSED" : "FAILED") << "\n\n";

    std::cout << "=== Lattice Convergence ===\n";
    std::cout << "  steps        value        error\n";
    for (std::size_t steps : {10, 50, 200, 1000, 2000}) {
        LatticePricer::Configuration config;
        config.time_steps = steps;
        const auto result = LatticePricer(config).price(call, market);
        std::cout << "  " << std::setw(5) << steps << "  " << std::setw(11) << result.value
                  << "  " << std::setw(11) << result.value - call_result.value << "\n";
    }
    std::cout << "\n";

    std::cout << "=== Monte Carlo ===\n";
    MonteCarloPricer::Configuration mc_config;
    mc_config.steps = 1;
    mc_config.paths = 100000;
    mc_config.seed = 1;
    mc_config.tolerance = 0.01;

    HighResolutionTimer mc_timer;
    const auto mc_result = MonteCarloPricer(mc_config).price(call, market);
    const auto mc_time = mc_timer.elapsed();

    std::cout << "Value: $" << mc_result.value << " +/- " << *mc_result.standard_error << "\n";
    std::cout << "Deviation from closed form: " << std::setprecision(2)
              << *mc_result.reference_deviation << " standard errors\n" << std::setprecision(6);
    if (mc_result.convergence_warning) {
        std::cout << "Warning: " << mc_result.convergence_warning->message() << "\n";
    }
    std::cout << "Computation Time: " << mc_time.count() / 1e6 << " ms\n\n";

    std::cout << "=== Explicit Scheme Stability ===\n";
    FiniteDifferenceSolver::Configuration pde;
    pde.scheme = FiniteDifferenceScheme::EXPLICIT;
    pde.price_steps = 200;
    pde.time_steps = 100;
    try {
        FiniteDifferenceSolver(pde).solve(call, market);
    } catch (const NumericalInstability& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    }

    return 0;
}
