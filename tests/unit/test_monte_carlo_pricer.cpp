#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "optionlab/AnalyticPricer.hpp"
#include "optionlab/MonteCarloPricer.hpp"
#include <cmath>
#include <cstdint>
#include <vector>

using namespace optionlab;
using ::testing::HasSubstr;

class MonteCarloPricerTest : public ::testing::Test {
protected:
    void SetUp() override {
        market_ = MarketParameters(100.0, 0.20, 0.05, 0.0, 1.0);
        config_.steps = 1;
        config_.paths = 100000;
        config_.seed = 20240101;
    }

    const OptionSpec& call() const { return call_; }

    MarketParameters market_;
    OptionSpec call_ = OptionSpec::european(VanillaCall(100.0));
    MonteCarloPricer::Configuration config_;
};

TEST_F(MonteCarloPricerTest, VanillaCallWithinThreeStandardErrors) {
    const double exact = AnalyticPricer::price_closed_form(call(), market_).value;

    int within = 0;
    for (std::uint64_t run = 0; run < 100; ++run) {
        config_.seed = 1000 + run;
        const auto result = MonteCarloPricer(config_).price(call(), market_);
        ASSERT_TRUE(result.standard_error.has_value());
        if (std::abs(result.value - exact) <= 3.0 * *result.standard_error) {
            ++within;
        }
    }
    EXPECT_GE(within, 99);
}

TEST_F(MonteCarloPricerTest, ReportsErrorIntervalAndDeviation) {
    const auto result = MonteCarloPricer(config_).price(call(), market_);
    ASSERT_TRUE(result.standard_error && result.confidence_interval && result.reference_deviation);

    const double se = *result.standard_error;
    EXPECT_GT(se, 0.0);
    EXPECT_LT(se, 0.1);

    const auto [low, high] = *result.confidence_interval;
    EXPECT_NEAR(result.value - low, 1.959964 * se, 1e-5);
    EXPECT_NEAR(high - result.value, 1.959964 * se, 1e-5);

    const double exact = AnalyticPricer::price_closed_form(call(), market_).value;
    EXPECT_NEAR(*result.reference_deviation, (result.value - exact) / se, 1e-9);

    EXPECT_EQ(result.method, PricingMethod::MONTE_CARLO);
    EXPECT_EQ(result.iterations_used, config_.paths);
    ASSERT_TRUE(result.seed.has_value());
    EXPECT_EQ(*result.seed, *config_.seed);
    EXPECT_TRUE(result.converged);
}

TEST_F(MonteCarloPricerTest, NoAnalyticDeviationForExoticPayoffs) {
    config_.paths = 5000;
    config_.steps = 12;
    const auto result = MonteCarloPricer(config_).price(OptionSpec::european(AsianCall(100.0)), market_);
    EXPECT_FALSE(result.reference_deviation.has_value());

    config_.compare_to_analytic = false;
    EXPECT_FALSE(MonteCarloPricer(config_).price(call(), market_).reference_deviation.has_value());
}

TEST_F(MonteCarloPricerTest, SeededRunsAreReproducible) {
    config_.paths = 20000;
    const auto a = MonteCarloPricer(config_).price(call(), market_);
    const auto b = MonteCarloPricer(config_).price(call(), market_);
    EXPECT_EQ(a.value, b.value);
    EXPECT_EQ(*a.standard_error, *b.standard_error);

    config_.seed = 99;
    const auto c = MonteCarloPricer(config_).price(call(), market_);
    EXPECT_NE(a.value, c.value);
}

TEST_F(MonteCarloPricerTest, WorkerCountDoesNotChangeTheResult) {
    config_.paths = 50000;
    config_.steps = 20;
    config_.block_size = 1000;
    const auto lookback = OptionSpec::european(LookbackCall(100.0));

    const auto serial = MonteCarloPricer(config_).price(lookback, market_);
    for (std::size_t threads : {2u, 3u, 8u}) {
        config_.num_threads = threads;
        const auto parallel = MonteCarloPricer(config_).price(lookback, market_);
        EXPECT_EQ(serial.value, parallel.value) << threads << " threads";
        EXPECT_EQ(*serial.standard_error, *parallel.standard_error) << threads << " threads";
    }
}

TEST_F(MonteCarloPricerTest, AntitheticVariatesReduceError) {
    const auto plain = MonteCarloPricer(config_).price(call(), market_);

    config_.variance_reduction = VarianceReduction::ANTITHETIC_VARIATES;
    const auto antithetic = MonteCarloPricer(config_).price(call(), market_);

    EXPECT_EQ(antithetic.iterations_used, config_.paths);
    EXPECT_LT(*antithetic.standard_error, *plain.standard_error);

    const double exact = AnalyticPricer::price_closed_form(call(), market_).value;
    EXPECT_NEAR(antithetic.value, exact, 4.0 * *antithetic.standard_error);
}

TEST_F(MonteCarloPricerTest, ConvergenceWarningKeepsEstimate) {
    config_.paths = 1000;
    config_.tolerance = 1e-4;
    const auto result = MonteCarloPricer(config_).price(call(), market_);

    ASSERT_TRUE(result.convergence_warning.has_value());
    EXPECT_FALSE(result.converged);
    EXPECT_GT(result.convergence_warning->standard_error, 1e-4);
    EXPECT_EQ(result.convergence_warning->paths, 1000u);
    EXPECT_THAT(result.convergence_warning->message(), HasSubstr("exceeds tolerance"));
    EXPECT_GT(result.value, 0.0);

    config_.tolerance = 10.0;
    const auto relaxed = MonteCarloPricer(config_).price(call(), market_);
    EXPECT_FALSE(relaxed.convergence_warning.has_value());
    EXPECT_TRUE(relaxed.converged);
}

TEST_F(MonteCarloPricerTest, LookbackDiscretizationBiasShrinksWithSteps) {
    const auto lookback = OptionSpec::european(LookbackCall(100.0));
    config_.paths = 50000;
    config_.num_threads = 4;

    double previous = 0.0;
    for (std::size_t steps : {10u, 50u, 200u, 1000u}) {
        config_.steps = steps;
        config_.seed = 77 + steps;
        const double value = MonteCarloPricer(config_).price(lookback, market_).value;
        EXPECT_GE(value, previous) << "steps=" << steps;
        previous = value;
    }
}

TEST_F(MonteCarloPricerTest, AsianCallIsCheaperThanVanilla) {
    config_.paths = 20000;
    config_.steps = 50;
    const double asian = MonteCarloPricer(config_).price(OptionSpec::european(AsianCall(100.0)), market_).value;
    const double vanilla = AnalyticPricer::price_closed_form(call(), market_).value;
    EXPECT_LT(asian, vanilla - 3.0);
    EXPECT_GT(asian, 0.0);
}

TEST_F(MonteCarloPricerTest, DigitalAgreesWithPde) {
    const MarketParameters market(100.0, 0.10, 0.05, 0.0, 1.0);
    const auto digital = OptionSpec::european(CashOrNothing(110.0, 120.0, 10.0));

    const auto mc = MonteCarloPricer(config_).price(digital, market);
    const double pde = AnalyticPricer().price(digital, market).value;
    EXPECT_NEAR(mc.value, pde, 4.0 * *mc.standard_error + 0.05);
}

TEST_F(MonteCarloPricerTest, RejectsInvalidInput) {
    EXPECT_THROW(MonteCarloPricer(config_).price(OptionSpec::american(VanillaPut(100.0)), market_),
                 InvalidParameter);

    auto config = config_;
    config.paths = 0;
    EXPECT_THROW((MonteCarloPricer(config)), InvalidParameter);

    config = config_;
    config.steps = 0;
    EXPECT_THROW((MonteCarloPricer(config)), InvalidParameter);

    config = config_;
    config.confidence_level = 1.0;
    EXPECT_THROW((MonteCarloPricer(config)), InvalidParameter);

    config = config_;
    config.tolerance = -1.0;
    EXPECT_THROW((MonteCarloPricer(config)), InvalidParameter);
}

TEST_F(MonteCarloPricerTest, AntitheticPathCountMustBeEven) {
    config_.variance_reduction = VarianceReduction::ANTITHETIC_VARIATES;
    config_.paths = 1001;
    EXPECT_THROW((MonteCarloPricer(config_)), InvalidParameter);

    config_.paths = 1002;
    const auto result = MonteCarloPricer(config_).price(call(), market_);
    EXPECT_EQ(result.iterations_used, 1002u);
    EXPECT_EQ(config_.samples(), 501u);
}
