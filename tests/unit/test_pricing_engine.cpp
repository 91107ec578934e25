#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "optionlab/PricingEngine.hpp"
#include <cmath>
#include <vector>

using namespace optionlab;
using ::testing::SizeIs;

class PricingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        market_ = MarketParameters(100.0, 0.20, 0.05, 0.0, 1.0);
        put_market_ = MarketParameters(50.0, 0.40, 0.10, 0.0, 0.4167);

        config_.monte_carlo.steps = 1;
        config_.monte_carlo.paths = 50000;
        config_.monte_carlo.seed = 314159;
    }

    MarketParameters market_;
    MarketParameters put_market_;
    PricingEngine::Configuration config_;
};

TEST_F(PricingEngineTest, DefaultMethodByContract) {
    EXPECT_EQ(PricingEngine::default_method(OptionSpec::european(VanillaCall(100.0))), PricingMethod::CLOSED_FORM);
    EXPECT_EQ(PricingEngine::default_method(OptionSpec::american(VanillaPut(100.0))), PricingMethod::LATTICE);
    EXPECT_EQ(PricingEngine::default_method(OptionSpec::european(CashOrNothing(90.0, 110.0, 1.0))),
              PricingMethod::FINITE_DIFFERENCE);
    EXPECT_EQ(PricingEngine::default_method(OptionSpec::european(AsianCall(100.0))), PricingMethod::MONTE_CARLO);
    EXPECT_EQ(PricingEngine::default_method(OptionSpec::european(LookbackCall(100.0))), PricingMethod::MONTE_CARLO);
}

TEST_F(PricingEngineTest, PriceRoutesToRequestedMethod) {
    PricingEngine engine(config_);
    const auto call = OptionSpec::european(VanillaCall(100.0));

    const auto closed = engine.price(call, market_);
    EXPECT_EQ(closed.method, PricingMethod::CLOSED_FORM);
    EXPECT_NEAR(closed.value, 10.450583572185565, 1e-8);

    const auto lattice = engine.price(call, market_, PricingMethod::LATTICE);
    EXPECT_EQ(lattice.method, PricingMethod::LATTICE);
    EXPECT_EQ(lattice.iterations_used, config_.lattice.time_steps);

    const auto mc = engine.price(call, market_, PricingMethod::MONTE_CARLO);
    EXPECT_EQ(mc.method, PricingMethod::MONTE_CARLO);
    EXPECT_TRUE(mc.standard_error.has_value());
}

TEST_F(PricingEngineTest, UnsupportedCombinationsThrow) {
    PricingEngine engine(config_);
    EXPECT_THROW(engine.price(OptionSpec::american(VanillaPut(100.0)), market_, PricingMethod::MONTE_CARLO),
                 InvalidParameter);
    EXPECT_THROW(engine.price(OptionSpec::european(AsianCall(100.0)), market_, PricingMethod::LATTICE),
                 InvalidParameter);
    EXPECT_THROW(engine.price(OptionSpec::european(CashOrNothing(90.0, 110.0, 1.0)), market_,
                              PricingMethod::CLOSED_FORM),
                 InvalidParameter);
}

TEST_F(PricingEngineTest, CrossCheckVanilla) {
    PricingEngine engine(config_);
    const auto report = engine.cross_check(OptionSpec::european(VanillaCall(100.0)), market_);

    ASSERT_EQ(report.reference_method, PricingMethod::CLOSED_FORM);
    ASSERT_THAT(report.entries, SizeIs(4));
    EXPECT_EQ(report.entries[0].method, PricingMethod::CLOSED_FORM);
    EXPECT_EQ(report.entries[1].method, PricingMethod::FINITE_DIFFERENCE);
    EXPECT_EQ(report.entries[2].method, PricingMethod::LATTICE);
    EXPECT_EQ(report.entries[3].method, PricingMethod::MONTE_CARLO);

    EXPECT_DOUBLE_EQ(*report.entries[0].difference, 0.0);
    EXPECT_LT(std::abs(*report.entries[1].difference), 1e-3);
    EXPECT_LT(std::abs(*report.entries[2].difference), 1e-2);

    const auto& mc = report.entries[3];
    ASSERT_TRUE(mc.standard_errors.has_value());
    EXPECT_LT(std::abs(*mc.standard_errors), 4.0);
    EXPECT_FALSE(report.entries[1].standard_errors.has_value());

    EXPECT_LT(report.max_abs_difference(), 4.0 * *mc.result.standard_error + 1e-2);
}

TEST_F(PricingEngineTest, CrossCheckAmericanUsesPdeReference) {
    PricingEngine engine(config_);
    const auto report = engine.cross_check(OptionSpec::american(VanillaPut(50.0)), put_market_);

    ASSERT_EQ(report.reference_method, PricingMethod::FINITE_DIFFERENCE);
    ASSERT_THAT(report.entries, SizeIs(2));
    EXPECT_EQ(report.entries[1].method, PricingMethod::LATTICE);
    EXPECT_LT(std::abs(*report.entries[1].difference), 2e-2);
    EXPECT_NEAR(*report.reference_value, 4.284, 1e-2);
}

TEST_F(PricingEngineTest, CrossCheckDigital) {
    PricingEngine engine(config_);
    const MarketParameters market(100.0, 0.10, 0.05, 0.0, 1.0);
    const auto report = engine.cross_check(OptionSpec::european(CashOrNothing(110.0, 120.0, 10.0)), market);

    ASSERT_EQ(report.reference_method, PricingMethod::FINITE_DIFFERENCE);
    ASSERT_THAT(report.entries, SizeIs(3));
    EXPECT_LT(std::abs(*report.entries[1].difference), 0.1);
    EXPECT_LT(std::abs(*report.entries[2].standard_errors), 5.0);
}

TEST_F(PricingEngineTest, CrossCheckPathDependentHasNoReference) {
    config_.monte_carlo.steps = 12;
    config_.monte_carlo.paths = 5000;
    PricingEngine engine(config_);
    const auto report = engine.cross_check(OptionSpec::european(AsianCall(100.0)), market_);

    EXPECT_FALSE(report.reference_method.has_value());
    EXPECT_FALSE(report.reference_value.has_value());
    ASSERT_THAT(report.entries, SizeIs(1));
    EXPECT_EQ(report.entries[0].method, PricingMethod::MONTE_CARLO);
    EXPECT_FALSE(report.entries[0].difference.has_value());
    EXPECT_DOUBLE_EQ(report.max_abs_difference(), 0.0);
}

TEST_F(PricingEngineTest, PriceCurveFollowsSpots) {
    const std::vector<double> spots = {80.0, 90.0, 100.0, 110.0, 120.0};
    const auto call = OptionSpec::european(VanillaCall(100.0));

    PricingEngine serial(config_);
    const auto expected = serial.price_curve(call, market_, spots, PricingMethod::LATTICE);
    ASSERT_THAT(expected, SizeIs(spots.size()));
    for (std::size_t i = 1; i < expected.size(); ++i) {
        EXPECT_GT(expected[i].value, expected[i - 1].value);
    }

    config_.num_threads = 4;
    PricingEngine parallel(config_);
    const auto actual = parallel.price_curve(call, market_, spots, PricingMethod::LATTICE);
    ASSERT_THAT(actual, SizeIs(spots.size()));
    for (std::size_t i = 0; i < spots.size(); ++i) {
        EXPECT_EQ(actual[i].value, expected[i].value) << "S=" << spots[i];
    }
}

TEST_F(PricingEngineTest, PriceCurveRejectsBadSpots) {
    PricingEngine engine(config_);
    const auto call = OptionSpec::european(VanillaCall(100.0));
    EXPECT_THROW(engine.price_curve(call, market_, {100.0, -5.0}, PricingMethod::CLOSED_FORM), InvalidParameter);
    EXPECT_THROW(engine.price_curve(call, market_, {std::nan("")}, PricingMethod::CLOSED_FORM), InvalidParameter);
    EXPECT_TRUE(engine.price_curve(call, market_, {}, PricingMethod::CLOSED_FORM).empty());
}

TEST_F(PricingEngineTest, EarlyExercisePremiumOnRequest) {
    const auto put = OptionSpec::american(VanillaPut(50.0));

    PricingEngine plain(config_);
    EXPECT_FALSE(plain.price(put, put_market_).early_exercise_premium.has_value());

    config_.report_early_exercise_premium = true;
    PricingEngine reporting(config_);
    const auto result = reporting.price(put, put_market_);
    ASSERT_TRUE(result.early_exercise_premium.has_value());
    EXPECT_GT(*result.early_exercise_premium, 0.1);
    EXPECT_NEAR(*result.early_exercise_premium, reporting.lattice().early_exercise_premium(put, put_market_), 1e-12);
}

TEST_F(PricingEngineTest, PerformanceMetrics) {
    PricingEngine engine(config_);
    const auto call = OptionSpec::european(VanillaCall(100.0));

    for (int i = 0; i < 5; ++i) {
        engine.price(call, market_);
    }
    auto metrics = engine.get_performance_metrics();
    EXPECT_EQ(metrics.total_options_priced, 5u);
    EXPECT_LE(metrics.min_pricing_time, metrics.max_pricing_time);

    engine.price_curve(call, market_, {90.0, 100.0, 110.0}, PricingMethod::CLOSED_FORM);
    EXPECT_EQ(engine.get_performance_metrics().total_options_priced, 8u);

    engine.reset_performance_metrics();
    metrics = engine.get_performance_metrics();
    EXPECT_EQ(metrics.total_options_priced, 0u);
    EXPECT_EQ(metrics.total_time.count(), 0);
}

TEST_F(PricingEngineTest, NumericalInstabilitySurfaces) {
    config_.finite_difference.scheme = FiniteDifferenceScheme::EXPLICIT;
    config_.finite_difference.price_steps = 200;
    config_.finite_difference.time_steps = 100;
    PricingEngine engine(config_);

    EXPECT_THROW(engine.price(OptionSpec::european(VanillaCall(100.0)), market_, PricingMethod::FINITE_DIFFERENCE),
                 NumericalInstability);
    EXPECT_NO_THROW(engine.price(OptionSpec::european(VanillaCall(100.0)), market_));
}

TEST_F(PricingEngineTest, ConfigurationIsValidated) {
    auto config = config_;
    config.num_threads = 0;
    EXPECT_THROW((PricingEngine(config)), InvalidParameter);

    config = config_;
    config.lattice.time_steps = 0;
    EXPECT_THROW((PricingEngine(config)), InvalidParameter);

    config = config_;
    config.monte_carlo.confidence_level = 0.0;
    EXPECT_THROW((PricingEngine(config)), InvalidParameter);
}

TEST_F(PricingEngineTest, DefaultConstructedComponents) {
    PricingEngine engine;
    EXPECT_EQ(engine.config().num_threads, PricingEngine::Configuration{}.num_threads);
    EXPECT_EQ(engine.config().lattice.time_steps, LatticePricer::Configuration{}.time_steps);
    EXPECT_NEAR(engine.price(OptionSpec::european(VanillaCall(100.0)), market_).value, 10.450583572185565, 1e-8);

    EXPECT_EQ(LatticePricer().config().time_steps, LatticePricer::Configuration{}.time_steps);
    EXPECT_EQ(MonteCarloPricer().config().paths, MonteCarloPricer::Configuration{}.paths);
    EXPECT_EQ(FiniteDifferenceSolver().config().price_steps, FiniteDifferenceSolver::Configuration{}.price_steps);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
