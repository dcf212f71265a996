#include <gtest/gtest.h>
#include "ivsurf/BinomialTree.hpp"
#include "ivsurf/BlackScholes.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace ivsurf;

class BinomialTreeTest : public ::testing::Test {
protected:
    OptionContractSpec call_{OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0, 1.0, "REF"};
    OptionContractSpec put_{OptionType::PUT, ExerciseStyle::EUROPEAN, 100.0, 1.0, "REF"};
    MarketState market_{100.0, 0.05, 0.0};
    double vol_ = 0.2;
    BinomialTreeModel model_{500};
};

TEST_F(BinomialTreeTest, ErrorShrinksAsStepsDouble) {
    const auto study = BinomialTreeModel::convergence_study(call_, market_, vol_, {25, 50, 100, 200, 400, 800});
    ASSERT_EQ(study.size(), 6u);

    for (std::size_t i = 1; i < study.size(); ++i) {
        EXPECT_LE(std::abs(study[i].error), std::abs(study[i - 1].error))
            << "N=" << study[i].steps << " vs N=" << study[i - 1].steps;
        EXPECT_DOUBLE_EQ(study[i].reference_price, study[0].reference_price);
    }
    EXPECT_NEAR(study[0].reference_price, 10.450583572185565, 1e-9);
}

TEST_F(BinomialTreeTest, ConvergesToBlackScholesAtFiveHundredSteps) {
    const double reference = BlackScholesPricer::price(call_, market_, vol_);
    const double lattice = model_.price(call_, market_, vol_);
    // CRR error is O(1/N), about 4e-3 at S=100, so the 1e-3 bound is relative
    // here and absolute on the unit-scaled contract below.
    EXPECT_LT(std::abs(lattice - reference) / reference, 1e-3);

    MarketState unit_market(10.0, 0.05, 0.0);
    OptionContractSpec unit_call(OptionType::CALL, ExerciseStyle::EUROPEAN, 10.0, 1.0);
    EXPECT_LT(std::abs(model_.price(unit_call, unit_market, vol_) -
                       BlackScholesPricer::price(unit_call, unit_market, vol_)), 1e-3);
}

TEST_F(BinomialTreeTest, EuropeanPutConverges) {
    const double reference = BlackScholesPricer::price(put_, market_, vol_);
    EXPECT_NEAR(model_.price(put_, market_, vol_), reference, 1e-2);
}

TEST_F(BinomialTreeTest, AmericanPutReferenceValue) {
    const auto american_put = put_.with_exercise_style(ExerciseStyle::AMERICAN);
    EXPECT_NEAR(model_.price(american_put, market_, vol_), 6.088810110703283, 1e-6);
}

TEST_F(BinomialTreeTest, MinimumVolatilityKeepsProbabilityInRange) {
    const auto american_put = put_.with_exercise_style(ExerciseStyle::AMERICAN);
    const double dt = american_put.time_to_expiry() / static_cast<double>(model_.time_steps());
    const double floor = model_.minimum_volatility(american_put, market_);

    EXPECT_GT(floor, 0.05 * std::sqrt(dt));
    EXPECT_LT(floor, 0.01);
    EXPECT_THROW(model_.price(american_put, market_, 0.5 * 0.05 * std::sqrt(dt)), InvalidInput);

    EXPECT_NO_THROW(model_.price(american_put, market_, floor));
    Greeks greeks;
    ASSERT_NO_THROW(greeks = model_.greeks(american_put, market_, floor));
    EXPECT_TRUE(std::isfinite(greeks.vega));
    EXPECT_TRUE(std::isfinite(greeks.rho));
    EXPECT_TRUE(std::isfinite(model_.vega(american_put, market_, floor)));

    MarketState inverted(100.0, 0.0, 0.05);
    EXPECT_NO_THROW(model_.price(call_.with_exercise_style(ExerciseStyle::AMERICAN), inverted,
                                 model_.minimum_volatility(call_, inverted)));
}

TEST_F(BinomialTreeTest, AmericanPutIsWorthAtLeastEuropean) {
    for (double K : {80.0, 90.0, 100.0, 110.0, 130.0}) {
        OptionContractSpec european(OptionType::PUT, ExerciseStyle::EUROPEAN, K, 1.0);
        const auto american = european.with_exercise_style(ExerciseStyle::AMERICAN);

        const double american_price = model_.price(american, market_, vol_);
        EXPECT_GE(american_price, model_.price(european, market_, vol_)) << "K=" << K;
        EXPECT_GE(american_price, american.intrinsic(market_.spot_price())) << "K=" << K;
    }
}

TEST_F(BinomialTreeTest, AmericanCallEqualsEuropeanWithoutDividends) {
    for (double K : {80.0, 100.0, 120.0}) {
        OptionContractSpec european(OptionType::CALL, ExerciseStyle::EUROPEAN, K, 1.0);
        const auto american = european.with_exercise_style(ExerciseStyle::AMERICAN);
        EXPECT_NEAR(model_.price(american, market_, vol_), model_.price(european, market_, vol_), 1e-10);
    }
}

TEST_F(BinomialTreeTest, EarlyExercisePremium) {
    EXPECT_NEAR(model_.early_exercise_premium(put_, market_, vol_), 6.088810110703283 - 5.569527586516085, 1e-6);
    EXPECT_NEAR(model_.early_exercise_premium(call_, market_, vol_), 0.0, 1e-10);

    MarketState dividend_market(100.0, 0.05, 0.08);
    EXPECT_GT(model_.early_exercise_premium(call_, dividend_market, vol_), 0.0);
}

TEST_F(BinomialTreeTest, AtExpiryReturnsIntrinsic) {
    OptionContractSpec expired(OptionType::PUT, ExerciseStyle::AMERICAN, 105.0, 0.0);
    EXPECT_DOUBLE_EQ(model_.price(expired, market_, vol_), 5.0);
    EXPECT_DOUBLE_EQ(model_.price(expired, market_, 0.0), 5.0);
}

TEST_F(BinomialTreeTest, ZeroVolatility) {
    EXPECT_NEAR(model_.price(call_, market_, 0.0), 100.0 - 100.0 * std::exp(-0.05), 1e-12);

    OptionContractSpec itm_put(OptionType::PUT, ExerciseStyle::EUROPEAN, 110.0, 1.0);
    EXPECT_NEAR(model_.price(itm_put, market_, 0.0), 110.0 * std::exp(-0.05) - 100.0, 1e-12);

    const auto american_put = itm_put.with_exercise_style(ExerciseStyle::AMERICAN);
    EXPECT_DOUBLE_EQ(model_.price(american_put, market_, 0.0), 10.0);
}

TEST_F(BinomialTreeTest, RejectsProbabilityOutsideUnitInterval) {
    OptionContractSpec option(OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0, 1.0);
    MarketState high_rate(100.0, 0.5, 0.0);

    try {
        BinomialTreeModel::price_with_steps(option, high_rate, 0.01, 1);
        FAIL() << "expected InvalidInput";
    } catch (const InvalidInput& e) {
        EXPECT_EQ(e.field(), "risk_neutral_probability");
    }
}

TEST_F(BinomialTreeTest, RejectsZeroSteps) {
    EXPECT_THROW(BinomialTreeModel(std::size_t{0}), InvalidInput);
    EXPECT_THROW(BinomialTreeModel::price_with_steps(call_, market_, vol_, 0), InvalidInput);
}

TEST_F(BinomialTreeTest, RejectsNegativeVolatility) {
    EXPECT_THROW(model_.price(call_, market_, -0.2), InvalidInput);
    EXPECT_THROW(model_.greeks(call_, market_, -0.2), InvalidInput);
}

TEST_F(BinomialTreeTest, FiniteDifferenceGreeksApproximateBlackScholes) {
    const auto lattice = model_.greeks(call_, market_, vol_);
    const auto analytic = BlackScholesPricer::greeks(call_, market_, vol_);

    EXPECT_NEAR(lattice.delta, analytic.delta, 1e-3);
    EXPECT_NEAR(lattice.gamma, analytic.gamma, 1e-4);
    EXPECT_NEAR(lattice.vega, analytic.vega, 0.1);
    EXPECT_NEAR(lattice.theta, analytic.theta, 0.05);
    EXPECT_NEAR(lattice.rho, analytic.rho, 0.05);
}

TEST_F(BinomialTreeTest, FiniteDifferenceGreeksAwayFromTheMoney) {
    OptionContractSpec itm_put(OptionType::PUT, ExerciseStyle::EUROPEAN, 90.0, 1.0);
    OptionContractSpec otm_call(OptionType::CALL, ExerciseStyle::EUROPEAN, 110.0, 1.0);

    for (const auto& option : {itm_put, otm_call}) {
        const auto lattice = model_.greeks(option, market_, vol_);
        const auto analytic = BlackScholesPricer::greeks(option, market_, vol_);
        EXPECT_NEAR(lattice.delta, analytic.delta, 1e-3) << "K=" << option.strike();
        EXPECT_NEAR(lattice.gamma, analytic.gamma, 1e-4) << "K=" << option.strike();
    }
}

TEST_F(BinomialTreeTest, EvaluateFlagsApproximateGreeks) {
    const auto result = model_.evaluate(put_.with_exercise_style(ExerciseStyle::AMERICAN), market_, vol_);

    EXPECT_TRUE(result.has_greeks);
    EXPECT_FALSE(result.greeks_exact);
    EXPECT_FALSE(model_.has_exact_greeks());
    EXPECT_EQ(result.model_name, "crr_binomial_500");
    EXPECT_LT(result.greeks.delta, 0.0);
    EXPECT_GT(result.greeks.gamma, 0.0);
}

TEST_F(BinomialTreeTest, VegaIsPositiveAndCloseToAnalytic) {
    const double lattice_vega = model_.vega(call_, market_, vol_);
    EXPECT_GT(lattice_vega, 0.0);
    EXPECT_NEAR(lattice_vega, BlackScholesPricer::vega(call_, market_, vol_), 0.1);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ivsurf::utils::Logger::instance().set_level(ivsurf::utils::LogLevel::ERR);
    return RUN_ALL_TESTS();
}
