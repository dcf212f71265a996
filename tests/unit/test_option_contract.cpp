#include <gtest/gtest.h>
#include "types/Option.hpp"
#include "types/Market.hpp"
#include "types/Results.hpp"
#include "utils/Logger.hpp"
#include <chrono>
#include <cmath>
#include <limits>

using namespace ivsurf;

class OptionContractTest : public ::testing::Test {
protected:
    void SetUp() override {
        valuation_ = std::chrono::system_clock::from_time_t(1700000000);
        tolerance_ = 1e-12;
    }

    Timestamp valuation_;
    double tolerance_;
};

TEST_F(OptionContractTest, ConstructsValidContract) {
    OptionContractSpec spec(OptionType::PUT, ExerciseStyle::AMERICAN, 95.0, 0.5, "SPY");

    EXPECT_EQ(spec.type(), OptionType::PUT);
    EXPECT_EQ(spec.exercise_style(), ExerciseStyle::AMERICAN);
    EXPECT_DOUBLE_EQ(spec.strike(), 95.0);
    EXPECT_DOUBLE_EQ(spec.time_to_expiry(), 0.5);
    EXPECT_EQ(spec.underlying_symbol(), "SPY");
    EXPECT_FALSE(spec.is_call());
    EXPECT_FALSE(spec.at_expiry());
}

TEST_F(OptionContractTest, RejectsNonPositiveStrike) {
    EXPECT_THROW(OptionContractSpec(OptionType::CALL, ExerciseStyle::EUROPEAN, 0.0, 1.0), InvalidInput);
    EXPECT_THROW(OptionContractSpec(OptionType::CALL, ExerciseStyle::EUROPEAN, -5.0, 1.0), InvalidInput);
    EXPECT_THROW(OptionContractSpec(OptionType::CALL, ExerciseStyle::EUROPEAN,
                                    std::numeric_limits<double>::infinity(), 1.0), InvalidInput);
}

TEST_F(OptionContractTest, RejectsNegativeOrNonFiniteExpiry) {
    EXPECT_THROW(OptionContractSpec(OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0, -0.01), InvalidInput);
    EXPECT_THROW(OptionContractSpec(OptionType::PUT, ExerciseStyle::EUROPEAN, 100.0,
                                    std::numeric_limits<double>::quiet_NaN()), InvalidInput);
}

TEST_F(OptionContractTest, ZeroExpiryIsAtExpiry) {
    OptionContractSpec spec(OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0, 0.0);
    EXPECT_TRUE(spec.at_expiry());
    EXPECT_DOUBLE_EQ(spec.intrinsic(112.5), 12.5);
    EXPECT_DOUBLE_EQ(spec.intrinsic(90.0), 0.0);
}

TEST_F(OptionContractTest, InvalidInputNamesTheField) {
    try {
        OptionContractSpec(OptionType::CALL, ExerciseStyle::EUROPEAN, -1.0, 1.0);
        FAIL() << "expected InvalidInput";
    } catch (const InvalidInput& e) {
        EXPECT_EQ(e.field(), "strike");
    }
}

TEST_F(OptionContractTest, FromExpirationCountsExpirationDay) {
    const auto expiration = valuation_ + std::chrono::hours(24 * 10);
    auto spec = OptionContractSpec::from_expiration(OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0,
                                                    valuation_, expiration, "AAPL");

    EXPECT_NEAR(spec.time_to_expiry(), 11.0 / DAYS_PER_YEAR, tolerance_);
}

TEST_F(OptionContractTest, FromExpirationOnExpirationDay) {
    const auto expiration = valuation_ - std::chrono::hours(12);
    auto spec = OptionContractSpec::from_expiration(OptionType::PUT, ExerciseStyle::EUROPEAN, 100.0,
                                                    valuation_, expiration);

    EXPECT_NEAR(spec.time_to_expiry(), 0.5 / DAYS_PER_YEAR, tolerance_);
}

TEST_F(OptionContractTest, FromExpirationRejectsExpiredContract) {
    const auto expiration = valuation_ - std::chrono::hours(48);
    EXPECT_THROW(OptionContractSpec::from_expiration(OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0,
                                                     valuation_, expiration),
                 InvalidInput);
}

TEST_F(OptionContractTest, WithHelpersPreserveOtherFields) {
    OptionContractSpec spec(OptionType::PUT, ExerciseStyle::EUROPEAN, 80.0, 2.0, "XYZ");

    auto american = spec.with_exercise_style(ExerciseStyle::AMERICAN);
    EXPECT_EQ(american.exercise_style(), ExerciseStyle::AMERICAN);
    EXPECT_DOUBLE_EQ(american.strike(), 80.0);
    EXPECT_DOUBLE_EQ(american.time_to_expiry(), 2.0);

    auto shorter = spec.with_time_to_expiry(1.0);
    EXPECT_DOUBLE_EQ(shorter.time_to_expiry(), 1.0);
    EXPECT_EQ(shorter.type(), OptionType::PUT);
    EXPECT_EQ(shorter.underlying_symbol(), "XYZ");
}

class MarketStateTest : public ::testing::Test {};

TEST_F(MarketStateTest, RejectsInvalidSpot) {
    EXPECT_THROW(MarketState(0.0, 0.05), InvalidInput);
    EXPECT_THROW(MarketState(-100.0, 0.05), InvalidInput);
    EXPECT_THROW(MarketState(std::numeric_limits<double>::quiet_NaN(), 0.05), InvalidInput);
}

TEST_F(MarketStateTest, RejectsNonFiniteRates) {
    EXPECT_THROW(MarketState(100.0, std::numeric_limits<double>::infinity()), InvalidInput);
    EXPECT_THROW(MarketState(100.0, 0.05, std::numeric_limits<double>::quiet_NaN()), InvalidInput);
}

TEST_F(MarketStateTest, NegativeRatesAreAllowed) {
    MarketState market(100.0, -0.005, 0.01);
    EXPECT_DOUBLE_EQ(market.risk_free_rate(), -0.005);
    EXPECT_DOUBLE_EQ(market.dividend_yield(), 0.01);
}

TEST_F(MarketStateTest, MoneynessIsStrikeOverSpot) {
    MarketState market(200.0, 0.03);
    OptionContractSpec spec(OptionType::CALL, ExerciseStyle::EUROPEAN, 220.0, 1.0);
    EXPECT_DOUBLE_EQ(moneyness(spec, market), 1.1);
}

TEST_F(MarketStateTest, QuoteRejectsInvalidPrice) {
    MarketState market(100.0, 0.05);
    OptionContractSpec spec(OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0, 1.0);

    EXPECT_THROW(OptionQuote(spec, market, -0.01), InvalidInput);
    EXPECT_THROW(OptionQuote(spec, market, std::numeric_limits<double>::quiet_NaN()), InvalidInput);
    EXPECT_NO_THROW(OptionQuote(spec, market, 0.0));
}

TEST_F(MarketStateTest, AnalyticsRowMarksMissingValues) {
    MarketState market(100.0, 0.05, 0.01);
    OptionContractSpec spec(OptionType::PUT, ExerciseStyle::EUROPEAN, 105.0, 0.25);
    AnalyticsRecord record(OptionQuote(spec, market, 6.0), ImpliedVolatilityResult{});

    const auto row = record.to_row();
    ASSERT_EQ(row.size(), 16u);
    EXPECT_EQ(row[0].first, "S");
    EXPECT_DOUBLE_EQ(row[0].second, 100.0);
    EXPECT_EQ(row[5].first, "is_call");
    EXPECT_DOUBLE_EQ(row[5].second, 0.0);
    EXPECT_EQ(row[7].first, "calc_iv");
    EXPECT_TRUE(std::isnan(row[7].second));
    EXPECT_EQ(row[10].first, "delta");
    EXPECT_TRUE(std::isnan(row[10].second));
    EXPECT_EQ(row.back().first, "reprice_error");
    EXPECT_TRUE(std::isnan(row.back().second));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ivsurf::utils::Logger::instance().set_level(ivsurf::utils::LogLevel::ERR);
    return RUN_ALL_TESTS();
}
