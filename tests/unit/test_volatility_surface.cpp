#include <gtest/gtest.h>
#include "ivsurf/VolatilitySurface.hpp"
#include "utils/Logger.hpp"
#include <vector>

using namespace ivsurf;

class VolatilitySurfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Two expiries, strikes out of order, one failed solve and one put.
        add(OptionType::CALL, 112.0, 0.5, 0.21);
        add(OptionType::CALL, 88.0, 0.5, 0.27);
        add(OptionType::CALL, 100.0, 0.5, 0.23);
        add(OptionType::CALL, 120.0, 0.5, 0.40, false);
        add(OptionType::PUT, 95.0, 0.5, 0.25);
        add(OptionType::CALL, 100.0, 0.25, 0.26);
        add(OptionType::CALL, 103.0, 0.25, 0.245);
        add(OptionType::CALL, 100.0, 1.0, 0.22);
        add(OptionType::CALL, 97.0, 1.0, 0.225);
    }

    void add(OptionType type, double strike, double expiry, double iv, bool converged = true) {
        OptionContractSpec spec(type, ExerciseStyle::EUROPEAN, strike, expiry);
        ImpliedVolatilityResult result;
        result.implied_volatility = iv;
        result.converged = converged;
        result.status = converged ? SolverStatus::CONVERGED : SolverStatus::MAX_ITERATIONS;
        observations_.emplace_back(OptionQuote(spec, market_, 1.0), result);
    }

    MarketState market_{100.0, 0.05, 0.0};
    std::vector<IvObservation> observations_;
    VolatilitySurfaceBuilder builder_;
};

TEST_F(VolatilitySurfaceTest, SmileIsSortedByStrike) {
    const auto smile = builder_.build_smile(observations_, 0.5);

    EXPECT_EQ(smile.kind, SeriesKind::SMILE);
    EXPECT_DOUBLE_EQ(smile.fixed_key, 0.5);
    EXPECT_FALSE(smile.includes_non_converged);
    EXPECT_EQ(smile.xs(), (std::vector<double>{88.0, 95.0, 100.0, 112.0}));
    EXPECT_EQ(smile.ys(), (std::vector<double>{0.27, 0.25, 0.23, 0.21}));
}

TEST_F(VolatilitySurfaceTest, SmileCanIncludeFailedSolves) {
    SurfaceParameters params;
    params.include_non_converged = true;
    VolatilitySurfaceBuilder builder(params);

    const auto smile = builder.build_smile(observations_, 0.5);

    EXPECT_TRUE(smile.includes_non_converged);
    ASSERT_EQ(smile.size(), 5u);
    EXPECT_DOUBLE_EQ(smile.points.back().x, 120.0);
    EXPECT_FALSE(smile.points.back().converged);
}

TEST_F(VolatilitySurfaceTest, TypeFilterRestrictsToCalls) {
    SurfaceParameters params;
    params.type_filter = OptionType::CALL;
    VolatilitySurfaceBuilder builder(params);

    const auto smile = builder.build_smile(observations_, 0.5);
    EXPECT_EQ(smile.xs(), (std::vector<double>{88.0, 100.0, 112.0}));
}

TEST_F(VolatilitySurfaceTest, SmileForUnknownExpiryIsEmpty) {
    EXPECT_TRUE(builder_.build_smile(observations_, 2.0).empty());
    EXPECT_TRUE(builder_.build_smile({}, 0.5).empty());
}

TEST_F(VolatilitySurfaceTest, ExpiryMatchingUsesTolerance) {
    EXPECT_EQ(builder_.build_smile(observations_, 0.5 + 1e-12).size(), 4u);

    SurfaceParameters params;
    params.expiry_tolerance = 0.3;
    VolatilitySurfaceBuilder loose(params);
    EXPECT_EQ(loose.build_smile(observations_, 0.5).size(), 6u);
}

TEST_F(VolatilitySurfaceTest, TermStructureIsSortedByExpiry) {
    const auto term = builder_.build_term_structure(observations_, 100.0);

    EXPECT_EQ(term.kind, SeriesKind::TERM_STRUCTURE);
    EXPECT_DOUBLE_EQ(term.fixed_key, 100.0);
    EXPECT_EQ(term.xs(), (std::vector<double>{0.25, 0.5, 1.0}));
    EXPECT_EQ(term.ys(), (std::vector<double>{0.26, 0.23, 0.22}));
}

TEST_F(VolatilitySurfaceTest, TermStructureByMoneynessPicksNearestPerExpiry) {
    const auto term = builder_.build_term_structure_by_moneyness(observations_, 1.02, 0.05);

    EXPECT_DOUBLE_EQ(term.fixed_key, 1.02);
    EXPECT_EQ(term.xs(), (std::vector<double>{0.25, 0.5, 1.0}));
    // 0.25: K=103 beats K=100; 0.5: K=100; 1.0: K=100 beats K=97.
    EXPECT_EQ(term.ys(), (std::vector<double>{0.245, 0.23, 0.22}));
}

TEST_F(VolatilitySurfaceTest, TermStructureByMoneynessRespectsBucketWidth) {
    const auto term = builder_.build_term_structure_by_moneyness(observations_, 0.88, 0.01);
    EXPECT_EQ(term.xs(), (std::vector<double>{0.5}));
    EXPECT_EQ(term.ys(), (std::vector<double>{0.27}));

    EXPECT_THROW(builder_.build_term_structure_by_moneyness(observations_, 0.0, 0.1), InvalidInput);
}

TEST_F(VolatilitySurfaceTest, AtmTermStructureAveragesPerExpiry) {
    const auto term = builder_.build_atm_term_structure(observations_);

    EXPECT_EQ(term.xs(), (std::vector<double>{0.25, 0.5, 1.0}));
    ASSERT_EQ(term.size(), 3u);
    EXPECT_NEAR(term.points[0].implied_volatility, (0.26 + 0.245) / 2.0, 1e-15);
    EXPECT_NEAR(term.points[1].implied_volatility, (0.23 + 0.25) / 2.0, 1e-15);
    EXPECT_NEAR(term.points[2].implied_volatility, (0.22 + 0.225) / 2.0, 1e-15);
}

TEST_F(VolatilitySurfaceTest, NarrowAtmBandDropsWingStrikes) {
    const auto narrow = builder_.build_atm_term_structure(observations_, 0.02);
    ASSERT_EQ(narrow.size(), 3u);
    EXPECT_NEAR(narrow.points[0].implied_volatility, 0.26, 1e-15);
    EXPECT_NEAR(narrow.points[2].implied_volatility, 0.22, 1e-15);
}

TEST_F(VolatilitySurfaceTest, DistinctKeys) {
    EXPECT_EQ(builder_.expiries(observations_), (std::vector<double>{0.25, 0.5, 1.0}));
    EXPECT_EQ(builder_.strikes(observations_), (std::vector<double>{88.0, 95.0, 97.0, 100.0, 103.0, 112.0}));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ivsurf::utils::Logger::instance().set_level(ivsurf::utils::LogLevel::ERR);
    return RUN_ALL_TESTS();
}
