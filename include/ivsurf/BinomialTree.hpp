#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../utils/Timer.hpp"
#include "BlackScholes.hpp"
#include "Greeks.hpp"
#include "PricingModel.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace ivsurf {

// Cox-Ross-Rubinstein recombining binomial lattice. American contracts are
// checked for early exercise at every node; European contracts converge to
// the Black-Scholes-Merton price as the step count grows.
class BinomialTreeModel final : public PricingModel {
public:
    struct TreeParameters {
        std::size_t time_steps = 500;
        GreeksCalculator::BumpSizes bumps{1e-2, 1e-3, 1.0 / DAYS_PER_YEAR, 1e-4};
    };

    BinomialTreeModel()
        : BinomialTreeModel(TreeParameters{}) {}

    explicit BinomialTreeModel(const TreeParameters& params)
        : params_(params) {
        if (params_.time_steps == 0) {
            throw InvalidInput("time_steps", "lattice needs at least one step");
        }
    }

    explicit BinomialTreeModel(std::size_t time_steps)
        : BinomialTreeModel(TreeParameters{time_steps, TreeParameters{}.bumps}) {}

    double price(const OptionContractSpec& option, const MarketState& market, double vol) const override {
        return price_with_steps(option, market, vol, params_.time_steps);
    }

    // Spot is bumped by exactly one lattice level (S u^2, S d^2) so the bumped
    // trees share the base tree's node layout around the strike.
    Greeks greeks(const OptionContractSpec& option, const MarketState& market, double vol) const override {
        validate_volatility(vol);
        GreeksCalculator::BumpSizes bumps = params_.bumps;
        const double node_spacing = std::exp(2.0 * vol * std::sqrt(option.time_to_expiry() /
                                                                   static_cast<double>(params_.time_steps))) - 1.0;
        if (node_spacing > 0.0) {
            bumps.spot_relative = node_spacing;
        }
        return GreeksCalculator::calculate_numerical_greeks(option, market, vol, pricing_function(), bumps,
                                                            minimum_volatility(option, market));
    }

    double vega(const OptionContractSpec& option, const MarketState& market, double vol) const override {
        return GreeksCalculator::numerical_vega(option, market, vol, pricing_function(), params_.bumps.volatility,
                                                minimum_volatility(option, market));
    }

    // Floor on sigma that keeps p inside (0, 1) for the base tree and for the
    // rate-bumped trees used by rho.
    double minimum_volatility(const OptionContractSpec& option, const MarketState& market) const override {
        const double carry = std::abs(market.risk_free_rate() - market.dividend_yield()) + params_.bumps.rate;
        return minimum_volatility_for_steps(option, carry, params_.time_steps);
    }

    // p lies in (0, 1) exactly when vol * sqrt(dt) > |carry| * dt.
    static double minimum_volatility_for_steps(const OptionContractSpec& option, double carry, std::size_t steps) {
        if (steps == 0) {
            throw InvalidInput("time_steps", "lattice needs at least one step");
        }
        const double dt = option.time_to_expiry() / static_cast<double>(steps);
        return PROBABILITY_MARGIN * std::abs(carry) * std::sqrt(dt);
    }

    bool has_exact_greeks() const noexcept override {
        return false;
    }

    std::string name() const override {
        return "crr_binomial_" + std::to_string(params_.time_steps);
    }

    std::size_t time_steps() const noexcept {
        return params_.time_steps;
    }

    static double price_with_steps(
        const OptionContractSpec& option,
        const MarketState& market,
        double vol,
        std::size_t steps) {

        validate_volatility(vol);
        if (steps == 0) {
            throw InvalidInput("time_steps", "lattice needs at least one step");
        }

        const double S0 = market.spot_price();
        const double K = option.strike();
        const double T = option.time_to_expiry();
        const double r = market.risk_free_rate();
        const double q = market.dividend_yield();
        const bool american = option.exercise_style() == ExerciseStyle::AMERICAN;

        if (T == 0.0) {
            return option.intrinsic(S0);
        }

        const double dt = T / static_cast<double>(steps);
        const double vol_sqrt_dt = vol * std::sqrt(dt);

        if (!(vol_sqrt_dt > 0.0)) {
            return deterministic_price(option, market, steps);
        }

        const double u = std::exp(vol_sqrt_dt);
        const double d = 1.0 / u;
        const double p = (std::exp((r - q) * dt) - d) / (u - d);

        if (!(p > 0.0 && p < 1.0)) {
            throw InvalidInput("risk_neutral_probability",
                               "p = " + std::to_string(p) + " outside (0, 1); (r - q) * dt too large for vol * sqrt(dt)");
        }

        const double discount = std::exp(-r * dt);
        const double discounted_p = discount * p;
        const double discounted_q = discount * (1.0 - p);

        std::vector<double> option_values(steps + 1);
        for (std::size_t j = 0; j <= steps; ++j) {
            const double S_T = S0 * std::pow(u, 2.0 * static_cast<double>(j) - static_cast<double>(steps));
            option_values[j] = option.intrinsic(S_T);
        }

        for (std::size_t step = steps; step-- > 0;) {
            for (std::size_t j = 0; j <= step; ++j) {
                const double continuation_value = discounted_p * option_values[j + 1] + discounted_q * option_values[j];

                if (american) {
                    const double S = S0 * std::pow(u, 2.0 * static_cast<double>(j) - static_cast<double>(step));
                    option_values[j] = std::max(continuation_value, option.intrinsic(S));
                } else {
                    option_values[j] = continuation_value;
                }
            }
        }

        return std::max(option_values[0], 0.0);
    }

    // American price minus European price on the same lattice.
    double early_exercise_premium(const OptionContractSpec& option, const MarketState& market, double vol) const {
        const double american = price(option.with_exercise_style(ExerciseStyle::AMERICAN), market, vol);
        const double european = price(option.with_exercise_style(ExerciseStyle::EUROPEAN), market, vol);
        return american - european;
    }

    // Lattice price of the European counterpart against the closed form for
    // each requested step count.
    static std::vector<ConvergencePoint> convergence_study(
        const OptionContractSpec& option,
        const MarketState& market,
        double vol,
        const std::vector<std::size_t>& step_counts) {

        const auto european = option.with_exercise_style(ExerciseStyle::EUROPEAN);
        const double reference = BlackScholesPricer::price(european, market, vol);

        std::vector<ConvergencePoint> points;
        points.reserve(step_counts.size());

        for (const auto steps : step_counts) {
            utils::HighResolutionTimer timer;
            ConvergencePoint point;
            point.steps = steps;
            point.lattice_price = price_with_steps(european, market, vol, steps);
            point.computation_time = timer.elapsed();
            point.reference_price = reference;
            point.error = point.lattice_price - reference;
            points.push_back(point);
        }

        return points;
    }

private:
    static constexpr double PROBABILITY_MARGIN = 1.01;

    TreeParameters params_;

    GreeksCalculator::PricingFunction pricing_function() const {
        const std::size_t steps = params_.time_steps;
        return [steps](const OptionContractSpec& opt, const MarketState& mkt, double v) {
            return price_with_steps(opt, mkt, v, steps);
        };
    }

    // Zero volatility: the spot follows its forward deterministically, so the
    // lattice collapses to one path. European contracts can only be exercised
    // at the last step.
    static double deterministic_price(const OptionContractSpec& option, const MarketState& market, std::size_t steps) {
        const double T = option.time_to_expiry();
        const double r = market.risk_free_rate();
        const double growth = market.risk_free_rate() - market.dividend_yield();

        if (option.exercise_style() == ExerciseStyle::EUROPEAN) {
            return BlackScholesPricer::forward_intrinsic(option, market);
        }

        double best = 0.0;
        for (std::size_t k = 0; k <= steps; ++k) {
            const double t = T * static_cast<double>(k) / static_cast<double>(steps);
            const double spot_t = market.spot_price() * std::exp(growth * t);
            best = std::max(best, std::exp(-r * t) * option.intrinsic(spot_t));
        }
        return best;
    }
};

}
