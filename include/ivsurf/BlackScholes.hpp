#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../math/NormalDistribution.hpp"
#include "PricingModel.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ivsurf {

// Closed-form Black-Scholes-Merton pricing with continuous dividend yield.
// Strictly European; on an American put it is only a lower bound.
class BlackScholesPricer {
public:
    static double price(const OptionContractSpec& option, const MarketState& market, double vol) {
        validate_volatility(vol);

        const double S = market.spot_price();
        const double K = option.strike();
        const double T = option.time_to_expiry();
        const double r = market.risk_free_rate();
        const double q = market.dividend_yield();

        if (is_degenerate(T, vol)) {
            return forward_intrinsic(option, market);
        }

        const double d1 = math::NormalDistribution::d1(S, K, T, r, vol, q);
        const double d2 = d1 - vol * std::sqrt(T);

        const double discount_factor = std::exp(-r * T);
        const double dividend_discount = std::exp(-q * T);

        double option_price;
        if (option.is_call()) {
            option_price = S * dividend_discount * math::NormalDistribution::cdf(d1) -
                           K * discount_factor * math::NormalDistribution::cdf(d2);
        } else {
            option_price = K * discount_factor * math::NormalDistribution::cdf(-d2) -
                           S * dividend_discount * math::NormalDistribution::cdf(-d1);
        }

        return std::max(option_price, 0.0);
    }

    static Greeks greeks(const OptionContractSpec& option, const MarketState& market, double vol) {
        validate_volatility(vol);

        const double S = market.spot_price();
        const double K = option.strike();
        const double T = option.time_to_expiry();
        const double r = market.risk_free_rate();
        const double q = market.dividend_yield();

        if (is_degenerate(T, vol)) {
            return degenerate_greeks(option, market);
        }

        const double sqrt_T = std::sqrt(T);
        const double vol_sqrt_T = vol * sqrt_T;
        const double d1 = math::NormalDistribution::d1(S, K, T, r, vol, q);
        const double d2 = d1 - vol_sqrt_T;

        const double pdf_d1 = math::NormalDistribution::pdf(d1);
        const double discount_factor = std::exp(-r * T);
        const double dividend_discount = std::exp(-q * T);

        Greeks greeks;
        greeks.gamma = dividend_discount * pdf_d1 / (S * vol_sqrt_T);
        greeks.vega = S * dividend_discount * pdf_d1 * sqrt_T;

        const double theta_common = -S * dividend_discount * pdf_d1 * vol / (2.0 * sqrt_T);

        if (option.is_call()) {
            const double Nd1 = math::NormalDistribution::cdf(d1);
            const double Nd2 = math::NormalDistribution::cdf(d2);
            greeks.delta = dividend_discount * Nd1;
            greeks.theta = theta_common - r * K * discount_factor * Nd2 + q * S * dividend_discount * Nd1;
            greeks.rho = K * T * discount_factor * Nd2;
        } else {
            const double N_minus_d1 = math::NormalDistribution::cdf(-d1);
            const double N_minus_d2 = math::NormalDistribution::cdf(-d2);
            greeks.delta = -dividend_discount * N_minus_d1;
            greeks.theta = theta_common + r * K * discount_factor * N_minus_d2 - q * S * dividend_discount * N_minus_d1;
            greeks.rho = -K * T * discount_factor * N_minus_d2;
        }

        return greeks;
    }

    static double vega(const OptionContractSpec& option, const MarketState& market, double vol) {
        validate_volatility(vol);

        const double T = option.time_to_expiry();
        if (is_degenerate(T, vol)) {
            return 0.0;
        }

        const double S = market.spot_price();
        const double d1 = math::NormalDistribution::d1(S, option.strike(), T, market.risk_free_rate(),
                                                       vol, market.dividend_yield());
        return S * std::exp(-market.dividend_yield() * T) * math::NormalDistribution::pdf(d1) * std::sqrt(T);
    }

    // No-arbitrage lower bound max(S e^{-qT} - K e^{-rT}, 0) for calls and its
    // mirror for puts. This is also the zero-volatility price.
    static double forward_intrinsic(const OptionContractSpec& option, const MarketState& market) noexcept {
        const double T = option.time_to_expiry();
        const double discounted_spot = market.spot_price() * std::exp(-market.dividend_yield() * T);
        const double discounted_strike = option.strike() * std::exp(-market.risk_free_rate() * T);
        return intrinsic_value(option.type(), discounted_spot, discounted_strike);
    }

private:
    static bool is_degenerate(double T, double vol) noexcept {
        return !(vol * std::sqrt(T) > 0.0);
    }

    // Derivatives of the deterministic payoff max(S e^{-qT} - K e^{-rT}, 0).
    static Greeks degenerate_greeks(const OptionContractSpec& option, const MarketState& market) noexcept {
        const double S = market.spot_price();
        const double K = option.strike();
        const double T = option.time_to_expiry();
        const double r = market.risk_free_rate();
        const double q = market.dividend_yield();

        const double discounted_spot = S * std::exp(-q * T);
        const double discounted_strike = K * std::exp(-r * T);

        Greeks greeks;
        if (option.is_call() && discounted_spot > discounted_strike) {
            greeks.delta = std::exp(-q * T);
            greeks.theta = q * discounted_spot - r * discounted_strike;
            greeks.rho = T * discounted_strike;
        } else if (!option.is_call() && discounted_strike > discounted_spot) {
            greeks.delta = -std::exp(-q * T);
            greeks.theta = r * discounted_strike - q * discounted_spot;
            greeks.rho = -T * discounted_strike;
        }
        return greeks;
    }
};

class BlackScholesModel final : public PricingModel {
public:
    double price(const OptionContractSpec& option, const MarketState& market, double vol) const override {
        return BlackScholesPricer::price(option, market, vol);
    }

    Greeks greeks(const OptionContractSpec& option, const MarketState& market, double vol) const override {
        return BlackScholesPricer::greeks(option, market, vol);
    }

    double vega(const OptionContractSpec& option, const MarketState& market, double vol) const override {
        return BlackScholesPricer::vega(option, market, vol);
    }

    bool has_exact_greeks() const noexcept override {
        return true;
    }

    std::string name() const override {
        return "black_scholes_merton";
    }
};

}
