#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../math/Optimization.hpp"
#include <algorithm>
#include <functional>

namespace ivsurf {

struct GreekBumpSizes {
    double spot_relative = 1e-2;
    double volatility = 1e-4;
    double time = 1.0 / DAYS_PER_YEAR;
    double rate = 1e-4;
};

// Bump-and-reprice sensitivities for models without closed-form Greeks.
// These are approximations; their accuracy depends on the bump sizes and on
// how smooth the pricing function is in each input.
class GreeksCalculator {
public:
    using PricingFunction = std::function<double(const OptionContractSpec&, const MarketState&, double)>;
    using BumpSizes = GreekBumpSizes;

    static Greeks calculate_numerical_greeks(
        const OptionContractSpec& option,
        const MarketState& market,
        double vol,
        const PricingFunction& pricing_function,
        const BumpSizes& bumps = BumpSizes{},
        double min_volatility = 0.0) {

        detail::require_positive("spot_relative", bumps.spot_relative);

        Greeks greeks;
        const double base_price = pricing_function(option, market, vol);

        // Multiplicative spot bumps S(1+h) and S/(1+h); a lattice passing
        // h = u^2 - 1 keeps the strike at the same place between nodes.
        {
            const double spot = market.spot_price();
            const double up_spot = spot * (1.0 + bumps.spot_relative);
            const double down_spot = spot / (1.0 + bumps.spot_relative);
            const double up_price = pricing_function(option, market.with_spot(up_spot), vol);
            const double down_price = pricing_function(option, market.with_spot(down_spot), vol);

            const double up_slope = (up_price - base_price) / (up_spot - spot);
            const double down_slope = (base_price - down_price) / (spot - down_spot);
            greeks.delta = (up_price - down_price) / (up_spot - down_spot);
            greeks.gamma = 2.0 * (up_slope - down_slope) / (up_spot - down_spot);
        }

        greeks.vega = numerical_vega(option, market, vol, pricing_function, bumps.volatility, min_volatility);

        if (option.time_to_expiry() > 0.0) {
            const double h = std::min(bumps.time, option.time_to_expiry());
            const double shorter_price = pricing_function(
                option.with_time_to_expiry(option.time_to_expiry() - h), market, vol);
            greeks.theta = (shorter_price - base_price) / h;
        }

        {
            const double h = bumps.rate;
            const double r = market.risk_free_rate();
            const double up_price = pricing_function(option, market.with_rate(r + h), vol);
            const double down_price = pricing_function(option, market.with_rate(r - h), vol);
            greeks.rho = (up_price - down_price) / (2.0 * h);
        }

        return greeks;
    }

    // Central difference in volatility, one-sided when the downward bump would
    // fall to or below min_volatility.
    static double numerical_vega(
        const OptionContractSpec& option,
        const MarketState& market,
        double vol,
        const PricingFunction& pricing_function,
        double bump = 1e-4,
        double min_volatility = 0.0) {

        const std::function<double(double)> price_in_vol = [&](double v) {
            return pricing_function(option, market, v);
        };

        if (vol - bump > min_volatility) {
            return math::FiniteDifference<double>::central_difference(price_in_vol, vol, bump);
        }
        return math::FiniteDifference<double>::forward_difference(price_in_vol, vol, bump);
    }
};

}
