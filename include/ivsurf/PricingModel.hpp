#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../utils/Timer.hpp"
#include <string>

namespace ivsurf {

inline void validate_volatility(double vol) {
    detail::require_non_negative("volatility", vol);
}

// Capability interface shared by every pricing model. The implied-volatility
// solver and the analytics layer are written against this class only.
class PricingModel {
public:
    virtual ~PricingModel() = default;

    virtual double price(const OptionContractSpec& option, const MarketState& market, double vol) const = 0;

    virtual Greeks greeks(const OptionContractSpec& option, const MarketState& market, double vol) const = 0;

    // dPrice/dVol; analytic where the model has a closed form.
    virtual double vega(const OptionContractSpec& option, const MarketState& market, double vol) const = 0;

    // Smallest volatility the model can price this contract at. Zero unless
    // the model's discretization imposes a floor.
    virtual double minimum_volatility(const OptionContractSpec& /*option*/, const MarketState& /*market*/) const {
        return 0.0;
    }

    virtual bool has_exact_greeks() const noexcept = 0;

    virtual std::string name() const = 0;

    PricingResult evaluate(const OptionContractSpec& option, const MarketState& market, double vol,
                           bool with_greeks = true) const {
        utils::HighResolutionTimer timer;

        PricingResult result(price(option, market, vol));
        if (with_greeks) {
            result.greeks = greeks(option, market, vol);
            result.has_greeks = true;
            result.greeks_exact = has_exact_greeks();
        }
        result.model_name = name();
        result.computation_time = timer.elapsed();

        return result;
    }
};

}
