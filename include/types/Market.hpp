#pragma once

#include "Errors.hpp"
#include "Option.hpp"
#include <chrono>
#include <string>
#include <utility>

namespace ivsurf {

// Market snapshot as of a valuation instant. Rates are continuously compounded.
class MarketState {
public:
    MarketState(double spot, double risk_free_rate, double dividend_yield = 0.0,
                Timestamp valuation_time = std::chrono::system_clock::now())
        : spot_price_(spot), risk_free_rate_(risk_free_rate), dividend_yield_(dividend_yield),
          valuation_time_(valuation_time) {
        detail::require_positive("spot_price", spot_price_);
        detail::require_finite("risk_free_rate", risk_free_rate_);
        detail::require_finite("dividend_yield", dividend_yield_);
    }

    double spot_price() const noexcept { return spot_price_; }
    double risk_free_rate() const noexcept { return risk_free_rate_; }
    double dividend_yield() const noexcept { return dividend_yield_; }
    Timestamp valuation_time() const noexcept { return valuation_time_; }

    MarketState with_spot(double spot) const {
        return MarketState(spot, risk_free_rate_, dividend_yield_, valuation_time_);
    }

    MarketState with_rate(double rate) const {
        return MarketState(spot_price_, rate, dividend_yield_, valuation_time_);
    }

private:
    double spot_price_;
    double risk_free_rate_;
    double dividend_yield_;
    Timestamp valuation_time_;
};

inline double moneyness(const OptionContractSpec& spec, const MarketState& market) noexcept {
    return spec.strike() / market.spot_price();
}

// Observed market price for one contract together with the market snapshot it
// was observed in.
class OptionQuote {
public:
    OptionQuote(OptionContractSpec spec, MarketState market, double market_price,
                std::string contract_symbol = "")
        : spec_(std::move(spec)), market_(std::move(market)), market_price_(market_price),
          contract_symbol_(std::move(contract_symbol)) {
        detail::require_non_negative("market_price", market_price_);
    }

    const OptionContractSpec& spec() const noexcept { return spec_; }
    const MarketState& market() const noexcept { return market_; }
    double market_price() const noexcept { return market_price_; }
    const std::string& contract_symbol() const noexcept { return contract_symbol_; }

private:
    OptionContractSpec spec_;
    MarketState market_;
    double market_price_;
    std::string contract_symbol_;
};

}
