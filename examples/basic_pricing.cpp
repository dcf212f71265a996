#include "ivsurf/BlackScholes.hpp"
#include "ivsurf/Greeks.hpp"
#include "ivsurf/ImpliedVolatility.hpp"
#include "utils/Timer.hpp"
#include <cmath>
#include <iostream>
#include <iomanip>

using namespace ivsurf;
using namespace ivsurf::utils;

int main() {
    std::cout << "=== Basic Options Pricing Example ===\n\n";

    // Define option contracts
    OptionContractSpec call_option(OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0, 0.25, "DEMO");
    OptionContractSpec put_option(OptionType::PUT, ExerciseStyle::EUROPEAN, 100.0, 0.25, "DEMO");

    // Market: S=$105, r=5%, q=2%; pricing volatility 20%
    MarketState market(105.0, 0.05, 0.02);
    const double volatility = 0.20;

    std::cout << "Market Data:\n";
    std::cout << "  Spot Price: $" << market.spot_price() << "\n";
    std::cout << "  Volatility: " << volatility * 100 << "%\n";
    std::cout << "  Risk-free Rate: " << market.risk_free_rate() * 100 << "%\n";
    std::cout << "  Dividend Yield: " << market.dividend_yield() * 100 << "%\n";
    std::cout << "  Strike Price: $" << call_option.strike() << "\n";
    std::cout << "  Time to Expiry: " << call_option.time_to_expiry() << " years\n\n";

    std::cout << std::fixed << std::setprecision(6);

    // Price call option
    std::cout << "=== Call Option Pricing ===\n";
    HighResolutionTimer call_timer;
    const double call_price = BlackScholesPricer::price(call_option, market, volatility);
    const Greeks call_greeks = BlackScholesPricer::greeks(call_option, market, volatility);
    auto call_time = call_timer.elapsed();

    std::cout << "Call Option Price: $" << call_price << "\n";
    std::cout << "Greeks:\n";
    std::cout << "  Delta: " << call_greeks.delta << "\n";
    std::cout << "  Gamma: " << call_greeks.gamma << "\n";
    std::cout << "  Vega:  " << call_greeks.vega << " (per unit vol)\n";
    std::cout << "  Theta: " << call_greeks.theta << " (per year)\n";
    std::cout << "  Rho:   " << call_greeks.rho << " (per unit rate)\n";
    std::cout << "Computation Time: " << call_time.count() << " nanoseconds\n\n";

    // Price put option
    std::cout << "=== Put Option Pricing ===\n";
    HighResolutionTimer::Duration put_time{0};
    double put_price = 0.0;
    Greeks put_greeks;
    {
        ScopedTimer timer(put_time);
        put_price = BlackScholesPricer::price(put_option, market, volatility);
        put_greeks = BlackScholesPricer::greeks(put_option, market, volatility);
    }

    std::cout << "Put Option Price: $" << put_price << "\n";
    std::cout << "Greeks:\n";
    std::cout << "  Delta: " << put_greeks.delta << "\n";
    std::cout << "  Gamma: " << put_greeks.gamma << "\n";
    std::cout << "  Vega:  " << put_greeks.vega << " (per unit vol)\n";
    std::cout << "  Theta: " << put_greeks.theta << " (per year)\n";
    std::cout << "  Rho:   " << put_greeks.rho << " (per unit rate)\n";
    std::cout << "Computation Time: " << put_time.count() << " nanoseconds\n\n";

    // Verify put-call parity
    const double T = call_option.time_to_expiry();
    const double forward = market.spot_price() * std::exp(-market.dividend_yield() * T);
    const double pv_strike = call_option.strike() * std::exp(-market.risk_free_rate() * T);
    const double put_call_parity = call_price - put_price - (forward - pv_strike);

    std::cout << "=== Put-Call Parity Verification ===\n";
    std::cout << "C - P - (F - PV(K)) = " << put_call_parity << "\n";
    std::cout << "Error: " << std::abs(put_call_parity) << "\n";
    std::cout << (std::abs(put_call_parity) < 1e-10 ? "PASSED" : "FAILED") << "\n\n";

    // Closed-form Greeks against bump-and-reprice
    std::cout << "=== Analytic vs Finite-Difference Greeks ===\n";
    const auto numerical = GreeksCalculator::calculate_numerical_greeks(
        call_option, market, volatility,
        [](const OptionContractSpec& opt, const MarketState& mkt, double vol) {
            return BlackScholesPricer::price(opt, mkt, vol);
        });
    std::cout << "  Delta: " << call_greeks.delta << " vs " << numerical.delta << "\n";
    std::cout << "  Gamma: " << call_greeks.gamma << " vs " << numerical.gamma << "\n";
    std::cout << "  Vega:  " << call_greeks.vega << " vs " << numerical.vega << "\n\n";

    // Implied volatility and repricing check
    std::cout << "=== Implied Volatility Calculation ===\n";
    const double market_price = call_price * 1.05; // 5% premium

    BlackScholesModel model;
    ImpliedVolatilitySolver iv_solver;
    const auto [iv_result, iv_time] = time_function([&] {
        return iv_solver.solve(call_option, market, market_price, model);
    });

    if (!iv_result.converged) {
        std::cout << "IV solver did not converge: " << to_string(iv_result.status) << "\n";
        return 1;
    }

    const double implied_vol = iv_result.implied_volatility;
    const double repriced = BlackScholesPricer::price(call_option, market, implied_vol);

    std::cout << "Market Price: $" << market_price << "\n";
    std::cout << "Theoretical Price: $" << call_price << "\n";
    std::cout << "Pricing Volatility: " << volatility * 100 << "%\n";
    std::cout << "Implied Volatility: " << implied_vol * 100 << "%\n";
    std::cout << "Volatility Difference: " << (implied_vol - volatility) * 1e4 << " bps\n";
    std::cout << "Solver: " << to_string(iv_result.method) << " in " << iv_result.iterations_used << " iterations\n";
    std::cout << "Repriced at IV: $" << repriced << " (error " << std::scientific
              << std::abs(repriced - market_price) << std::fixed << ")\n";
    std::cout << "IV Computation Time: " << iv_time.count() << " nanoseconds\n\n";

    // Sensitivity analysis
    std::cout << "=== Sensitivity Analysis ===\n";
    std::cout << "Price sensitivity to 1% spot move: $" << call_greeks.delta * market.spot_price() * 0.01 << "\n";
    std::cout << "Price sensitivity to 1 vol point: $" << call_greeks.vega * 0.01 << "\n";
    std::cout << "Price decay per day: $" << call_greeks.theta / DAYS_PER_YEAR << "\n";
    std::cout << "Gamma P&L for 1% spot move: $" <<
                 0.5 * call_greeks.gamma * std::pow(market.spot_price() * 0.01, 2) << "\n\n";

    // Performance summary
    std::cout << "=== Performance Summary ===\n";
    std::cout << "Call pricing: " << call_time.count() << " ns (" <<
                 call_time.count() / 1000.0 << " us)\n";
    std::cout << "Put pricing: " << put_time.count() << " ns (" <<
                 put_time.count() / 1000.0 << " us)\n";
    std::cout << "IV calculation: " << iv_time.count() << " ns (" <<
                 iv_time.count() / 1000.0 << " us)\n";
    std::cout << "Total execution: " << (call_time + put_time + iv_time).count() << " ns\n";

    return 0;
}
