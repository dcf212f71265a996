#include "ivsurf/AnalyticsEngine.hpp"
#include "ivsurf/BlackScholes.hpp"
#include "ivsurf/BinomialTree.hpp"
#include "ivsurf/ImpliedVolatility.hpp"
#include "ivsurf/VolatilitySurface.hpp"
#include "math/Statistics.hpp"
#include "utils/Logger.hpp"
#include "utils/Timer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <vector>

using namespace ivsurf;
using namespace ivsurf::utils;

namespace {

void print_greeks(const Greeks& greeks) {
    std::cout << "  Delta: " << greeks.delta << "\n";
    std::cout << "  Gamma: " << greeks.gamma << "\n";
    std::cout << "  Vega:  " << greeks.vega << "\n";
    std::cout << "  Theta: " << greeks.theta << "\n";
    std::cout << "  Rho:   " << greeks.rho << "\n";
}

// Smile with a put skew and a slight upward drift in expiry.
double skewed_vol(double strike, double spot, double expiry) {
    const double log_moneyness = std::log(strike / spot);
    return 0.22 - 0.10 * log_moneyness + 0.35 * log_moneyness * log_moneyness + 0.015 * expiry;
}

std::vector<OptionQuote> synthetic_chain(const MarketState& market) {
    std::vector<OptionQuote> quotes;
    for (double expiry : {0.083, 0.25, 0.5, 1.0}) {
        for (double strike = 80.0; strike <= 120.0; strike += 5.0) {
            const OptionType type = strike < market.spot_price() ? OptionType::PUT : OptionType::CALL;
            OptionContractSpec spec(type, ExerciseStyle::EUROPEAN, strike, expiry, "DEMO");
            const double price = BlackScholesPricer::price(spec, market, skewed_vol(strike, market.spot_price(), expiry));
            quotes.emplace_back(spec, market, price);
        }
    }
    return quotes;
}

}

void demonstrate_closed_form_pricing() {
    std::cout << "\n=== Black-Scholes-Merton Pricing Demo ===\n";

    OptionContractSpec call_option(OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0, 1.0, "DEMO");
    OptionContractSpec put_option(OptionType::PUT, ExerciseStyle::EUROPEAN, 100.0, 1.0, "DEMO");
    MarketState market(100.0, 0.05, 0.0);
    const double vol = 0.20;

    BlackScholesModel model;
    auto call_result = model.evaluate(call_option, market, vol);
    auto put_result = model.evaluate(put_option, market, vol);

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Call Option:\n";
    std::cout << "  Price: $" << call_result.option_price << "\n";
    print_greeks(call_result.greeks);
    std::cout << "  Computation Time: " << call_result.computation_time.count() << " ns\n";

    std::cout << "\nPut Option:\n";
    std::cout << "  Price: $" << put_result.option_price << "\n";
    print_greeks(put_result.greeks);
    std::cout << "  Computation Time: " << put_result.computation_time.count() << " ns\n";
}

void demonstrate_lattice_convergence() {
    std::cout << "\n=== CRR Lattice Convergence Demo ===\n";

    OptionContractSpec call_option(OptionType::CALL, ExerciseStyle::EUROPEAN, 100.0, 1.0);
    MarketState market(100.0, 0.05, 0.0);
    const double vol = 0.20;

    const auto points = BinomialTreeModel::convergence_study(
        call_option, market, vol, {25, 50, 100, 250, 500, 1000});

    std::cout << "Reference (closed form): $" << points.front().reference_price << "\n\n";
    std::cout << std::setw(8) << "Steps" << std::setw(14) << "Lattice"
              << std::setw(14) << "Error" << std::setw(14) << "Time (us)" << "\n";
    for (const auto& point : points) {
        std::cout << std::setw(8) << point.steps
                  << std::setw(14) << point.lattice_price
                  << std::setw(14) << point.error
                  << std::setw(14) << point.computation_time.count() * 1e-3 << "\n";
    }
}

void demonstrate_early_exercise() {
    std::cout << "\n=== American vs European Put Demo ===\n";

    OptionContractSpec american_put(OptionType::PUT, ExerciseStyle::AMERICAN, 100.0, 1.0);
    const auto european_put = american_put.with_exercise_style(ExerciseStyle::EUROPEAN);
    MarketState market(100.0, 0.05, 0.0);
    const double vol = 0.20;

    BinomialTreeModel lattice(500);
    std::cout << "Closed-form European Put: $" << BlackScholesPricer::price(european_put, market, vol) << "\n";
    std::cout << "Lattice European Put:     $" << lattice.price(european_put, market, vol) << "\n";
    std::cout << "Lattice American Put:     $" << lattice.price(american_put, market, vol) << "\n";
    std::cout << "Early Exercise Premium:   $" << lattice.early_exercise_premium(american_put, market, vol) << "\n";

    std::cout << "\nAmerican Put Greeks (finite differences on the lattice):\n";
    print_greeks(lattice.greeks(american_put, market, vol));
}

void demonstrate_implied_volatility() {
    std::cout << "\n=== Implied Volatility Demo ===\n";

    OptionContractSpec option(OptionType::CALL, ExerciseStyle::EUROPEAN, 105.0, 0.5, "DEMO");
    MarketState market(100.0, 0.05, 0.01);
    BlackScholesModel model;
    ImpliedVolatilitySolver solver;

    for (double market_price : {2.5, 4.0, 6.8, 0.5}) {
        const auto result = solver.solve(option, market, market_price, model);
        std::cout << "Market Price: $" << std::setw(8) << market_price
                  << "  IV: " << std::setw(10) << result.implied_volatility
                  << "  Iterations: " << std::setw(3) << result.iterations_used
                  << "  Method: " << to_string(result.method)
                  << "  Status: " << to_string(result.status) << "\n";
    }

    const auto below = solver.solve(option.with_time_to_expiry(0.25), market.with_spot(130.0), 20.0, model);
    std::cout << "Quote below intrinsic -> " << to_string(below.status) << "\n";
}

void demonstrate_chain_analytics() {
    std::cout << "\n=== Chain Analytics and Volatility Surface Demo ===\n";

    MarketState market(100.0, 0.045, 0.01);
    const auto quotes = synthetic_chain(market);

    AnalyticsEngine::Configuration config;
    config.parallel_threshold = 16;
    AnalyticsEngine engine(config);

    HighResolutionTimer timer;
    const auto records = engine.analyze_chain(quotes);
    const auto elapsed = timer.elapsed();

    std::vector<double> implied_vols;
    double worst_reprice = 0.0;
    for (const auto& record : records) {
        if (record.iv.converged) {
            implied_vols.push_back(record.iv.implied_volatility);
            worst_reprice = std::max(worst_reprice, std::abs(record.reprice_error));
        }
    }

    std::cout << "Analyzed " << records.size() << " quotes in " << elapsed.count() * 1e-6 << " ms\n";
    std::cout << "Converged: " << implied_vols.size() << ", worst repricing error: " << std::scientific
              << worst_reprice << std::fixed << "\n";
    std::cout << "Implied vol mean: " << math::FastStatistics<double>::mean(implied_vols) * 100.0
              << "%, dispersion: " << math::FastStatistics<double>::standard_deviation(implied_vols) * 100.0 << "%\n";

    VolatilitySurfaceBuilder builder;
    const auto observations = AnalyticsEngine::observations(records);

    for (double expiry : builder.expiries(observations)) {
        const auto smile = builder.build_smile(observations, expiry);
        std::cout << "\nSmile at T=" << std::setprecision(3) << expiry << std::setprecision(6) << ":\n";
        for (const auto& point : smile.points) {
            std::cout << "  K=" << std::setw(8) << std::setprecision(2) << point.x
                      << "  IV=" << std::setprecision(4) << point.implied_volatility * 100.0 << "%\n";
        }
        std::cout << std::setprecision(6);
    }

    const auto term = builder.build_term_structure(observations, 100.0);
    std::cout << "\nTerm Structure at K=100:\n";
    for (const auto& point : term.points) {
        std::cout << "  T=" << std::setw(6) << std::setprecision(3) << point.x
                  << "  IV=" << std::setprecision(4) << point.implied_volatility * 100.0 << "%\n";
    }

    const auto atm = builder.build_atm_term_structure(observations, 0.05);
    std::cout << "\nATM Term Structure (moneyness within 5%):\n";
    for (const auto& point : atm.points) {
        std::cout << "  T=" << std::setw(6) << std::setprecision(3) << point.x
                  << "  IV=" << std::setprecision(4) << point.implied_volatility * 100.0 << "%\n";
    }
    std::cout << std::setprecision(6);

    const auto metrics = engine.performance_metrics();
    std::cout << "\nSolves: " << metrics.total_options_priced
              << ", failed: " << metrics.failed_solves
              << ", average: " << metrics.avg_pricing_time.count() << " ns"
              << ", min: " << metrics.min_pricing_time.count() << " ns"
              << ", max: " << metrics.max_pricing_time.count() << " ns\n";
}

int main() {
    LoggerConfig log_config;
    log_config.min_level = LogLevel::INFO;
    Logger::instance().initialize(log_config);

    IVSURF_LOG_INFO("demo", "starting pricing and implied volatility demo");

    try {
        demonstrate_closed_form_pricing();
        demonstrate_lattice_convergence();
        demonstrate_early_exercise();
        demonstrate_implied_volatility();
        demonstrate_chain_analytics();
    } catch (const std::exception& e) {
        IVSURF_LOG_ERROR("demo", e.what());
        return 1;
    }

    std::cout << "\n=== Demo Complete ===\n";
    return 0;
}
