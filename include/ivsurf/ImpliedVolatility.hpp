#pragma once

#include "../types/Option.hpp"
#include "../types/Market.hpp"
#include "../types/Results.hpp"
#include "../math/Optimization.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ThreadPool.hpp"
#include "PricingModel.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <optional>
#include <vector>

namespace ivsurf {

struct SolverConfiguration {
    double initial_guess = 0.2;
    double price_tolerance = 1e-8;
    double volatility_tolerance = 1e-10;
    std::size_t max_iterations = 100;
    double min_volatility = 1e-6;
    double max_volatility = 5.0;
    double min_vega = 1e-10;
    double at_expiry_tolerance = 1e-8;
};

// Recovers the volatility that reproduces an observed price under any
// PricingModel. Newton-Raphson on f(vol) = model.price(vol) - market_price,
// switching to bisection on [lower, max_volatility] when vega vanishes or a
// Newton step leaves that range. The lower end is min_volatility or the
// model's own floor for the contract, whichever is larger. Numerical failure
// is reported through the result status, never thrown.
class ImpliedVolatilitySolver {
public:
    using Configuration = SolverConfiguration;

    ImpliedVolatilitySolver()
        : ImpliedVolatilitySolver(SolverConfiguration{}) {}

    explicit ImpliedVolatilitySolver(const SolverConfiguration& config)
        : config_(config) {
        detail::require_positive("min_volatility", config_.min_volatility);
        detail::require_positive("price_tolerance", config_.price_tolerance);
        detail::require_non_negative("volatility_tolerance", config_.volatility_tolerance);
        if (!(config_.max_volatility > config_.min_volatility)) {
            throw InvalidInput("max_volatility", "must exceed min_volatility");
        }
        if (config_.max_iterations == 0) {
            throw InvalidInput("max_iterations", "must be at least one");
        }
    }

    const SolverConfiguration& configuration() const noexcept {
        return config_;
    }

    ImpliedVolatilityResult solve(const OptionQuote& quote, const PricingModel& model) const {
        return solve(quote.spec(), quote.market(), quote.market_price(), model);
    }

    ImpliedVolatilityResult solve(
        const OptionContractSpec& option,
        const MarketState& market,
        double market_price,
        const PricingModel& model) const {

        ImpliedVolatilityResult result;

        if (!std::isfinite(market_price) || market_price < 0.0) {
            result.status = SolverStatus::INVALID_PRICE;
            return result;
        }

        if (option.at_expiry()) {
            return solve_at_expiry(option, market, market_price);
        }

        const double lower = std::max(config_.min_volatility, model.minimum_volatility(option, market));
        const double f_low = model.price(option, market, lower) - market_price;

        if (std::abs(f_low) < config_.price_tolerance) {
            return finish(result, lower, f_low, 0, SolverMethod::INTRINSIC, SolverStatus::CONVERGED);
        }
        if (f_low > 0.0) {
            IVSURF_LOG_DEBUG("iv_solver", "price " << market_price << " below achievable minimum "
                             << market_price + f_low << " for K=" << option.strike());
            return finish(result, lower, f_low, 0, SolverMethod::NONE, SolverStatus::BELOW_INTRINSIC);
        }
        if (!(lower < config_.max_volatility)) {
            IVSURF_LOG_DEBUG("iv_solver", "model floor " << lower << " leaves no volatility range for K="
                             << option.strike());
            return finish(result, lower, f_low, 0, SolverMethod::NONE, SolverStatus::ABOVE_MAXIMUM);
        }

        const double f_high = model.price(option, market, config_.max_volatility) - market_price;

        if (std::abs(f_high) < config_.price_tolerance) {
            return finish(result, config_.max_volatility, f_high, 0, SolverMethod::BISECTION, SolverStatus::CONVERGED);
        }
        if (f_high < 0.0) {
            IVSURF_LOG_DEBUG("iv_solver", "price " << market_price << " above achievable maximum "
                             << market_price + f_high << " for K=" << option.strike());
            return finish(result, config_.max_volatility, f_high, 0, SolverMethod::NONE, SolverStatus::ABOVE_MAXIMUM);
        }

        return solve_newton_raphson(option, market, market_price, model, lower);
    }

    std::vector<ImpliedVolatilityResult> solve_chain(
        const std::vector<OptionQuote>& quotes,
        const PricingModel& model,
        std::size_t num_threads = 1) const {

        return utils::ParallelExecutor::parallel_transform(
            quotes, [this, &model](const OptionQuote& quote) { return solve(quote, model); }, num_threads);
    }

    // Cancellable batch: once `cancel` is raised no further quote is solved;
    // slots for quotes that were never solved are left empty.
    std::vector<std::optional<ImpliedVolatilityResult>> solve_chain(
        const std::vector<OptionQuote>& quotes,
        const PricingModel& model,
        const std::atomic<bool>& cancel,
        std::size_t num_threads = 1) const {

        return utils::ParallelExecutor::parallel_transform_until(
            quotes, [this, &model](const OptionQuote& quote) { return solve(quote, model); }, &cancel, num_threads);
    }

private:
    SolverConfiguration config_;

    static ImpliedVolatilityResult& finish(
        ImpliedVolatilityResult& result,
        double vol,
        double residual,
        std::size_t iterations,
        SolverMethod method,
        SolverStatus status) {

        result.implied_volatility = vol;
        result.residual = residual;
        result.iterations_used = iterations;
        result.method = method;
        result.status = status;
        result.converged = status == SolverStatus::CONVERGED;
        return result;
    }

    // At expiry every volatility gives the intrinsic value, so the quote is
    // either consistent with it or unreachable.
    ImpliedVolatilityResult solve_at_expiry(
        const OptionContractSpec& option,
        const MarketState& market,
        double market_price) const {

        ImpliedVolatilityResult result;
        const double residual = option.intrinsic(market.spot_price()) - market_price;

        if (std::abs(residual) <= config_.at_expiry_tolerance) {
            return finish(result, config_.min_volatility, residual, 0, SolverMethod::INTRINSIC, SolverStatus::CONVERGED);
        }

        IVSURF_LOG_DEBUG("iv_solver", "expired contract K=" << option.strike() << " quoted "
                         << market_price << " away from intrinsic by " << -residual);

        if (residual < 0.0) {
            return finish(result, config_.max_volatility, residual, 0, SolverMethod::NONE, SolverStatus::ABOVE_MAXIMUM);
        }
        return finish(result, config_.min_volatility, residual, 0, SolverMethod::NONE, SolverStatus::BELOW_INTRINSIC);
    }

    ImpliedVolatilityResult solve_newton_raphson(
        const OptionContractSpec& option,
        const MarketState& market,
        double market_price,
        const PricingModel& model,
        double lower) const {

        ImpliedVolatilityResult result;

        double vol = std::clamp(config_.initial_guess, lower, config_.max_volatility);
        double best_vol = vol;
        double best_residual = std::numeric_limits<double>::infinity();
        std::size_t iterations = 0;

        while (iterations < config_.max_iterations) {
            const double price_diff = model.price(option, market, vol) - market_price;
            ++iterations;

            if (std::abs(price_diff) < std::abs(best_residual)) {
                best_vol = vol;
                best_residual = price_diff;
            }

            if (std::abs(price_diff) < config_.price_tolerance) {
                return finish(result, vol, price_diff, iterations, SolverMethod::NEWTON_RAPHSON, SolverStatus::CONVERGED);
            }

            const double vega = model.vega(option, market, vol);
            if (!(std::abs(vega) >= config_.min_vega)) {
                IVSURF_LOG_DEBUG("iv_solver", "vega " << vega << " vanished at vol " << vol
                                 << ", switching to bisection");
                return solve_bisection(option, market, market_price, model, lower, iterations, best_vol, best_residual);
            }

            const double new_vol = vol - price_diff / vega;
            if (!(new_vol > lower && new_vol < config_.max_volatility)) {
                IVSURF_LOG_DEBUG("iv_solver", "newton step to " << new_vol << " left the volatility range"
                                 << ", switching to bisection");
                return solve_bisection(option, market, market_price, model, lower, iterations, best_vol, best_residual);
            }

            if (std::abs(new_vol - vol) < config_.volatility_tolerance) {
                const double residual = model.price(option, market, new_vol) - market_price;
                return finish(result, new_vol, residual, iterations, SolverMethod::NEWTON_RAPHSON, SolverStatus::CONVERGED);
            }

            vol = new_vol;
        }

        IVSURF_LOG_DEBUG("iv_solver", "newton exhausted " << iterations << " iterations for K="
                         << option.strike() << ", residual " << best_residual);
        return finish(result, best_vol, best_residual, iterations, SolverMethod::NEWTON_RAPHSON,
                      SolverStatus::MAX_ITERATIONS);
    }

    // The range check in solve() guarantees f changes sign on the bracket.
    ImpliedVolatilityResult solve_bisection(
        const OptionContractSpec& option,
        const MarketState& market,
        double market_price,
        const PricingModel& model,
        double lower,
        std::size_t iterations_used,
        double best_vol,
        double best_residual) const {

        ImpliedVolatilityResult result;
        const std::size_t remaining = config_.max_iterations - iterations_used;

        if (remaining == 0) {
            return finish(result, best_vol, best_residual, iterations_used, SolverMethod::NEWTON_RAPHSON,
                          SolverStatus::MAX_ITERATIONS);
        }

        const auto objective = [&](double vol) {
            return model.price(option, market, vol) - market_price;
        };

        math::BisectionSolver::Parameters params;
        params.tolerance = config_.price_tolerance;
        params.x_tolerance = config_.volatility_tolerance;
        params.max_iterations = remaining;

        const auto bisection = math::BisectionSolver::solve(
            objective, lower, config_.max_volatility, params);

        const std::size_t total_iterations = iterations_used + bisection.iterations;

        if (bisection.converged) {
            return finish(result, bisection.value, bisection.function_value, total_iterations,
                          SolverMethod::BISECTION, SolverStatus::CONVERGED);
        }

        if (std::abs(bisection.function_value) < std::abs(best_residual)) {
            best_vol = bisection.value;
            best_residual = bisection.function_value;
        }

        IVSURF_LOG_DEBUG("iv_solver", "bisection exhausted the iteration budget for K=" << option.strike()
                         << ", residual " << best_residual);
        return finish(result, best_vol, best_residual, total_iterations, SolverMethod::BISECTION,
                      SolverStatus::MAX_ITERATIONS);
    }
};

}
