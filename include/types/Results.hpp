#pragma once

#include "Option.hpp"
#include "Market.hpp"
#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ivsurf {

// Raw sensitivities: per unit of spot, volatility and rate; theta per year.
struct Greeks {
    double delta = 0.0;     // dV/dS
    double gamma = 0.0;     // d2V/dS2
    double vega = 0.0;      // dV/dsigma
    double theta = 0.0;     // -dV/dT
    double rho = 0.0;       // dV/dr

    Greeks() = default;
    Greeks(double d, double g, double v, double t, double r = 0.0)
        : delta(d), gamma(g), vega(v), theta(t), rho(r) {}
};

struct PricingResult {
    double option_price = 0.0;
    Greeks greeks;
    bool has_greeks = false;
    bool greeks_exact = false;
    std::string model_name;
    std::chrono::nanoseconds computation_time{0};

    PricingResult() = default;

    explicit PricingResult(double price)
        : option_price(price) {}

    PricingResult(double price, const Greeks& g, bool exact)
        : option_price(price), greeks(g), has_greeks(true), greeks_exact(exact) {}
};

enum class SolverMethod {
    NONE,
    NEWTON_RAPHSON,
    BISECTION,
    INTRINSIC
};

enum class SolverStatus {
    CONVERGED,
    MAX_ITERATIONS,
    BELOW_INTRINSIC,
    ABOVE_MAXIMUM,
    INVALID_PRICE
};

inline const char* to_string(SolverMethod method) noexcept {
    switch (method) {
        case SolverMethod::NEWTON_RAPHSON: return "newton_raphson";
        case SolverMethod::BISECTION: return "bisection";
        case SolverMethod::INTRINSIC: return "intrinsic";
        default: return "none";
    }
}

inline const char* to_string(SolverStatus status) noexcept {
    switch (status) {
        case SolverStatus::CONVERGED: return "converged";
        case SolverStatus::MAX_ITERATIONS: return "max_iterations";
        case SolverStatus::BELOW_INTRINSIC: return "below_intrinsic";
        case SolverStatus::ABOVE_MAXIMUM: return "above_maximum";
        case SolverStatus::INVALID_PRICE: return "invalid_price";
    }
    return "unknown";
}

// Outcome of one implied-volatility solve. A non-converged result is still a
// valid value: `implied_volatility` is the best estimate found and `residual`
// its pricing error, model price minus market price.
struct ImpliedVolatilityResult {
    double implied_volatility = 0.0;
    std::size_t iterations_used = 0;
    bool converged = false;
    double residual = std::numeric_limits<double>::quiet_NaN();
    SolverMethod method = SolverMethod::NONE;
    SolverStatus status = SolverStatus::INVALID_PRICE;
};

struct IvObservation {
    OptionQuote quote;
    ImpliedVolatilityResult result;

    IvObservation(OptionQuote q, const ImpliedVolatilityResult& r)
        : quote(std::move(q)), result(r) {}
};

struct SurfacePoint {
    double x = 0.0;
    double implied_volatility = 0.0;
    bool converged = true;

    SurfacePoint() = default;
    SurfacePoint(double x_value, double iv, bool ok = true)
        : x(x_value), implied_volatility(iv), converged(ok) {}
};

enum class SeriesKind {
    SMILE,
    TERM_STRUCTURE
};

// Points ordered ascending by x: strike for a smile, expiry for a term structure.
struct SurfaceSeries {
    SeriesKind kind = SeriesKind::SMILE;
    double fixed_key = 0.0;
    bool includes_non_converged = false;
    std::vector<SurfacePoint> points;

    std::size_t size() const noexcept { return points.size(); }
    bool empty() const noexcept { return points.empty(); }

    std::vector<double> xs() const {
        std::vector<double> values;
        values.reserve(points.size());
        for (const auto& point : points) {
            values.push_back(point.x);
        }
        return values;
    }

    std::vector<double> ys() const {
        std::vector<double> values;
        values.reserve(points.size());
        for (const auto& point : points) {
            values.push_back(point.implied_volatility);
        }
        return values;
    }
};

struct ConvergencePoint {
    std::size_t steps = 0;
    double lattice_price = 0.0;
    double reference_price = 0.0;
    double error = 0.0;
    std::chrono::nanoseconds computation_time{0};
};

// Per-contract analytics row: implied vol, then Greeks and the repricing
// error at that vol when the solve converged.
struct AnalyticsRecord {
    OptionQuote quote;
    ImpliedVolatilityResult iv;
    std::optional<Greeks> greeks;
    double reprice_error = std::numeric_limits<double>::quiet_NaN();

    AnalyticsRecord(OptionQuote q, const ImpliedVolatilityResult& result)
        : quote(std::move(q)), iv(result) {}

    std::vector<std::pair<std::string, double>> to_row() const {
        constexpr double missing = std::numeric_limits<double>::quiet_NaN();
        const auto& spec = quote.spec();
        const auto& market = quote.market();
        return {
            {"S", market.spot_price()},
            {"K", spec.strike()},
            {"T", spec.time_to_expiry()},
            {"r", market.risk_free_rate()},
            {"q", market.dividend_yield()},
            {"is_call", spec.is_call() ? 1.0 : 0.0},
            {"market_price", quote.market_price()},
            {"calc_iv", iv.converged ? iv.implied_volatility : missing},
            {"iterations", static_cast<double>(iv.iterations_used)},
            {"residual", iv.residual},
            {"delta", greeks ? greeks->delta : missing},
            {"gamma", greeks ? greeks->gamma : missing},
            {"vega", greeks ? greeks->vega : missing},
            {"theta", greeks ? greeks->theta : missing},
            {"rho", greeks ? greeks->rho : missing},
            {"reprice_error", reprice_error},
        };
    }
};

struct PerformanceMetrics {
    std::chrono::nanoseconds total_time{0};
    std::chrono::nanoseconds avg_pricing_time{0};
    std::chrono::nanoseconds min_pricing_time{std::chrono::nanoseconds::max()};
    std::chrono::nanoseconds max_pricing_time{0};
    std::size_t total_options_priced = 0;
    std::size_t failed_solves = 0;

    void update(std::chrono::nanoseconds pricing_time) {
        total_time += pricing_time;
        ++total_options_priced;

        if (pricing_time < min_pricing_time) {
            min_pricing_time = pricing_time;
        }
        if (pricing_time > max_pricing_time) {
            max_pricing_time = pricing_time;
        }

        avg_pricing_time = total_time / total_options_priced;
    }

    void reset() {
        *this = PerformanceMetrics{};
    }
};

}
