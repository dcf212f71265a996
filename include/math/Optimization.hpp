#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>

namespace ivsurf::math {

struct OptimizationResult {
    double value = 0.0;
    double function_value = std::numeric_limits<double>::quiet_NaN();
    std::size_t iterations = 0;
    bool converged = false;
};

struct BisectionParameters {
    double tolerance = 1e-10;
    double x_tolerance = 1e-12;
    std::size_t max_iterations = 100;
};

// Bisection on a bracket [lower, upper] where f changes sign. Stops when
// |f(mid)| < tolerance or the half-width drops below x_tolerance.
class BisectionSolver {
public:
    using Parameters = BisectionParameters;

    static OptimizationResult solve(
        const std::function<double(double)>& f,
        double lower_bound,
        double upper_bound,
        const Parameters& params = Parameters{}) {

        OptimizationResult result;

        double a = lower_bound;
        double b = upper_bound;
        double fa = f(a);
        const double fb = f(b);

        if (fa * fb > 0.0) {
            result.value = std::abs(fa) < std::abs(fb) ? a : b;
            result.function_value = std::abs(fa) < std::abs(fb) ? fa : fb;
            return result;
        }

        double best_value = a;
        double best_fx = fa;

        for (result.iterations = 1; result.iterations <= params.max_iterations; ++result.iterations) {
            const double c = 0.5 * (a + b);
            const double fc = f(c);

            if (std::abs(fc) < std::abs(best_fx)) {
                best_value = c;
                best_fx = fc;
            }

            if (std::abs(fc) < params.tolerance || 0.5 * (b - a) < params.x_tolerance) {
                result.value = c;
                result.function_value = fc;
                result.converged = true;
                return result;
            }

            if (fa * fc < 0.0) {
                b = c;
            } else {
                a = c;
                fa = fc;
            }
        }

        result.iterations = params.max_iterations;
        result.value = best_value;
        result.function_value = best_fx;
        return result;
    }
};

template<typename T>
class FiniteDifference {
public:
    static T forward_difference(const std::function<T(T)>& f, T x, T h) {
        return (f(x + h) - f(x)) / h;
    }

    static T central_difference(const std::function<T(T)>& f, T x, T h) {
        return (f(x + h) - f(x - h)) / (T{2} * h);
    }
};

}
