#pragma once

#include <cmath>

namespace ivsurf::math {

class NormalDistribution {
public:
    static constexpr double INV_SQRT_2_PI = 0.3989422804014326779;
    static constexpr double INV_SQRT_2 = 0.7071067811865475244;

    static double pdf(double x) noexcept {
        return INV_SQRT_2_PI * std::exp(-0.5 * x * x);
    }

    // erfc keeps full relative precision in the far left tail, where
    // 0.5 * (1 + erf) cancels to zero.
    static double cdf(double x) noexcept {
        return 0.5 * std::erfc(-x * INV_SQRT_2);
    }

    // Callers guarantee vol * sqrt(T) > 0.
    static double d1(double S, double K, double T, double r, double vol, double q = 0.0) noexcept {
        const double vol_sqrt_T = vol * std::sqrt(T);
        return (std::log(S / K) + (r - q + 0.5 * vol * vol) * T) / vol_sqrt_T;
    }

    static double d2(double S, double K, double T, double r, double vol, double q = 0.0) noexcept {
        return d1(S, K, T, r, vol, q) - vol * std::sqrt(T);
    }
};

}
