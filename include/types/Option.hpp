#pragma once

#include "Errors.hpp"
#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace ivsurf {

using Timestamp = std::chrono::system_clock::time_point;

enum class OptionType {
    CALL,
    PUT
};

enum class ExerciseStyle {
    EUROPEAN,
    AMERICAN
};

inline const char* to_string(OptionType type) noexcept {
    return type == OptionType::CALL ? "call" : "put";
}

inline const char* to_string(ExerciseStyle style) noexcept {
    return style == ExerciseStyle::EUROPEAN ? "european" : "american";
}

constexpr double DAYS_PER_YEAR = 365.25;

// ACT/365.25 year fraction between two instants, negative when `to` precedes `from`.
inline double year_fraction(Timestamp from, Timestamp to) noexcept {
    const auto seconds = std::chrono::duration_cast<std::chrono::duration<double>>(to - from).count();
    return seconds / (DAYS_PER_YEAR * 24.0 * 3600.0);
}

inline double intrinsic_value(OptionType type, double spot, double strike) noexcept {
    return type == OptionType::CALL ? std::max(spot - strike, 0.0) : std::max(strike - spot, 0.0);
}

class OptionContractSpec {
public:
    OptionContractSpec(OptionType type, ExerciseStyle style, double strike, double time_to_expiry,
                       std::string underlying_symbol = "")
        : type_(type), exercise_style_(style), strike_(strike), time_to_expiry_(time_to_expiry),
          underlying_symbol_(std::move(underlying_symbol)) {
        detail::require_positive("strike", strike_);
        detail::require_non_negative("time_to_expiry", time_to_expiry_);
    }

    // Listed contracts expire at the end of their expiration date, so the
    // whole expiration day counts towards the remaining life.
    static OptionContractSpec from_expiration(OptionType type, ExerciseStyle style, double strike,
                                              Timestamp valuation_time, Timestamp expiration_date,
                                              std::string underlying_symbol = "") {
        const double T = year_fraction(valuation_time, expiration_date + std::chrono::hours(24));
        if (T < 0.0) {
            throw InvalidInput("time_to_expiry", "contract expired before the valuation time");
        }
        return OptionContractSpec(type, style, strike, T, std::move(underlying_symbol));
    }

    OptionType type() const noexcept { return type_; }
    ExerciseStyle exercise_style() const noexcept { return exercise_style_; }
    double strike() const noexcept { return strike_; }
    double time_to_expiry() const noexcept { return time_to_expiry_; }
    const std::string& underlying_symbol() const noexcept { return underlying_symbol_; }

    bool is_call() const noexcept { return type_ == OptionType::CALL; }
    bool at_expiry() const noexcept { return time_to_expiry_ == 0.0; }

    OptionContractSpec with_time_to_expiry(double T) const {
        return OptionContractSpec(type_, exercise_style_, strike_, T, underlying_symbol_);
    }

    OptionContractSpec with_exercise_style(ExerciseStyle style) const {
        return OptionContractSpec(type_, style, strike_, time_to_expiry_, underlying_symbol_);
    }

    double intrinsic(double spot) const noexcept {
        return intrinsic_value(type_, spot, strike_);
    }

private:
    OptionType type_;
    ExerciseStyle exercise_style_;
    double strike_;
    double time_to_expiry_;
    std::string underlying_symbol_;
};

}
