#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

namespace ivsurf {

// Malformed contract, market or model parameters. Raised at construction time
// so that invalid data never reaches the pricing math.
class InvalidInput : public std::invalid_argument {
public:
    InvalidInput(const std::string& field, const std::string& message)
        : std::invalid_argument(field + ": " + message), field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

private:
    std::string field_;
};

namespace detail {

inline void require_finite(const char* field, double value) {
    if (!std::isfinite(value)) {
        throw InvalidInput(field, "must be a finite number");
    }
}

inline void require_positive(const char* field, double value) {
    require_finite(field, value);
    if (value <= 0.0) {
        throw InvalidInput(field, "must be strictly positive, got " + std::to_string(value));
    }
}

inline void require_non_negative(const char* field, double value) {
    require_finite(field, value);
    if (value < 0.0) {
        throw InvalidInput(field, "must not be negative, got " + std::to_string(value));
    }
}

}

}
