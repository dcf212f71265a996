#pragma once

#include "../types/Option.hpp"
#include "BinomialTree.hpp"
#include "BlackScholes.hpp"
#include "PricingModel.hpp"
#include <memory>

namespace ivsurf {

enum class ModelChoice {
    AUTO,
    BLACK_SCHOLES,
    BINOMIAL
};

inline const char* to_string(ModelChoice choice) noexcept {
    switch (choice) {
        case ModelChoice::BLACK_SCHOLES: return "black_scholes";
        case ModelChoice::BINOMIAL: return "binomial";
        default: return "auto";
    }
}

// AUTO prices European contracts in closed form and American contracts on
// the lattice, where early exercise can be captured.
inline std::unique_ptr<PricingModel> make_model(ModelChoice choice, ExerciseStyle style,
                                                std::size_t binomial_steps = 500) {
    if (choice == ModelChoice::AUTO) {
        choice = style == ExerciseStyle::AMERICAN ? ModelChoice::BINOMIAL : ModelChoice::BLACK_SCHOLES;
    }

    if (choice == ModelChoice::BINOMIAL) {
        return std::make_unique<BinomialTreeModel>(binomial_steps);
    }
    return std::make_unique<BlackScholesModel>();
}

}
