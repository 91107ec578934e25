#pragma once

#include "Payoff.hpp"
#include <string>
#include <utility>
#include <variant>

namespace optionlab {

enum class ExerciseStyle {
    EUROPEAN,
    AMERICAN
};

struct OptionSpec {
    ExerciseStyle exercise_style;
    Payoff payoff;

    OptionSpec(ExerciseStyle style, Payoff p)
        : exercise_style(style), payoff(std::move(p)) {}

    static OptionSpec european(Payoff p) { return OptionSpec(ExerciseStyle::EUROPEAN, std::move(p)); }
    static OptionSpec american(Payoff p) { return OptionSpec(ExerciseStyle::AMERICAN, std::move(p)); }

    bool is_american() const noexcept { return exercise_style == ExerciseStyle::AMERICAN; }

    void validate() const {
        std::visit([](const auto& p) { p.validate(); }, payoff);
    }

    OptionSpec with_style(ExerciseStyle style) const { return OptionSpec(style, payoff); }

    std::string description() const {
        const char* kind = std::visit([](const auto& p) { return p.name(); }, payoff);
        return std::string(is_american() ? "american " : "european ") + kind;
    }
};

}
