#pragma once

#include "../types/Errors.hpp"
#include "../types/Market.hpp"
#include "../types/Payoff.hpp"
#include "../types/PricePath.hpp"
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace optionlab {

// Everything a pricer may ask of a payoff. Pricers never switch on the
// concrete alternative, so a new kind only has to be added to types/Payoff.hpp.
namespace payoffs {

inline PayoffKind kind(const Payoff& payoff) noexcept {
    return std::visit([](const auto& p) { return p.kind; }, payoff);
}

inline std::string name(const Payoff& payoff) {
    return std::visit([](const auto& p) { return std::string(p.name()); }, payoff);
}

inline bool is_path_dependent(const Payoff& payoff) noexcept {
    return std::visit([](const auto& p) { return p.path_dependent; }, payoff);
}

inline Monotonicity monotonicity(const Payoff& payoff) noexcept {
    return std::visit([](const auto& p) { return p.monotonicity; }, payoff);
}

inline double reference_level(const Payoff& payoff) noexcept {
    return std::visit([](const auto& p) { return p.reference_level(); }, payoff);
}

// The lower edge of the paying range plays the strike for cash-or-nothing.
inline double strike(const Payoff& payoff) noexcept {
    return std::visit([](const auto& p) -> double {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, CashOrNothing>) {
            return p.lower;
        } else {
            return p.strike;
        }
    }, payoff);
}

inline std::optional<VanillaTerms> vanilla_terms(const Payoff& payoff) noexcept {
    return std::visit([](const auto& p) { return p.vanilla_terms(); }, payoff);
}

inline void validate(const Payoff& payoff) {
    std::visit([](const auto& p) { p.validate(); }, payoff);
}

inline double evaluate(const Payoff& payoff, const PricePath& path) {
    if (path.empty()) {
        throw InvalidParameter("path", "cannot evaluate a payoff on an empty path");
    }
    return std::visit([&path](const auto& p) { return p(path); }, payoff);
}

inline double evaluate_terminal(const Payoff& payoff, double terminal_price) {
    return std::visit([terminal_price](const auto& p) -> double {
        using P = std::decay_t<decltype(p)>;
        if constexpr (P::path_dependent) {
            throw InvalidParameter("payoff", std::string(p.name()) + " needs the full price path");
        } else {
            return p.terminal(terminal_price);
        }
    }, payoff);
}

inline double lower_boundary(const Payoff& payoff, const MarketParameters& market, double tau) {
    return std::visit([&market, tau](const auto& p) -> double {
        using P = std::decay_t<decltype(p)>;
        if constexpr (P::path_dependent) {
            throw InvalidParameter("payoff", std::string(p.name()) + " has no PDE boundary condition");
        } else {
            return p.lower_boundary(market, tau);
        }
    }, payoff);
}

inline double upper_boundary(const Payoff& payoff, const MarketParameters& market,
                             double s_max, double tau) {
    return std::visit([&market, s_max, tau](const auto& p) -> double {
        using P = std::decay_t<decltype(p)>;
        if constexpr (P::path_dependent) {
            throw InvalidParameter("payoff", std::string(p.name()) + " has no PDE boundary condition");
        } else {
            return p.upper_boundary(market, s_max, tau);
        }
    }, payoff);
}

}

}
