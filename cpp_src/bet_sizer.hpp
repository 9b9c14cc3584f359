#pragma once
#include <algorithm>
#include <cmath>
#include <string>

#include "errors.hpp"

namespace bj {

    enum class BetMode { Fixed, HiLo };

    inline BetMode parse_bet_mode(const std::string& name) {
        if (name == "fixed") return BetMode::Fixed;
        if (name == "hi_lo" || name == "hi-lo") return BetMode::HiLo;
        throw InvalidConfiguration("unknown bet_mode '" + name + "' (expected fixed or hi_lo)");
    }

    inline const char* bet_mode_to_string(BetMode mode) {
        return mode == BetMode::Fixed ? "fixed" : "hi_lo";
    }

    // Spread: tc <= 0 -> 1 unit, tc 1 -> 2 units, tc 2 -> 3 units, ... capped at
    // max_multiplier units. prior_true_count is the count that stood when the
    // previous round settled.
    inline double next_bet(double base_bet, BetMode mode, double prior_true_count, int max_multiplier) {
        if (mode == BetMode::Fixed) return base_bet;
        if (!(prior_true_count > 0.0)) return base_bet;
        int cap = std::max(1, max_multiplier);
        double units = 1.0 + std::floor(prior_true_count);
        units = std::min(units, static_cast<double>(cap));
        return base_bet * units;
    }
}
