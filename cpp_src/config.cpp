#include "config.hpp"
#include "bet_sizer.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include "strategy.hpp"

#include <cmath>
#include <string>

namespace bj {

void validate(const SimulationConfig& config) {
    if (config.rounds < 1 || config.rounds > MAX_ROUNDS) {
        throw InvalidConfiguration("rounds must be in [1, " + std::to_string(MAX_ROUNDS) +
                                   "], got " + std::to_string(config.rounds));
    }
    if (config.num_decks < MIN_DECKS || config.num_decks > MAX_DECKS) {
        throw InvalidConfiguration("num_decks must be in [1, 8], got " + std::to_string(config.num_decks));
    }
    if (!std::isfinite(config.base_bet) || config.base_bet <= 0.0) {
        throw InvalidConfiguration("base_bet must be a positive amount");
    }
    if (!config.strategy.empty() && !is_known_strategy(config.strategy)) {
        throw InvalidConfiguration("unknown strategy '" + config.strategy + "'");
    }
    parse_bet_mode(config.bet_mode);

    const HouseRules& rules = config.rules;
    if (!std::isfinite(rules.blackjack_payout) || rules.blackjack_payout <= 0.0) {
        throw InvalidConfiguration("blackjack_payout must be positive");
    }
    if (!(rules.reshuffle_penetration >= 0.0 && rules.reshuffle_penetration < 1.0)) {
        throw InvalidConfiguration("reshuffle_penetration must be in [0, 1)");
    }
    if (rules.max_split_hands < 1) {
        throw InvalidConfiguration("max_split_hands must be at least 1");
    }
    if (rules.max_bet_multiplier < 1) {
        throw InvalidConfiguration("max_bet_multiplier must be at least 1");
    }
}

} // namespace bj
