#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace bj {

    struct HouseRules {
        bool dealer_hits_soft17 = false;      // S17
        double blackjack_payout = 1.5;        // 3:2
        double reshuffle_penetration = 0.25;  // reshuffle between rounds at <= 25% left
        int max_split_hands = 4;
        int max_bet_multiplier = 5;
    };

    struct SimulationConfig {
        int rounds = 10;
        int num_decks = 6;
        double base_bet = 10.0;
        std::string strategy = "basic";       // empty: pick one at random for the match
        std::optional<uint64_t> seed;
        std::string bet_mode = "fixed";
        std::string match_id;
        HouseRules rules;
    };

    // Throws InvalidConfiguration describing the first bad field.
    void validate(const SimulationConfig& config);
}
