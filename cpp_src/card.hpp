#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

#include "constants.hpp"

namespace bj {

    // Suitless card: the rank index 0..12 for 2,3,...,10,J,Q,K,A.
    using Card = uint8_t;
    using CardSet = std::vector<Card>;

    constexpr Card INVALID_CARD = 255;
    constexpr Card RANK_TEN = 8;
    constexpr Card RANK_ACE = 12;

    inline bool is_ace(Card c) { return c == RANK_ACE; }

    // Blackjack value with aces counted high; normalization happens in the evaluator.
    inline int card_value(Card c) {
        if (c == RANK_ACE) return 11;
        if (c >= RANK_TEN) return 10;
        return static_cast<int>(c) + 2;
    }

    inline int hi_lo_value(Card c) {
        int v = card_value(c);
        if (v <= 6) return 1;
        if (v <= 9) return 0;
        return -1;
    }

    inline std::string card_to_string(Card c) {
        static const std::array<const char*, NUM_RANKS> RANKS = {
            "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K", "A"
        };
        if (c >= NUM_RANKS) return "??";
        return RANKS[c];
    }

    inline Card card_from_string(const std::string& s) {
        for (Card c = 0; c < NUM_RANKS; ++c) {
            if (card_to_string(c) == s) return c;
        }
        if (s == "T") return RANK_TEN;
        throw std::invalid_argument("unknown card rank: " + s);
    }

    inline std::vector<std::string> cards_to_strings(const CardSet& cards) {
        std::vector<std::string> out;
        out.reserve(cards.size());
        for (Card c : cards) out.push_back(card_to_string(c));
        return out;
    }
}
