#pragma once
#include "card.hpp"
#include "constants.hpp"

namespace bj {

    struct HandTotal {
        int value;
        bool is_soft;

        bool operator==(const HandTotal& other) const {
            return value == other.value && is_soft == other.is_soft;
        }
    };

    class HandEvaluator {
    public:
        // Aces start at 11 and are demoted to 1 one at a time while the sum busts.
        static HandTotal evaluate(const CardSet& cards) {
            int sum = 0;
            int high_aces = 0;
            for (Card c : cards) {
                sum += card_value(c);
                if (is_ace(c)) ++high_aces;
            }
            while (sum > BLACKJACK && high_aces > 0) {
                sum -= 10;
                --high_aces;
            }
            return {sum, high_aces > 0};
        }

        // Every ace counted as 1.
        static int hard_value(const CardSet& cards) {
            int sum = 0;
            for (Card c : cards) sum += is_ace(c) ? 1 : card_value(c);
            return sum;
        }

        // Pairs are by value, so 10-K splits like 10-10.
        static bool is_pair(const CardSet& cards) {
            return cards.size() == 2 && card_value(cards[0]) == card_value(cards[1]);
        }
    };
}
