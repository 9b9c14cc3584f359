#pragma once

namespace bj {
    constexpr int NUM_RANKS = 13;
    constexpr int CARDS_PER_RANK_PER_DECK = 4;
    constexpr int CARDS_PER_DECK = NUM_RANKS * CARDS_PER_RANK_PER_DECK;

    constexpr int MIN_DECKS = 1;
    constexpr int MAX_DECKS = 8;
    constexpr int MAX_ROUNDS = 100000;

    constexpr int BLACKJACK = 21;
    constexpr int DEALER_STAND_TOTAL = 17;

    // Dealer up-card columns of the strategy tables: 2..10, A
    constexpr int NUM_UPCARD_COLUMNS = 10;
}
