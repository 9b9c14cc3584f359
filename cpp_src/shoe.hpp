#pragma once
#include <array>
#include <cstddef>
#include <vector>

#include "card.hpp"
#include "constants.hpp"
#include "hilo_counter.hpp"
#include "rng.hpp"

namespace bj {

    // Suitless multi-deck shoe. Every draw is reported to the counter and
    // every reshuffle resets it, so the count can never drift from the shoe.
    class Shoe {
    public:
        Shoe(int num_decks, Rng& rng, HiLoCounter& counter);

        Card draw();

        void reshuffle();
        bool reshuffle_if_needed(size_t threshold);

        // Reorders the undrawn cards so that `cards` come out first, in order.
        // The rank composition of the shoe is unchanged.
        void stack_top(const CardSet& cards);

        size_t remaining() const { return cards_.size(); }
        size_t capacity() const { return static_cast<size_t>(num_decks_) * CARDS_PER_DECK; }
        int num_decks() const { return num_decks_; }
        double decks_remaining() const { return static_cast<double>(cards_.size()) / CARDS_PER_DECK; }
        int reshuffle_count() const { return reshuffles_; }

        std::array<int, NUM_RANKS> rank_counts() const;

    private:
        int num_decks_;
        Rng* rng_;
        HiLoCounter* counter_;
        CardSet cards_;
        int reshuffles_;
    };
}
