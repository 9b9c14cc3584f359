#include "shoe.hpp"
#include "errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace bj {

Shoe::Shoe(int num_decks, Rng& rng, HiLoCounter& counter)
    : num_decks_(num_decks),
      rng_(&rng),
      counter_(&counter),
      reshuffles_(0)
{
    if (num_decks < MIN_DECKS || num_decks > MAX_DECKS) {
        throw std::invalid_argument("Shoe: num_decks must be in [1, 8], got " + std::to_string(num_decks));
    }
    cards_.reserve(capacity());
    reshuffle();
    reshuffles_ = 0;
}

void Shoe::reshuffle() {
    cards_.clear();
    for (int d = 0; d < num_decks_; ++d) {
        for (Card r = 0; r < NUM_RANKS; ++r) {
            cards_.insert(cards_.end(), CARDS_PER_RANK_PER_DECK, r);
        }
    }
    std::shuffle(cards_.begin(), cards_.end(), *rng_);
    counter_->reset();
    ++reshuffles_;
}

bool Shoe::reshuffle_if_needed(size_t threshold) {
    if (cards_.size() > threshold) return false;
    reshuffle();
    return true;
}

Card Shoe::draw() {
    if (cards_.empty()) {
        throw ShoeEmpty();
    }
    Card c = cards_.back();
    cards_.pop_back();
    counter_->observe(c);
    return c;
}

void Shoe::stack_top(const CardSet& cards) {
    if (cards.size() > cards_.size()) {
        throw std::invalid_argument("Shoe::stack_top: more cards requested than remain in the shoe");
    }
    // The top of the shoe is the back of the vector.
    for (size_t i = 0; i < cards.size(); ++i) {
        size_t target = cards_.size() - 1 - i;
        auto begin = cards_.begin();
        auto it = std::find(begin, begin + target + 1, cards[i]);
        if (it == begin + target + 1) {
            throw std::invalid_argument("Shoe::stack_top: no " + card_to_string(cards[i]) + " left to stack");
        }
        std::iter_swap(it, begin + target);
    }
}

std::array<int, NUM_RANKS> Shoe::rank_counts() const {
    std::array<int, NUM_RANKS> counts{};
    for (Card c : cards_) counts[c]++;
    return counts;
}

} // namespace bj
