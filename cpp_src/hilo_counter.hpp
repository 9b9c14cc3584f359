#pragma once
#include <algorithm>
#include <cmath>

#include "card.hpp"

namespace bj {

    class HiLoCounter {
    public:
        HiLoCounter() : running_(0), observed_(0) {}

        void observe(Card c) {
            running_ += hi_lo_value(c);
            ++observed_;
        }

        // Called on every reshuffle.
        void reset() {
            running_ = 0;
            observed_ = 0;
        }

        int running_count() const { return running_; }
        int observed() const { return observed_; }

        double true_count(double decks_remaining) const {
            double decks = std::max(1.0, std::floor(decks_remaining));
            return static_cast<double>(running_) / decks;
        }

    private:
        int running_;
        int observed_;
    };
}
