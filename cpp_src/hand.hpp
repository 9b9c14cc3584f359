#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "card.hpp"
#include "hand_evaluator.hpp"

namespace bj {

    enum class Action : uint8_t { Hit, Stand, Double, Split };

    inline const char* action_to_string(Action a) {
        switch (a) {
            case Action::Hit: return "hit";
            case Action::Stand: return "stand";
            case Action::Double: return "double";
            case Action::Split: return "split";
        }
        return "stand";
    }

    class Hand {
    public:
        Hand() : wager_(0.0), split_derived_(false), doubled_(false), total_{0, false} {}

        explicit Hand(double wager, bool split_derived = false)
            : wager_(wager), split_derived_(split_derived), doubled_(false), total_{0, false} {}

        void add_card(Card c) {
            cards_.push_back(c);
            total_ = HandEvaluator::evaluate(cards_);
        }

        // Removes the second card of a pair; the caller seeds the new hand with it.
        Card split_off() {
            Card moved = cards_.back();
            cards_.pop_back();
            total_ = HandEvaluator::evaluate(cards_);
            split_derived_ = true;
            return moved;
        }

        void double_down() {
            wager_ *= 2.0;
            doubled_ = true;
        }

        void record(Action a) { actions_.push_back(a); }

        const CardSet& cards() const { return cards_; }
        const std::vector<Action>& actions() const { return actions_; }
        size_t size() const { return cards_.size(); }
        double wager() const { return wager_; }
        bool split_derived() const { return split_derived_; }
        bool doubled() const { return doubled_; }

        int value() const { return total_.value; }
        bool is_soft() const { return total_.is_soft; }
        HandTotal total() const { return total_; }

        bool is_blackjack() const {
            return cards_.size() == 2 && !split_derived_ && total_.value == BLACKJACK;
        }
        bool is_bust() const { return total_.value > BLACKJACK; }
        bool is_pair() const { return HandEvaluator::is_pair(cards_); }

        std::vector<std::string> action_strings() const {
            std::vector<std::string> out;
            out.reserve(actions_.size());
            for (Action a : actions_) out.push_back(action_to_string(a));
            return out;
        }

    private:
        CardSet cards_;
        std::vector<Action> actions_;
        double wager_;
        bool split_derived_;
        bool doubled_;
        HandTotal total_;
    };
}
