#pragma once
#include <vector>

#include "config.hpp"
#include "hand.hpp"
#include "hilo_counter.hpp"
#include "log.hpp"
#include "rng.hpp"
#include "shoe.hpp"
#include "strategy.hpp"

namespace bj {

    enum class Outcome { Win, Lose, Push, Blackjack, Bust };

    inline const char* outcome_to_string(Outcome o) {
        switch (o) {
            case Outcome::Win: return "win";
            case Outcome::Lose: return "lose";
            case Outcome::Push: return "push";
            case Outcome::Blackjack: return "blackjack";
            case Outcome::Bust: return "bust";
        }
        return "lose";
    }

    // Collapses the outcome to the win/lose/push indicator.
    inline const char* result_indicator(Outcome o) {
        switch (o) {
            case Outcome::Win:
            case Outcome::Blackjack: return "win";
            case Outcome::Push: return "push";
            default: return "lose";
        }
    }

    struct HandResult {
        int hand_number;
        Hand hand;
        Outcome outcome;
        double profit;
    };

    struct RoundResult {
        int round_id = 0;
        double initial_wager = 0.0;
        Hand dealer;
        std::vector<HandResult> hands;
        bool settled_on_deal = false;
        bool dealer_played = false;
        int mid_round_reshuffles = 0;
        std::vector<IllegalAction> defects;

        Card dealer_up() const { return dealer.cards().empty() ? INVALID_CARD : dealer.cards()[0]; }
        double profit() const {
            double total = 0.0;
            for (const auto& h : hands) total += h.profit;
            return total;
        }
    };

    // Plays one round against a session's shoe. Holds no state between rounds.
    class RoundEngine {
    public:
        RoundEngine(const HouseRules& rules, Shoe& shoe, HiLoCounter& counter,
                    const Strategy& strategy, Rng& rng, const LogSink& log);

        RoundResult play(int round_id, double wager);

    private:
        Card draw(RoundResult& round);
        void deal_to(Hand& hand, RoundResult& round);

        void play_player_hands(std::vector<Hand>& hands, Card dealer_up, RoundResult& round);
        void play_dealer(Hand& dealer, RoundResult& round);
        HandResult settle(int hand_number, const Hand& hand, const Hand& dealer) const;
        void settle_naturals(const Hand& player, RoundResult& round) const;

        const HouseRules* rules_;
        Shoe* shoe_;
        HiLoCounter* counter_;
        const Strategy* strategy_;
        Rng* rng_;
        const LogSink* log_;
    };
}
