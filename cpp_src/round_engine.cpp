#include "round_engine.hpp"
#include "errors.hpp"

#include <sstream>
#include <string>

namespace bj {

RoundEngine::RoundEngine(const HouseRules& rules, Shoe& shoe, HiLoCounter& counter,
                         const Strategy& strategy, Rng& rng, const LogSink& log)
    : rules_(&rules),
      shoe_(&shoe),
      counter_(&counter),
      strategy_(&strategy),
      rng_(&rng),
      log_(&log)
{}

Card RoundEngine::draw(RoundResult& round) {
    try {
        return shoe_->draw();
    } catch (const ShoeEmpty&) {
        shoe_->reshuffle();
        round.mid_round_reshuffles++;
        std::stringstream ss;
        ss << "round " << round.round_id << ": shoe exhausted mid-round, reshuffled " << shoe_->remaining()
           << " cards and reset the count";
        (*log_)(LogLevel::Debug, ss.str());
        return shoe_->draw();
    }
}

void RoundEngine::deal_to(Hand& hand, RoundResult& round) {
    hand.add_card(draw(round));
}

RoundResult RoundEngine::play(int round_id, double wager) {
    RoundResult round;
    round.round_id = round_id;
    round.initial_wager = wager;

    Hand player(wager);
    Hand& dealer = round.dealer;
    deal_to(player, round);
    deal_to(dealer, round);
    deal_to(player, round);
    deal_to(dealer, round);

    if (player.is_blackjack() || dealer.is_blackjack()) {
        settle_naturals(player, round);
        return round;
    }

    std::vector<Hand> hands;
    hands.push_back(std::move(player));
    play_player_hands(hands, round.dealer_up(), round);

    bool any_live = false;
    for (const auto& h : hands) {
        if (!h.is_bust()) { any_live = true; break; }
    }
    if (any_live) {
        play_dealer(dealer, round);
        round.dealer_played = true;
    }

    for (size_t i = 0; i < hands.size(); ++i) {
        round.hands.push_back(settle(static_cast<int>(i) + 1, hands[i], dealer));
    }
    return round;
}

void RoundEngine::settle_naturals(const Hand& player, RoundResult& round) const {
    round.settled_on_deal = true;
    bool player_bj = player.is_blackjack();
    bool dealer_bj = round.dealer.is_blackjack();

    HandResult res{1, player, Outcome::Push, 0.0};
    if (player_bj && dealer_bj) {
        res.outcome = Outcome::Push;
        res.profit = 0.0;
    } else if (player_bj) {
        res.outcome = Outcome::Blackjack;
        res.profit = player.wager() * rules_->blackjack_payout;
    } else {
        res.outcome = Outcome::Lose;
        res.profit = -player.wager();
    }
    round.hands.push_back(res);
}

void RoundEngine::play_player_hands(std::vector<Hand>& hands, Card dealer_up, RoundResult& round) {
    size_t index = 0;
    while (index < hands.size()) {
        int decisions = 0;
        bool done = false;
        while (!done && !hands[index].is_bust()) {
            Hand& hand = hands[index];

            DecisionContext ctx;
            ctx.can_double = decisions == 0 && hand.size() == 2 && !hand.split_derived();
            ctx.can_split = decisions == 0 && hand.is_pair() &&
                            static_cast<int>(hands.size()) < rules_->max_split_hands;
            ctx.true_count = counter_->true_count(shoe_->decks_remaining());
            ctx.rng = rng_;

            Action proposed = strategy_->decide(hand, dealer_up, ctx);
            std::optional<IllegalAction> defect;
            Action action = resolve_action(proposed, hand, ctx, defect);
            if (defect) {
                std::stringstream ss;
                ss << "strategy '" << strategy_->name() << "' proposed illegal " << action_to_string(defect->proposed)
                   << " in round " << round.round_id << " (" << defect->reason << "), playing "
                   << action_to_string(defect->resolved);
                (*log_)(LogLevel::Warning, ss.str());
                round.defects.push_back(*defect);
            }

            switch (action) {
                case Action::Hit:
                    hand.record(Action::Hit);
                    deal_to(hand, round);
                    ++decisions;
                    break;
                case Action::Stand:
                    hand.record(Action::Stand);
                    done = true;
                    break;
                case Action::Double:
                    hand.double_down();
                    hand.record(Action::Double);
                    deal_to(hand, round);
                    done = true;
                    break;
                case Action::Split: {
                    Card moved = hand.split_off();
                    hand.record(Action::Split);
                    Hand second(hand.wager(), true);
                    second.record(Action::Split);
                    second.add_card(moved);
                    deal_to(hand, round);
                    deal_to(second, round);
                    // `hand` is invalidated by the insert; the loop re-reads hands[index].
                    hands.insert(hands.begin() + static_cast<long>(index) + 1, std::move(second));
                    decisions = 0;
                    break;
                }
            }
        }
        ++index;
    }
}

void RoundEngine::play_dealer(Hand& dealer, RoundResult& round) {
    while (true) {
        int total = dealer.value();
        if (total < DEALER_STAND_TOTAL) {
            deal_to(dealer, round);
            continue;
        }
        if (total == DEALER_STAND_TOTAL && dealer.is_soft() && rules_->dealer_hits_soft17) {
            deal_to(dealer, round);
            continue;
        }
        break;
    }
}

HandResult RoundEngine::settle(int hand_number, const Hand& hand, const Hand& dealer) const {
    HandResult res{hand_number, hand, Outcome::Push, 0.0};
    const double wager = hand.wager();
    if (hand.is_bust()) {
        res.outcome = Outcome::Bust;
        res.profit = -wager;
    } else if (dealer.is_bust() || hand.value() > dealer.value()) {
        res.outcome = Outcome::Win;
        res.profit = wager;
    } else if (hand.value() < dealer.value()) {
        res.outcome = Outcome::Lose;
        res.profit = -wager;
    }
    return res;
}

} // namespace bj
