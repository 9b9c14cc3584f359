#include "session.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace bj {

std::shared_ptr<Rng> Session::claim_generator(std::shared_ptr<Rng> rng, const SimulationConfig& config) {
    validate(config);
    if (!rng) {
        throw GeneratorMisuse("session created without a generator");
    }
    if (config.seed && rng->seeded() && *config.seed != *rng->seed()) {
        throw GeneratorMisuse("configured seed " + std::to_string(*config.seed) +
                              " does not match the supplied generator's seed " + std::to_string(*rng->seed()));
    }
    rng->claim(config.match_id.empty() ? "<anonymous>" : config.match_id);
    return rng;
}

Session::Session(const SimulationConfig& config, LogSink log)
    : Session(config, std::make_shared<Rng>(config.seed), std::move(log)) {}

Session::Session(const SimulationConfig& config, std::shared_ptr<Rng> rng, LogSink log)
    : config_(config),
      log_(log ? std::move(log) : null_log_sink()),
      rng_(claim_generator(std::move(rng), config)),
      counter_(),
      strategy_name_(choose_strategy_name()),
      strategy_(make_strategy(strategy_name_)),
      bet_mode_(parse_bet_mode(config_.bet_mode)),
      shoe_(config_.num_decks, *rng_, counter_),
      next_round_id_(1)
{
    log_created();
}

Session::Session(const SimulationConfig& config, std::unique_ptr<Strategy> strategy, std::shared_ptr<Rng> rng,
                 LogSink log)
    : config_(config),
      log_(log ? std::move(log) : null_log_sink()),
      rng_(claim_generator(std::move(rng), config)),
      counter_(),
      strategy_name_(strategy ? strategy->name() : std::string()),
      strategy_(std::move(strategy)),
      bet_mode_(parse_bet_mode(config_.bet_mode)),
      shoe_(config_.num_decks, *rng_, counter_),
      next_round_id_(1)
{
    if (!strategy_) {
        throw std::invalid_argument("Session: strategy must not be null");
    }
    log_created();
}

void Session::log_created() {
    std::stringstream ss;
    ss << "session " << (config_.match_id.empty() ? "<anonymous>" : config_.match_id)
       << " created: strategy=" << strategy_name_ << " decks=" << config_.num_decks
       << " bet_mode=" << bet_mode_to_string(bet_mode_) << " seed=";
    if (rng_->seeded()) ss << *rng_->seed(); else ss << "none";
    log_(LogLevel::Info, ss.str());
}

std::string Session::choose_strategy_name() {
    if (!config_.strategy.empty()) return config_.strategy;
    const auto& names = strategy_names();
    return names[rng_->uniform_int(0, static_cast<int>(names.size()) - 1)];
}

double Session::next_wager() const {
    double tc = counter_.true_count(shoe_.decks_remaining());
    return next_bet(config_.base_bet, bet_mode_, tc, config_.rules.max_bet_multiplier);
}

void Session::reshuffle_between_rounds() {
    // Four cards are needed to deal; anything short of that is reshuffled too.
    size_t threshold = static_cast<size_t>(std::floor(config_.rules.reshuffle_penetration * shoe_.capacity()));
    threshold = std::max<size_t>(threshold, 4);
    if (shoe_.reshuffle_if_needed(threshold)) {
        summary_.reshuffles++;
        std::stringstream ss;
        ss << "match " << config_.match_id << " round " << next_round_id_ << ": reshuffled "
           << shoe_.remaining() << " cards, count reset";
        log_(LogLevel::Debug, ss.str());
    }
}

std::vector<HandRecord> Session::play_round() {
    reshuffle_between_rounds();

    // The bet is fixed from the count standing before the first card of the round.
    double bet_true_count = counter_.true_count(shoe_.decks_remaining());
    double wager = next_bet(config_.base_bet, bet_mode_, bet_true_count, config_.rules.max_bet_multiplier);

    RoundEngine engine(config_.rules, shoe_, counter_, *strategy_, *rng_, log_);
    last_round_ = engine.play(next_round_id_++, wager);

    size_t first = records_.size();
    record_round(last_round_, bet_true_count);
    return std::vector<HandRecord>(records_.begin() + static_cast<long>(first), records_.end());
}

std::vector<HandRecord> Session::run(int rounds, const std::atomic<bool>* stop_flag) {
    std::vector<HandRecord> out;
    for (int i = 0; i < rounds; ++i) {
        if (stop_flag && stop_flag->load()) break;
        std::vector<HandRecord> round_records = play_round();
        out.insert(out.end(), round_records.begin(), round_records.end());
    }
    return out;
}

void Session::record_round(const RoundResult& round, double bet_true_count) {
    const int running = counter_.running_count();
    const double true_count = counter_.true_count(shoe_.decks_remaining());
    const std::vector<std::string> dealer_cards = cards_to_strings(round.dealer.cards());

    summary_.rounds++;
    summary_.reshuffles += round.mid_round_reshuffles;
    summary_.illegal_actions += static_cast<int>(round.defects.size());

    for (const HandResult& hr : round.hands) {
        const Hand& hand = hr.hand;
        HandRecord rec;
        rec.match_id = config_.match_id;
        rec.round_id = round.round_id;
        rec.hand_number = hr.hand_number;
        rec.strategy = strategy_name_;
        rec.bet_mode = bet_mode_to_string(bet_mode_);
        rec.dealer_up_card = card_to_string(round.dealer_up());
        rec.dealer_cards = dealer_cards;
        rec.player_cards = cards_to_strings(hand.cards());
        rec.actions = hand.action_strings();
        rec.wager = hand.wager();
        rec.doubled = hand.doubled();
        rec.split = hand.split_derived();
        rec.outcome = outcome_to_string(hr.outcome);
        rec.result = result_indicator(hr.outcome);
        rec.profit = hr.profit;
        rec.blackjack = hand.is_blackjack();
        rec.busted = hand.is_bust();
        rec.player_total = hand.value();
        rec.dealer_total = round.dealer.value();
        rec.true_count_prev_round = bet_true_count;
        rec.running_count = running;
        rec.true_count = true_count;
        rec.cards_remaining = static_cast<int>(shoe_.remaining());
        rec.decks_remaining = shoe_.decks_remaining();
        records_.push_back(rec);

        summary_.hands++;
        summary_.total_wagered += hand.wager();
        summary_.net_profit += hr.profit;
        if (hand.doubled()) summary_.doubles++;
        if (hand.split_derived()) summary_.splits++;
        switch (hr.outcome) {
            case Outcome::Blackjack: summary_.blackjacks++; summary_.wins++; break;
            case Outcome::Win: summary_.wins++; break;
            case Outcome::Push: summary_.pushes++; break;
            case Outcome::Bust: summary_.busts++; summary_.losses++; break;
            case Outcome::Lose: summary_.losses++; break;
        }
    }
}

} // namespace bj
