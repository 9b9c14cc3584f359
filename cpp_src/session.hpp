#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "bet_sizer.hpp"
#include "config.hpp"
#include "hilo_counter.hpp"
#include "log.hpp"
#include "records.hpp"
#include "rng.hpp"
#include "round_engine.hpp"
#include "shoe.hpp"
#include "strategy.hpp"

namespace bj {

    // A match: owns its generator, shoe, count, strategy and bankroll.
    // Rounds run strictly in order; sessions share nothing with each other.
    class Session {
    public:
        explicit Session(const SimulationConfig& config, LogSink log = stdout_log_sink());

        // Uses a caller-supplied generator. Throws GeneratorMisuse when it is
        // already owned by another session or is seeded and already advanced.
        Session(const SimulationConfig& config, std::shared_ptr<Rng> rng, LogSink log = stdout_log_sink());

        // Plays `strategy` instead of the one named in the configuration.
        Session(const SimulationConfig& config, std::unique_ptr<Strategy> strategy, std::shared_ptr<Rng> rng,
                LogSink log = stdout_log_sink());

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        // Plays up to `rounds` rounds, stopping early after any completed round
        // once *stop_flag is raised. Returns the records of the rounds played.
        std::vector<HandRecord> run(int rounds, const std::atomic<bool>* stop_flag = nullptr);

        std::vector<HandRecord> play_round();

        // Wager the next round would be dealt with.
        double next_wager() const;

        const std::string& strategy_name() const { return strategy_name_; }
        const std::string& match_id() const { return config_.match_id; }
        const SimulationConfig& config() const { return config_; }
        const SessionSummary& summary() const { return summary_; }
        const std::vector<HandRecord>& records() const { return records_; }
        const HiLoCounter& counter() const { return counter_; }
        const Shoe& shoe() const { return shoe_; }
        Shoe& shoe() { return shoe_; }
        const RoundResult& last_round() const { return last_round_; }

    private:
        static std::shared_ptr<Rng> claim_generator(std::shared_ptr<Rng> rng, const SimulationConfig& config);
        std::string choose_strategy_name();
        void log_created();
        void reshuffle_between_rounds();
        void record_round(const RoundResult& round, double bet_true_count);

        SimulationConfig config_;
        LogSink log_;
        std::shared_ptr<Rng> rng_;
        HiLoCounter counter_;
        std::string strategy_name_;
        std::unique_ptr<Strategy> strategy_;
        BetMode bet_mode_;
        Shoe shoe_;

        int next_round_id_;
        SessionSummary summary_;
        std::vector<HandRecord> records_;
        RoundResult last_round_;
    };
}
