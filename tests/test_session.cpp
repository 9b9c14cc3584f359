#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "bet_sizer.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "rng.hpp"
#include "session.hpp"
#include "simulator.hpp"
#include "strategy.hpp"
#include "test_helpers.hpp"

using namespace bj;
using bj::test_support::cards;
using bj::test_support::seeded_config;

namespace {

SimulationConfig regression_config() {
    SimulationConfig config;
    config.rounds = 5;
    config.num_decks = 6;
    config.base_bet = 10.0;
    config.strategy = "basic";
    config.seed = 42;
    config.bet_mode = "fixed";
    return config;
}

std::string serialize(const std::vector<HandRecord>& records) {
    std::string out;
    for (const auto& r : records) out += r.to_string() + "\n";
    return out;
}

} // namespace

// Golden hands for libstdc++ (GCC 12). std::shuffle and
// std::uniform_int_distribution are implementation-defined, so another
// standard library deals a different shoe from the same seed.
TEST(Simulate, RegressionFixtureMatchesGoldenHands) {
    struct Expected {
        int round_id;
        std::vector<std::string> dealer_cards;
        std::vector<std::string> player_cards;
        std::vector<std::string> actions;
        std::string outcome;
        double profit;
        int running_count;
    };
    const std::vector<Expected> expected = {
        {1, {"5", "Q", "7"}, {"3", "10"}, {"stand"}, "win", 10.0, 0},
        {2, {"Q", "5", "10"}, {"3", "4", "2", "9"}, {"hit", "hit", "stand"}, "win", 10.0, 2},
        {3, {"J", "J"}, {"4", "Q", "7"}, {"hit", "stand"}, "win", 10.0, 0},
        {4, {"3", "7", "9"}, {"3", "2", "3", "2", "7"}, {"hit", "hit", "hit", "stand"}, "lose", -10.0, 5},
        {5, {"K", "4", "10"}, {"8", "5", "3", "2"}, {"hit", "hit", "stand"}, "win", 10.0, 7},
    };

    const SimulationConfig config = regression_config();
    std::vector<HandRecord> records = simulate(config, null_log_sink());
    ASSERT_EQ(records.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        const HandRecord& r = records[i];
        const Expected& e = expected[i];
        EXPECT_EQ(r.round_id, e.round_id);
        EXPECT_EQ(r.hand_number, 1);
        EXPECT_EQ(r.strategy, "basic");
        EXPECT_EQ(r.dealer_up_card, e.dealer_cards.front());
        EXPECT_EQ(r.dealer_cards, e.dealer_cards) << "round " << e.round_id;
        EXPECT_EQ(r.player_cards, e.player_cards) << "round " << e.round_id;
        EXPECT_EQ(r.actions, e.actions) << "round " << e.round_id;
        EXPECT_EQ(r.outcome, e.outcome) << "round " << e.round_id;
        EXPECT_DOUBLE_EQ(r.profit, e.profit);
        EXPECT_DOUBLE_EQ(r.wager, 10.0);
        EXPECT_FALSE(r.doubled);
        EXPECT_FALSE(r.split);
        EXPECT_EQ(r.running_count, e.running_count) << "round " << e.round_id;
    }
    EXPECT_EQ(records.back().cards_remaining, 312 - 32);
    EXPECT_EQ(serialize(records), serialize(simulate(config, null_log_sink())));
}

TEST(Simulate, SameSeedSameRecordsForEveryStrategy) {
    for (const auto& name : list_strategies()) {
        SimulationConfig config = seeded_config(name, 1234);
        config.rounds = 300;
        config.bet_mode = "hi_lo";
        EXPECT_EQ(serialize(simulate(config, null_log_sink())), serialize(simulate(config, null_log_sink()))) << name;
    }
}

TEST(Simulate, DifferentSeedsDiverge) {
    SimulationConfig a = seeded_config("basic", 1);
    SimulationConfig b = seeded_config("basic", 2);
    a.rounds = b.rounds = 50;
    EXPECT_NE(serialize(simulate(a, null_log_sink())), serialize(simulate(b, null_log_sink())));
}

TEST(Simulate, RejectsInvalidConfigurationBeforeDealing) {
    auto expect_invalid = [](SimulationConfig config) {
        std::vector<HandRecord> records;
        EXPECT_THROW(records = simulate(config, null_log_sink()), InvalidConfiguration);
        EXPECT_TRUE(records.empty());
    };
    SimulationConfig config = regression_config();

    config.rounds = 0;
    expect_invalid(config);
    config = regression_config();
    config.num_decks = 0;
    expect_invalid(config);
    config.num_decks = 9;
    expect_invalid(config);
    config = regression_config();
    config.base_bet = 0.0;
    expect_invalid(config);
    config.base_bet = -5.0;
    expect_invalid(config);
    config = regression_config();
    config.strategy = "card_sharp";
    expect_invalid(config);
    config = regression_config();
    config.bet_mode = "martingale";
    expect_invalid(config);
    config = regression_config();
    config.rules.max_bet_multiplier = 0;
    expect_invalid(config);
}

TEST(Simulate, ListStrategies) {
    std::vector<std::string> names = list_strategies();
    EXPECT_EQ(names.size(), 6u);
    EXPECT_NE(std::find(names.begin(), names.end(), "basic"), names.end());
}

TEST(Simulate, UnseededSessionsRun) {
    SimulationConfig config = regression_config();
    config.seed.reset();
    config.rounds = 20;
    EXPECT_GE(simulate(config, null_log_sink()).size(), 20u);
}

TEST(Simulate, SummaryMatchesRecords) {
    SimulationConfig config = seeded_config("basic", 77);
    config.rounds = 2000;
    config.bet_mode = "hi_lo";
    SimulationResult result = simulate_session(config, null_log_sink());

    double profit = 0.0, wagered = 0.0;
    int wins = 0, losses = 0, pushes = 0;
    for (const auto& r : result.records) {
        profit += r.profit;
        wagered += r.wager;
        if (r.result == "win") wins++;
        else if (r.result == "lose") losses++;
        else pushes++;
    }
    EXPECT_EQ(result.summary.rounds, 2000);
    EXPECT_EQ(result.summary.hands, static_cast<int>(result.records.size()));
    EXPECT_NEAR(result.summary.net_profit, profit, 1e-6);
    EXPECT_NEAR(result.summary.total_wagered, wagered, 1e-6);
    EXPECT_EQ(result.summary.wins, wins);
    EXPECT_EQ(result.summary.losses, losses);
    EXPECT_EQ(result.summary.pushes, pushes);
    EXPECT_GT(result.summary.reshuffles, 0);
    EXPECT_EQ(result.summary.illegal_actions, 0);
}

TEST(Session, EmptyStrategyPicksOneForTheWholeMatch) {
    SimulationConfig config = seeded_config("", 31);
    config.rounds = 50;
    config.match_id = "m-31";
    Session session(config, null_log_sink());
    EXPECT_TRUE(is_known_strategy(session.strategy_name()));
    for (const auto& r : session.run(config.rounds)) {
        EXPECT_EQ(r.strategy, session.strategy_name());
        EXPECT_EQ(r.match_id, "m-31");
    }
    Session again(config, null_log_sink());
    EXPECT_EQ(again.strategy_name(), session.strategy_name());
}

TEST(Session, RandomStrategyNeverNeedsADowngrade) {
    SimulationConfig config = seeded_config("random", 5);
    Session session(config, null_log_sink());
    session.run(3000);
    EXPECT_EQ(session.summary().illegal_actions, 0);
    EXPECT_EQ(session.summary().rounds, 3000);
}

TEST(Session, StopFlagEndsAfterACompletedRound) {
    SimulationConfig config = seeded_config("basic", 8);
    Session session(config, null_log_sink());
    std::atomic<bool> stop(true);
    EXPECT_TRUE(session.run(100, &stop).empty());
    EXPECT_EQ(session.summary().rounds, 0);

    stop.store(false);
    auto records = session.run(3, &stop);
    EXPECT_EQ(session.summary().rounds, 3);
    EXPECT_EQ(records.front().round_id, 1);
    EXPECT_EQ(records.back().round_id, 3);
}

TEST(Session, RunningInChunksMatchesOneRun) {
    SimulationConfig config = seeded_config("random", 19);
    Session whole(config, null_log_sink());
    Session chunked(config, null_log_sink());
    auto all = whole.run(40);
    auto part = chunked.run(15);
    auto rest = chunked.run(25);
    part.insert(part.end(), rest.begin(), rest.end());
    EXPECT_EQ(serialize(all), serialize(part));
}

TEST(Session, HiLoWagerCappedWhenCountIsDrivenHigh) {
    SimulationConfig config = seeded_config("basic", 3, 1);
    config.bet_mode = "hi_lo";
    Session session(config, null_log_sink());

    // Pull every 2-6 out of a single deck: running count +20, one deck floor.
    session.shoe().stack_top(cards({"2", "2", "2", "2", "3", "3", "3", "3", "4", "4", "4", "4",
                                    "5", "5", "5", "5", "6", "6", "6", "6"}));
    for (int i = 0; i < 20; ++i) session.shoe().draw();
    ASSERT_EQ(session.counter().running_count(), 20);
    EXPECT_DOUBLE_EQ(session.next_wager(), 50.0);

    auto records = session.play_round();
    ASSERT_FALSE(records.empty());
    EXPECT_DOUBLE_EQ(records[0].true_count_prev_round, 20.0);
    EXPECT_DOUBLE_EQ(records[0].wager, records[0].doubled ? 100.0 : 50.0);
}

TEST(Session, HiLoWagersStayWithinBounds) {
    SimulationConfig config = seeded_config("basic", 12);
    config.bet_mode = "hi_lo";
    config.rules.max_bet_multiplier = 4;
    Session session(config, null_log_sink());
    bool raised = false;
    for (const auto& r : session.run(3000)) {
        double base_wager = r.doubled ? r.wager / 2.0 : r.wager;
        EXPECT_GE(base_wager, 10.0);
        EXPECT_LE(base_wager, 40.0);
        if (base_wager > 10.0) raised = true;
    }
    EXPECT_TRUE(raised);
}

TEST(Session, WagerUsesCountStandingBeforeTheRound) {
    SimulationConfig config = seeded_config("basic", 44);
    config.bet_mode = "hi_lo";
    Session session(config, null_log_sink());
    for (int i = 0; i < 200; ++i) {
        auto records = session.play_round();
        for (const auto& r : records) {
            double base_wager = r.doubled ? r.wager / 2.0 : r.wager;
            EXPECT_DOUBLE_EQ(base_wager, next_bet(10.0, BetMode::HiLo, r.true_count_prev_round, 5));
        }
    }
}

TEST(Generator, SeededGeneratorMustBeUntouched) {
    auto rng = std::make_shared<Rng>(42);
    (*rng)();
    SimulationConfig config = regression_config();
    EXPECT_THROW(Session(config, rng, null_log_sink()), GeneratorMisuse);
}

TEST(Generator, GeneratorCannotBeSharedBetweenSessions) {
    auto rng = std::make_shared<Rng>(42);
    SimulationConfig config = regression_config();
    Session first(config, rng, null_log_sink());
    EXPECT_THROW(Session(config, rng, null_log_sink()), GeneratorMisuse);
}

TEST(Generator, SeedMustMatchConfiguration) {
    auto rng = std::make_shared<Rng>(7);
    SimulationConfig config = regression_config();
    EXPECT_THROW(Session(config, rng, null_log_sink()), GeneratorMisuse);
}

TEST(Generator, SuppliedGeneratorReproducesConfiguredSeed) {
    SimulationConfig config = regression_config();
    Session own(config, null_log_sink());
    Session supplied(config, std::make_shared<Rng>(42), null_log_sink());
    EXPECT_EQ(serialize(own.run(5)), serialize(supplied.run(5)));
}

TEST(Generator, NullGeneratorRejected) {
    EXPECT_THROW(Session(regression_config(), std::shared_ptr<Rng>(), null_log_sink()), GeneratorMisuse);
}
