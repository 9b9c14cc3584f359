#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "cpp_src/config.hpp"
#include "cpp_src/errors.hpp"
#include "cpp_src/log.hpp"
#include "cpp_src/records.hpp"
#include "cpp_src/session_pool.hpp"
#include "cpp_src/simulator.hpp"

namespace py = pybind11;

// Python log target shared by every copy of a sink. The sink may be dropped on
// a worker thread, so the reference is released under the GIL.
struct PyLogTarget {
    explicit PyLogTarget(py::object t) : target(std::move(t)) {}
    ~PyLogTarget() {
        py::gil_scoped_acquire acquire;
        target = py::object();
    }
    PyLogTarget(const PyLogTarget&) = delete;
    PyLogTarget& operator=(const PyLogTarget&) = delete;

    py::object target;
};

// Forwards engine log lines to a Python queue (anything with put()) or callable.
// None keeps the default stdout sink.
bj::LogSink make_log_sink(py::object log_queue) {
    if (log_queue.is_none()) {
        return bj::stdout_log_sink();
    }
    auto queue = std::make_shared<PyLogTarget>(std::move(log_queue));
    return [queue](bj::LogLevel level, const std::string& msg) {
        py::gil_scoped_acquire acquire;
        std::string line = std::string("[") + bj::log_level_to_string(level) + "] " + msg;
        if (py::hasattr(queue->target, "put")) {
            queue->target.attr("put")(py::str(line));
        } else {
            queue->target(py::str(line));
        }
    };
}

py::dict record_to_dict(const bj::HandRecord& r) {
    py::dict d;
    d["match_id"] = r.match_id;
    d["round_id"] = r.round_id;
    d["hand_number"] = r.hand_number;
    d["strategy"] = r.strategy;
    d["bet_mode"] = r.bet_mode;
    d["dealer_up_card"] = r.dealer_up_card;
    d["dealer_cards"] = r.dealer_cards;
    d["player_cards"] = r.player_cards;
    d["actions"] = r.actions;
    d["wager"] = r.wager;
    d["doubled"] = r.doubled;
    d["split"] = r.split;
    d["outcome"] = r.outcome;
    d["result"] = r.result;
    d["profit"] = r.profit;
    d["blackjack"] = r.blackjack;
    d["busted"] = r.busted;
    d["player_total"] = r.player_total;
    d["dealer_total"] = r.dealer_total;
    d["true_count_prev_round"] = r.true_count_prev_round;
    d["running_count"] = r.running_count;
    d["true_count"] = r.true_count;
    d["cards_remaining"] = r.cards_remaining;
    d["decks_remaining"] = r.decks_remaining;
    return d;
}

py::dict summary_to_dict(const bj::SessionSummary& s) {
    py::dict d;
    d["rounds"] = s.rounds;
    d["hands"] = s.hands;
    d["wins"] = s.wins;
    d["losses"] = s.losses;
    d["pushes"] = s.pushes;
    d["blackjacks"] = s.blackjacks;
    d["busts"] = s.busts;
    d["doubles"] = s.doubles;
    d["splits"] = s.splits;
    d["reshuffles"] = s.reshuffles;
    d["illegal_actions"] = s.illegal_actions;
    d["total_wagered"] = s.total_wagered;
    d["net_profit"] = s.net_profit;
    return d;
}

bj::SimulationConfig make_config(int rounds, int num_decks, double base_bet, const std::string& strategy,
                                 std::optional<uint64_t> seed, const std::string& bet_mode,
                                 const std::string& match_id, bool dealer_hits_soft17,
                                 double blackjack_payout, int max_bet_multiplier) {
    bj::SimulationConfig config;
    config.rounds = rounds;
    config.num_decks = num_decks;
    config.base_bet = base_bet;
    config.strategy = strategy;
    config.seed = seed;
    config.bet_mode = bet_mode;
    config.match_id = match_id;
    config.rules.dealer_hits_soft17 = dealer_hits_soft17;
    config.rules.blackjack_payout = blackjack_payout;
    config.rules.max_bet_multiplier = max_bet_multiplier;
    return config;
}

class PySessionPool {
public:
    PySessionPool(size_t num_workers, py::object log_queue) {
        impl_ = std::make_unique<bj::SessionPool>(num_workers, make_log_sink(std::move(log_queue)));
    }

    ~PySessionPool() {
        py::gil_scoped_release release;
        impl_.reset();
    }

    std::vector<bj::SimulationResult> run(const std::vector<bj::SimulationConfig>& configs) {
        py::gil_scoped_release release;
        return impl_->run(configs);
    }

    void stop() {
        py::gil_scoped_release release;
        impl_->stop();
    }

private:
    std::unique_ptr<bj::SessionPool> impl_;
};


PYBIND11_MODULE(bj_engine, m) {
    m.doc() = "Blackjack round simulator with Hi-Lo counting and count-driven bet sizing";

    py::register_exception<bj::InvalidConfiguration>(m, "InvalidConfiguration", PyExc_ValueError);
    py::register_exception<bj::GeneratorMisuse>(m, "GeneratorMisuse", PyExc_RuntimeError);

    py::class_<bj::HouseRules>(m, "HouseRules")
        .def(py::init<>())
        .def_readwrite("dealer_hits_soft17", &bj::HouseRules::dealer_hits_soft17)
        .def_readwrite("blackjack_payout", &bj::HouseRules::blackjack_payout)
        .def_readwrite("reshuffle_penetration", &bj::HouseRules::reshuffle_penetration)
        .def_readwrite("max_split_hands", &bj::HouseRules::max_split_hands)
        .def_readwrite("max_bet_multiplier", &bj::HouseRules::max_bet_multiplier);

    py::class_<bj::SimulationConfig>(m, "SimulationConfig")
        .def(py::init<>())
        .def_readwrite("rounds", &bj::SimulationConfig::rounds)
        .def_readwrite("num_decks", &bj::SimulationConfig::num_decks)
        .def_readwrite("base_bet", &bj::SimulationConfig::base_bet)
        .def_readwrite("strategy", &bj::SimulationConfig::strategy)
        .def_readwrite("seed", &bj::SimulationConfig::seed)
        .def_readwrite("bet_mode", &bj::SimulationConfig::bet_mode)
        .def_readwrite("match_id", &bj::SimulationConfig::match_id)
        .def_readwrite("rules", &bj::SimulationConfig::rules);

    py::class_<bj::HandRecord>(m, "HandRecord")
        .def_readonly("match_id", &bj::HandRecord::match_id)
        .def_readonly("round_id", &bj::HandRecord::round_id)
        .def_readonly("hand_number", &bj::HandRecord::hand_number)
        .def_readonly("strategy", &bj::HandRecord::strategy)
        .def_readonly("bet_mode", &bj::HandRecord::bet_mode)
        .def_readonly("dealer_up_card", &bj::HandRecord::dealer_up_card)
        .def_readonly("dealer_cards", &bj::HandRecord::dealer_cards)
        .def_readonly("player_cards", &bj::HandRecord::player_cards)
        .def_readonly("actions", &bj::HandRecord::actions)
        .def_readonly("wager", &bj::HandRecord::wager)
        .def_readonly("doubled", &bj::HandRecord::doubled)
        .def_readonly("split", &bj::HandRecord::split)
        .def_readonly("outcome", &bj::HandRecord::outcome)
        .def_readonly("result", &bj::HandRecord::result)
        .def_readonly("profit", &bj::HandRecord::profit)
        .def_readonly("blackjack", &bj::HandRecord::blackjack)
        .def_readonly("busted", &bj::HandRecord::busted)
        .def_readonly("player_total", &bj::HandRecord::player_total)
        .def_readonly("dealer_total", &bj::HandRecord::dealer_total)
        .def_readonly("true_count_prev_round", &bj::HandRecord::true_count_prev_round)
        .def_readonly("running_count", &bj::HandRecord::running_count)
        .def_readonly("true_count", &bj::HandRecord::true_count)
        .def_readonly("cards_remaining", &bj::HandRecord::cards_remaining)
        .def_readonly("decks_remaining", &bj::HandRecord::decks_remaining)
        .def("to_dict", &record_to_dict)
        .def("__repr__", [](const bj::HandRecord& r) { return "<HandRecord " + r.to_string() + ">"; });

    py::class_<bj::SessionSummary>(m, "SessionSummary")
        .def_readonly("rounds", &bj::SessionSummary::rounds)
        .def_readonly("hands", &bj::SessionSummary::hands)
        .def_readonly("wins", &bj::SessionSummary::wins)
        .def_readonly("losses", &bj::SessionSummary::losses)
        .def_readonly("pushes", &bj::SessionSummary::pushes)
        .def_readonly("blackjacks", &bj::SessionSummary::blackjacks)
        .def_readonly("busts", &bj::SessionSummary::busts)
        .def_readonly("doubles", &bj::SessionSummary::doubles)
        .def_readonly("splits", &bj::SessionSummary::splits)
        .def_readonly("reshuffles", &bj::SessionSummary::reshuffles)
        .def_readonly("illegal_actions", &bj::SessionSummary::illegal_actions)
        .def_readonly("total_wagered", &bj::SessionSummary::total_wagered)
        .def_readonly("net_profit", &bj::SessionSummary::net_profit)
        .def("to_dict", &summary_to_dict);

    py::class_<bj::SimulationResult>(m, "SimulationResult")
        .def_readonly("strategy", &bj::SimulationResult::strategy)
        .def_readonly("records", &bj::SimulationResult::records)
        .def_readonly("summary", &bj::SimulationResult::summary);

    m.def("list_strategies", &bj::list_strategies, "Names of the registered strategies.");

    m.def("simulate", [](int rounds, int num_decks, double base_bet, const std::string& strategy,
                         std::optional<uint64_t> seed, const std::string& bet_mode, const std::string& match_id,
                         bool dealer_hits_soft17, double blackjack_payout, int max_bet_multiplier,
                         py::object log_queue) {
        bj::SimulationConfig config = make_config(rounds, num_decks, base_bet, strategy, seed, bet_mode, match_id,
                                                  dealer_hits_soft17, blackjack_payout, max_bet_multiplier);
        bj::LogSink sink = make_log_sink(std::move(log_queue));
        py::gil_scoped_release release;
        return bj::simulate(config, sink);
    },
        py::arg("rounds") = 10,
        py::arg("num_decks") = 6,
        py::arg("base_bet") = 10.0,
        py::arg("strategy") = "basic",
        py::arg("seed") = py::none(),
        py::arg("bet_mode") = "fixed",
        py::arg("match_id") = "",
        py::arg("dealer_hits_soft17") = false,
        py::arg("blackjack_payout") = 1.5,
        py::arg("max_bet_multiplier") = 5,
        py::arg("log_queue") = py::none(),
        "Simulates one fresh session and returns its hand records in deal order.");

    m.def("simulate_session", [](int rounds, int num_decks, double base_bet, const std::string& strategy,
                                 std::optional<uint64_t> seed, const std::string& bet_mode, const std::string& match_id,
                                 bool dealer_hits_soft17, double blackjack_payout, int max_bet_multiplier,
                                 py::object log_queue) {
        bj::SimulationConfig config = make_config(rounds, num_decks, base_bet, strategy, seed, bet_mode, match_id,
                                                  dealer_hits_soft17, blackjack_payout, max_bet_multiplier);
        bj::LogSink sink = make_log_sink(std::move(log_queue));
        py::gil_scoped_release release;
        return bj::simulate_session(config, sink);
    },
        py::arg("rounds") = 10,
        py::arg("num_decks") = 6,
        py::arg("base_bet") = 10.0,
        py::arg("strategy") = "basic",
        py::arg("seed") = py::none(),
        py::arg("bet_mode") = "fixed",
        py::arg("match_id") = "",
        py::arg("dealer_hits_soft17") = false,
        py::arg("blackjack_payout") = 1.5,
        py::arg("max_bet_multiplier") = 5,
        py::arg("log_queue") = py::none(),
        "Like simulate(), also returning the chosen strategy and the session summary.");

    py::class_<PySessionPool>(m, "SessionPool")
        .def(py::init<size_t, py::object>(),
             py::arg("num_workers"),
             py::arg("log_queue") = py::none())
        .def("run", &PySessionPool::run, py::arg("configs"))
        .def("stop", &PySessionPool::stop);

    m.def("simulate_batch", [](const std::vector<bj::SimulationConfig>& configs, size_t num_workers,
                               py::object log_queue) {
        bj::SessionPool pool(num_workers, make_log_sink(std::move(log_queue)));
        py::gil_scoped_release release;
        return pool.run(configs);
    },
        py::arg("configs"),
        py::arg("num_workers") = 4,
        py::arg("log_queue") = py::none(),
        "Runs independent sessions on C++ worker threads; results are in input order.");
}
