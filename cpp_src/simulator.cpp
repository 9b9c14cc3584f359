#include "simulator.hpp"
#include "session.hpp"
#include "strategy.hpp"

namespace bj {

SimulationResult simulate_session(const SimulationConfig& config, const LogSink& log) {
    Session session(config, log);
    SimulationResult result;
    result.records = session.run(config.rounds);
    result.strategy = session.strategy_name();
    result.summary = session.summary();
    return result;
}

std::vector<HandRecord> simulate(const SimulationConfig& config, const LogSink& log) {
    return simulate_session(config, log).records;
}

std::vector<std::string> list_strategies() {
    return strategy_names();
}

} // namespace bj
