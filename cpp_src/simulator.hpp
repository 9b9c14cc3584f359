#pragma once
#include <string>
#include <vector>

#include "config.hpp"
#include "log.hpp"
#include "records.hpp"

namespace bj {

    struct SimulationResult {
        std::string strategy;
        std::vector<HandRecord> records;
        SessionSummary summary;
    };

    // One call simulates one fresh session. Throws InvalidConfiguration before
    // anything is dealt when the configuration is rejected.
    std::vector<HandRecord> simulate(const SimulationConfig& config, const LogSink& log = stdout_log_sink());

    SimulationResult simulate_session(const SimulationConfig& config, const LogSink& log = stdout_log_sink());

    std::vector<std::string> list_strategies();
}
