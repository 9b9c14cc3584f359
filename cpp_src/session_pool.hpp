#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

#include "config.hpp"
#include "log.hpp"
#include "simulator.hpp"

namespace bj {

// Runs independent sessions on worker threads. Each session owns its shoe,
// count and generator, so results match a sequential run config by config.
class SessionPool {
public:
    SessionPool(size_t num_workers, LogSink log = stdout_log_sink());
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    // Blocks until every session finished or stop() was called. Results are in
    // input order; a stopped session keeps the rounds it completed. One run at
    // a time: a second concurrent call throws std::logic_error.
    std::vector<SimulationResult> run(const std::vector<SimulationConfig>& configs);

    // Safe from any thread; sessions stop after their current round. A stop
    // issued while no run is in progress cancels the next one.
    void stop();

    bool running() const { return running_.load(); }

    size_t num_workers() const { return num_workers_; }

private:
    void worker_loop(const std::vector<SimulationConfig>* configs,
                     std::vector<SimulationResult>* results,
                     std::vector<std::exception_ptr>* errors);

    size_t num_workers_;
    LogSink log_;
    std::vector<std::thread> threads_;
    std::atomic<bool> stop_flag_;
    std::atomic<bool> running_;
    std::atomic<size_t> next_index_;
};

} // namespace bj
