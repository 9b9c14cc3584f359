#include "session_pool.hpp"
#include "session.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace bj {

SessionPool::SessionPool(size_t num_workers, LogSink log)
    : num_workers_(std::max<size_t>(1, num_workers)),
      log_(log ? std::move(log) : null_log_sink()),
      next_index_(0)
{
    stop_flag_.store(false);
    running_.store(false);
}

SessionPool::~SessionPool() {
    stop();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void SessionPool::stop() {
    stop_flag_.store(true);
}

std::vector<SimulationResult> SessionPool::run(const std::vector<SimulationConfig>& configs) {
    if (running_.exchange(true)) {
        throw std::logic_error("SessionPool::run called while another run is in progress");
    }
    struct RunningGuard {
        std::atomic<bool>* running;
        std::atomic<bool>* stop_flag;
        ~RunningGuard() {
            // A stop aimed at this run must not leak into the next one.
            stop_flag->store(false);
            running->store(false);
        }
    } guard{&running_, &stop_flag_};

    // Every config is checked before any worker starts.
    for (const auto& config : configs) {
        validate(config);
    }

    std::vector<SimulationResult> results(configs.size());
    std::vector<std::exception_ptr> errors(configs.size());
    next_index_.store(0);

    size_t workers = std::min(num_workers_, std::max<size_t>(1, configs.size()));
    {
        std::stringstream ss;
        ss << "session pool: " << configs.size() << " sessions on " << workers << " workers";
        log_(LogLevel::Info, ss.str());
    }

    for (size_t i = 0; i < workers; ++i) {
        threads_.emplace_back(&SessionPool::worker_loop, this, &configs, &results, &errors);
    }
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();

    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
    return results;
}

void SessionPool::worker_loop(const std::vector<SimulationConfig>* configs,
                              std::vector<SimulationResult>* results,
                              std::vector<std::exception_ptr>* errors) {
    while (!stop_flag_.load()) {
        size_t idx = next_index_.fetch_add(1);
        if (idx >= configs->size()) {
            return;
        }
        const SimulationConfig& config = (*configs)[idx];
        try {
            Session session(config, log_);
            SimulationResult& out = (*results)[idx];
            out.records = session.run(config.rounds, &stop_flag_);
            out.strategy = session.strategy_name();
            out.summary = session.summary();
        } catch (...) {
            (*errors)[idx] = std::current_exception();
        }
    }
}

} // namespace bj
