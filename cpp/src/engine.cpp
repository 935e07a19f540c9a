#include "engine.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <exception>
#include <mutex>
#include <thread>

#include "errors.hpp"
#include "log.hpp"

void ExperimentConfig::validate() const {
    if (n_days <= 0) {
        throw ConfigError("n_days must be positive");
    }
    if (n_workers <= 0) {
        throw ConfigError("n_workers must be positive");
    }
    session.validate();
}

std::string ExperimentConfig::session_id(int64_t day) const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld", static_cast<long long>(day + 1));
    return session_prefix + buf;
}

SessionConfig ExperimentConfig::day_config(int64_t day) const {
    SessionConfig c = session;
    c.session_id = session_id(day);
    c.seed = session.seed + day;
    return c;
}

SessionResult run_session(const SessionConfig& config, bool keep_quotes) {
    MarketSession session(config);
    session.run();

    SessionResult result;
    result.session_id = config.session_id;
    for (const auto& e : session.tape()) {
        if (e.kind == TapeKind::Trade) {
            result.trades.push_back(e);
        } else if (keep_quotes) {
            result.quotes.push_back(e);
        }
    }
    result.balances = session.balances();
    result.stats = session.stats();
    return result;
}

std::vector<SessionResult> run_experiment(const ExperimentConfig& config) {
    config.validate();

    const auto n_days = static_cast<size_t>(config.n_days);
    std::vector<SessionResult> results(n_days);

    if (config.n_workers == 1 || n_days == 1) {
        for (size_t d = 0; d < n_days; ++d) {
            results[d] = run_session(config.day_config(static_cast<int64_t>(d)), config.keep_quotes);
        }
        return results;
    }

    std::atomic<size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mu;

    auto worker = [&]() {
        for (size_t d = next.fetch_add(1); d < n_days; d = next.fetch_add(1)) {
            try {
                results[d] = run_session(config.day_config(static_cast<int64_t>(d)), config.keep_quotes);
            } catch (const std::exception& e) {
                LogLine(LogLevel::Error, "Experiment")
                    << config.session_id(static_cast<int64_t>(d)) << " failed: " << e.what();
                std::lock_guard<std::mutex> lock(failure_mu);
                if (!failure) {
                    failure = std::current_exception();
                }
                next.store(n_days);
            }
        }
    };

    const auto n_threads = std::min(static_cast<size_t>(config.n_workers), n_days);
    std::vector<std::thread> pool;
    pool.reserve(n_threads);
    for (size_t i = 0; i < n_threads; ++i) {
        pool.emplace_back(worker);
    }
    for (auto& t : pool) {
        t.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    return results;
}
