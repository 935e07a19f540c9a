#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "session.hpp"
#include "stats.hpp"

// A batch of independent trading days sharing one population and schedule.
struct ExperimentConfig {
    std::string session_prefix = "day";
    int64_t n_days = 1;
    int64_t n_workers = 1;
    bool keep_quotes = false;
    SessionConfig session;

    void validate() const;
    std::string session_id(int64_t day) const;
    SessionConfig day_config(int64_t day) const;
};

struct SessionResult {
    std::string session_id;
    std::vector<TapeEntry> trades;
    std::vector<TapeEntry> quotes;
    std::vector<BalanceRecord> balances;
    SessionStats stats;
};

SessionResult run_session(const SessionConfig& config, bool keep_quotes = false);

// Results come back in day order regardless of n_workers.
std::vector<SessionResult> run_experiment(const ExperimentConfig& config);
