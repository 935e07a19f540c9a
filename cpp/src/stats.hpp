// stats.hpp
#pragma once
#include <cstdint>
#include <cmath>
#include <string>

struct SessionStats{
    int64_t n_ticks = 0;
    int64_t n_quotes = 0;
    int64_t n_idle = 0;
    int64_t n_rejected = 0;
    int64_t n_strategy_errors = 0;
    int64_t n_cancels = 0;
    int64_t n_assignments = 0;
    int64_t n_trades = 0;
    int64_t traded_qty = 0;

    int64_t spread_samples = 0;
    int64_t spread_sum = 0;

    template <class Book>
    void record_spread(const Book& book){
        auto s = book.spread();
        if (s.has_value()){
            spread_sum += *s;
            spread_samples += 1;
        }
    }

    double avg_spread() const{
        if (spread_samples == 0){
            return std::nan("");
        }
        return static_cast<double>(spread_sum) / static_cast<double>(spread_samples);
    }
};

// Per trading day, per trader type aggregate profit.
struct BalanceRecord{
    std::string session_id;
    std::string trader_type;
    int64_t n_traders = 0;
    int64_t balance_sum = 0;

    double balance_avg() const{
        if (n_traders == 0){
            return 0.0;
        }
        return static_cast<double>(balance_sum) / static_cast<double>(n_traders);
    }
};
