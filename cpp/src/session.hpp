#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "book.hpp"
#include "flow.hpp"
#include "matching.hpp"
#include "mlofi.hpp"
#include "stats.hpp"
#include "traders.hpp"

enum class SessionState { Open, Trading, Closed };

const char* session_state_name(SessionState state);

struct PopulationEntry {
    TraderKind kind;
    int64_t count;
};

enum class TapeKind { Quote, Trade };

struct TapeEntry {
    TapeKind kind;
    std::string session_id;
    int64_t seq;
    int64_t ts;
    Side side;  // quote side, or aggressor side for trades
    int64_t px;
    int64_t qty;
    std::string buyer;
    std::string seller;
    int64_t buy_order_id = 0;
    int64_t sell_order_id = 0;
};

struct SessionConfig {
    std::string session_id = "day0001";
    int64_t n_ticks = 6000;
    int64_t seed = 0;
    int64_t min_price = 1;
    int64_t max_price = 1000;

    SignalConfig signal;
    std::vector<PopulationEntry> buyers;
    std::vector<PopulationEntry> sellers;
    OrderSchedule schedule;

    void validate() const;
    int64_t n_buyers() const;
    int64_t n_sellers() const;
};

// One trading day: owns its book, matching engine, imbalance signal, traders and tape.
// Strictly single-threaded; only request_stop() may be called from another thread.
class MarketSession {
public:
    explicit MarketSession(const SessionConfig& config);

    MarketSession(const MarketSession&) = delete;
    MarketSession& operator=(const MarketSession&) = delete;

    SessionState state() const { return state_; }
    void open();
    bool step();
    void run();
    void close();
    void request_stop();

    SubmitResult submit(const std::string& trader_id, const Quote& quote);
    bool cancel_live(const std::string& trader_id);
    std::optional<int64_t> live_order(const std::string& trader_id) const;

    Trader& add_trader(std::unique_ptr<Trader> trader);
    Trader& trader(const std::string& id);
    const std::vector<std::unique_ptr<Trader>>& traders() const { return traders_; }

    LevelSnapshot snapshot() const;
    MarketView view() const;

    const std::vector<TapeEntry>& tape() const { return tape_; }
    std::vector<TapeEntry> trades() const;
    std::vector<BalanceRecord> balances() const;

    const LimitOrderBook& book() const { return book_; }
    const ImbalanceSignal& signal() const { return signal_; }
    const SessionStats& stats() const { return stats_; }
    const SessionConfig& config() const { return config_; }
    int64_t tick() const { return tick_; }

private:
    Trader* find_trader(const std::string& id);
    void release_assignments();
    SubmitResult process_quote(Trader& trader, const Quote& quote);
    void record_trade(const Trade& trade);
    void observe_and_respond(const Trade* last_trade);

    SessionConfig config_;
    SessionState state_ = SessionState::Open;
    std::atomic<bool> stop_requested_{false};

    int64_t tick_ = 0;
    double countdown_ = 1.0;
    int64_t next_order_id_ = 1;
    int64_t seq_ = 0;
    std::mt19937 rng_;

    LimitOrderBook book_;
    MatchingEngine engine_;
    ImbalanceSignal signal_;

    std::vector<std::unique_ptr<Trader>> traders_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, int64_t> live_orders_;
    std::unique_ptr<CustomerOrderFlow> flow_;

    std::vector<TapeEntry> tape_;
    SessionStats stats_;
};
