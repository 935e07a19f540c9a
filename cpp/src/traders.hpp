#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "book.hpp"
#include "mlofi.hpp"

enum class TraderKind { Giveaway, ZIC, Shaver, Sniper, ZIP, ImpactSensitive, ImpactSensitiveFiltered };

const char* trader_code(TraderKind kind);
TraderKind parse_trader_kind(const std::string& code);

// Customer order: the job a trader works. One per trader; a new one replaces the old.
struct Assignment {
    std::string trader_id;
    Side side;
    int64_t limit_px;
    int64_t qty;
    int64_t issue_ts;
};

struct Quote {
    Side side;
    int64_t px;
    int64_t qty;
};

// What a trader may see of the market when it is asked to act.
struct MarketView {
    int64_t ts = 0;
    double countdown = 1.0;  // fraction of the session still to run
    int64_t min_px = 1;
    int64_t max_px = 1000;
    std::optional<BookLevel> best_bid;
    std::optional<BookLevel> best_ask;
    std::optional<double> mid;
    std::optional<double> microprice;
    LevelSnapshot snapshot;
    const ImbalanceSignal* signal = nullptr;
};

class Trader {
public:
    Trader(std::string id, TraderKind kind);
    virtual ~Trader() = default;

    Trader(const Trader&) = delete;
    Trader& operator=(const Trader&) = delete;

    virtual std::optional<Quote> decide(const MarketView& view) = 0;
    virtual void respond(const MarketView& view, const Trade* last_trade);

    void assign(const Assignment& assignment);
    bool has_assignment() const { return assignment_.has_value(); }
    const std::optional<Assignment>& assignment() const { return assignment_; }

    int64_t bookkeep(const Trade& trade);
    void on_rejected(const std::string& reason);

    const std::string& id() const { return id_; }
    TraderKind kind() const { return kind_; }
    int64_t balance() const { return balance_; }
    int64_t n_trades() const { return n_trades_; }
    int64_t n_rejected() const { return n_rejected_; }

protected:
    Quote quote_at(int64_t px) const;

    std::string id_;
    TraderKind kind_;
    int64_t balance_ = 0;
    int64_t n_trades_ = 0;
    int64_t n_rejected_ = 0;
    std::optional<Assignment> assignment_;
};

// Quotes the limit price: gives any available surplus away.
class GiveawayTrader : public Trader {
public:
    explicit GiveawayTrader(std::string id);
    std::optional<Quote> decide(const MarketView& view) override;
};

// Zero-intelligence constrained (Gode & Sunder 1993).
class ZicTrader : public Trader {
public:
    ZicTrader(std::string id, uint32_t seed);
    std::optional<Quote> decide(const MarketView& view) override;

private:
    std::mt19937 rng_;
};

class ShaverTrader : public Trader {
public:
    explicit ShaverTrader(std::string id);
    std::optional<Quote> decide(const MarketView& view) override;
};

// Lurks until countdown < lurk_threshold, then shaves by an amount that grows as time runs out.
class SniperTrader : public Trader {
public:
    explicit SniperTrader(std::string id);
    std::optional<Quote> decide(const MarketView& view) override;

    static constexpr double lurk_threshold = 0.2;
    static constexpr double shave_growth_rate = 3.0;
};

// Zero-intelligence plus (Cliff 1997): adaptive profit margin.
class ZipTrader : public Trader {
public:
    ZipTrader(std::string id, uint32_t seed);
    std::optional<Quote> decide(const MarketView& view) override;
    void respond(const MarketView& view, const Trade* last_trade) override;

    double margin_buy() const { return margin_buy_; }
    double margin_sell() const { return margin_sell_; }
    std::optional<int64_t> price() const { return price_; }

private:
    int64_t target_up(int64_t price);
    int64_t target_down(int64_t price);
    bool willing_to_trade(int64_t price) const;
    void profit_alter(int64_t target);

    std::mt19937 rng_;
    std::uniform_real_distribution<double> uni01_{0.0, 1.0};

    double beta_;
    double momentum_;
    double ca_ = 0.05;
    double cr_ = 0.05;
    double margin_buy_;
    double margin_sell_;
    double prev_change_ = 0.0;
    bool active_ = false;
    std::optional<Side> job_;
    std::optional<int64_t> price_;
    std::optional<int64_t> limit_;

    std::optional<BookLevel> prev_best_bid_;
    std::optional<BookLevel> prev_best_ask_;
};

// Shifts its base quote by blend * MLOFI offset while the latest MLOFI is significant: up
// under buy pressure, down under sell pressure. With `filtered`, the book's depth imbalance
// must also pass the significance filter. Late in the session an active shift crosses the
// spread when the touch is inside the limit.
class ImpactSensitiveTrader : public Trader {
public:
    ImpactSensitiveTrader(std::string id, bool filtered);
    std::optional<Quote> decide(const MarketView& view) override;

    bool filtered() const { return filtered_; }
    bool signal_active(const ImbalanceSignal& signal) const;

    static int64_t base_price(const Assignment& job, const MarketView& view);

    static constexpr double max_quote_magnitude = 1e15;

private:
    bool filtered_;
};

std::unique_ptr<Trader> make_trader(TraderKind kind, const std::string& id, uint32_t seed);
