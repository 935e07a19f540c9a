#include "session.hpp"

#include <cstdio>
#include <map>
#include <stdexcept>
#include <utility>

#include "errors.hpp"
#include "log.hpp"

namespace {

std::string trader_name(char prefix, int64_t n) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%c%02lld", prefix, static_cast<long long>(n));
    return buf;
}

const SessionConfig& validated(const SessionConfig& config) {
    config.validate();
    return config;
}

int64_t population_size(const std::vector<PopulationEntry>& entries) {
    int64_t n = 0;
    for (const auto& e : entries) {
        n += e.count;
    }
    return n;
}

}  // namespace

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Open: return "OPEN";
        case SessionState::Trading: return "TRADING";
        case SessionState::Closed: return "CLOSED";
    }
    return "?";
}

int64_t SessionConfig::n_buyers() const {
    return population_size(buyers);
}

int64_t SessionConfig::n_sellers() const {
    return population_size(sellers);
}

void SessionConfig::validate() const {
    if (n_ticks <= 0) {
        throw ConfigError("n_ticks must be positive");
    }
    if (min_price <= 0 || max_price <= min_price) {
        throw ConfigError("price bounds must satisfy 0 < min_price < max_price");
    }
    for (const auto* side : {&buyers, &sellers}) {
        for (const auto& e : *side) {
            if (e.count < 0) {
                throw ConfigError(std::string("negative trader count for ") + trader_code(e.kind));
            }
        }
    }
    if (n_buyers() < 1) {
        throw ConfigError("no buyers specified");
    }
    if (n_sellers() < 1) {
        throw ConfigError("no sellers specified");
    }
    signal.validate();
    schedule.validate(n_ticks);
}

MarketSession::MarketSession(const SessionConfig& config)
    : config_(validated(config)),
      rng_(static_cast<uint32_t>(config.seed)),
      engine_(book_),
      signal_(config_.signal) {
    std::vector<std::string> buyer_ids;
    std::vector<std::string> seller_ids;

    for (const auto& e : config_.buyers) {
        for (int64_t i = 0; i < e.count; ++i) {
            auto id = trader_name('B', static_cast<int64_t>(buyer_ids.size()));
            add_trader(make_trader(e.kind, id, static_cast<uint32_t>(rng_())));
            buyer_ids.push_back(id);
        }
    }
    for (const auto& e : config_.sellers) {
        for (int64_t i = 0; i < e.count; ++i) {
            auto id = trader_name('S', static_cast<int64_t>(seller_ids.size()));
            add_trader(make_trader(e.kind, id, static_cast<uint32_t>(rng_())));
            seller_ids.push_back(id);
        }
    }

    flow_ = std::make_unique<CustomerOrderFlow>(
        config_.schedule,
        std::move(buyer_ids),
        std::move(seller_ids),
        config_.min_price,
        config_.max_price,
        static_cast<int64_t>(rng_())
    );
}

Trader& MarketSession::add_trader(std::unique_ptr<Trader> trader) {
    if (state_ != SessionState::Open) {
        throw std::logic_error("traders can only be added before trading starts");
    }
    if (!trader) {
        throw std::invalid_argument("trader must not be null");
    }
    if (index_.count(trader->id()) != 0) {
        throw ConfigError("duplicate trader id " + trader->id());
    }
    index_[trader->id()] = traders_.size();
    traders_.push_back(std::move(trader));
    return *traders_.back();
}

Trader* MarketSession::find_trader(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return traders_[it->second].get();
}

Trader& MarketSession::trader(const std::string& id) {
    Trader* t = find_trader(id);
    if (t == nullptr) {
        throw NotFoundError("unknown trader " + id);
    }
    return *t;
}

std::optional<int64_t> MarketSession::live_order(const std::string& trader_id) const {
    auto it = live_orders_.find(trader_id);
    if (it == live_orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

LevelSnapshot MarketSession::snapshot() const {
    LevelSnapshot snap = book_.levels(config_.signal.depth);
    snap.ts = tick_;
    return snap;
}

MarketView MarketSession::view() const {
    MarketView v;
    v.ts = tick_;
    v.countdown = countdown_;
    v.min_px = config_.min_price;
    v.max_px = config_.max_price;
    v.best_bid = book_.best_bid();
    v.best_ask = book_.best_ask();
    v.mid = book_.mid();
    v.microprice = book_.microprice();
    v.snapshot = snapshot();
    v.signal = &signal_;
    return v;
}

void MarketSession::open() {
    if (state_ == SessionState::Trading) {
        return;
    }
    if (state_ == SessionState::Closed) {
        throw std::logic_error("session " + config_.session_id + " is closed");
    }
    state_ = SessionState::Trading;
    signal_.observe(snapshot());
    LogLine(LogLevel::Info, "MarketSession")
        << config_.session_id << " open: " << traders_.size() << " traders, " << config_.n_ticks << " ticks";
}

void MarketSession::close() {
    if (state_ == SessionState::Closed) {
        return;
    }
    state_ = SessionState::Closed;
    LogLine(LogLevel::Info, "MarketSession")
        << config_.session_id << " closed at t=" << tick_ << ": " << stats_.n_trades << " trades, "
        << stats_.n_quotes << " quotes, " << stats_.n_strategy_errors << " strategy errors";
}

void MarketSession::request_stop() {
    stop_requested_.store(true);
}

bool MarketSession::cancel_live(const std::string& trader_id) {
    auto it = live_orders_.find(trader_id);
    if (it == live_orders_.end()) {
        return false;
    }
    const int64_t oid = it->second;
    live_orders_.erase(it);
    if (engine_.cancel(oid)) {
        stats_.n_cancels += 1;
        return true;
    }
    return false;
}

void MarketSession::release_assignments() {
    for (const auto& a : flow_->step(tick_)) {
        Trader* t = find_trader(a.trader_id);
        if (t == nullptr) {
            LogLine(LogLevel::Warn, "MarketSession") << "assignment for unknown trader " << a.trader_id;
            continue;
        }
        // A new customer order replaces the job the live quote was working.
        cancel_live(t->id());
        t->assign(a);
        stats_.n_assignments += 1;
    }
}

void MarketSession::record_trade(const Trade& trade) {
    seq_ += 1;
    tape_.push_back(TapeEntry{
        TapeKind::Trade,
        config_.session_id,
        seq_,
        trade.ts,
        trade.aggressor,
        trade.px,
        trade.qty,
        trade.buyer,
        trade.seller,
        trade.buy_order_id,
        trade.sell_order_id,
    });
    stats_.n_trades += 1;
    stats_.traded_qty += trade.qty;

    for (const std::string* party : {&trade.buyer, &trade.seller}) {
        Trader* t = find_trader(*party);
        if (t == nullptr) {
            LogLine(LogLevel::Warn, "MarketSession") << "trade " << trade.id << " names unknown trader " << *party;
            continue;
        }
        t->bookkeep(trade);

        auto live = live_orders_.find(*party);
        if (live != live_orders_.end() && book_.find(live->second) == nullptr) {
            live_orders_.erase(live);
        }
    }
}

SubmitResult MarketSession::process_quote(Trader& trader, const Quote& quote) {
    cancel_live(trader.id());

    Order order{next_order_id_, quote.side, quote.px, quote.qty, tick_, trader.id()};
    next_order_id_ += 1;

    seq_ += 1;
    TapeEntry entry{TapeKind::Quote, config_.session_id, seq_, tick_, quote.side, quote.px, quote.qty, "", ""};
    if (quote.side == Side::Bid) {
        entry.buyer = trader.id();
        entry.buy_order_id = order.id;
    } else {
        entry.seller = trader.id();
        entry.sell_order_id = order.id;
    }
    tape_.push_back(std::move(entry));
    stats_.n_quotes += 1;

    SubmitResult result = engine_.submit(order);
    if (!result.accepted()) {
        stats_.n_rejected += 1;
        trader.on_rejected(result.reason);
        return result;
    }

    for (const auto& t : result.trades) {
        record_trade(t);
    }
    if (result.resting_id.has_value()) {
        live_orders_[trader.id()] = *result.resting_id;
    }
    return result;
}

SubmitResult MarketSession::submit(const std::string& trader_id, const Quote& quote) {
    if (state_ == SessionState::Closed) {
        SubmitResult closed;
        closed.status = SubmitStatus::SessionClosed;
        closed.reason = "session " + config_.session_id + " is closed";
        return closed;
    }
    SubmitResult result = process_quote(trader(trader_id), quote);
    const Trade* last = result.trades.empty() ? nullptr : &result.trades.back();
    observe_and_respond(last);
    return result;
}

void MarketSession::observe_and_respond(const Trade* last_trade) {
    signal_.observe(snapshot());
    const MarketView v = view();
    for (auto& t : traders_) {
        try {
            t->respond(v, last_trade);
        } catch (const StrategyComputationError& e) {
            stats_.n_strategy_errors += 1;
            LogLine(LogLevel::Warn, "MarketSession") << t->id() << " respond failed: " << e.what();
        } catch (const std::exception& e) {
            stats_.n_strategy_errors += 1;
            LogLine(LogLevel::Error, "MarketSession") << t->id() << " respond raised: " << e.what();
        }
    }
}

bool MarketSession::step() {
    if (state_ == SessionState::Open) {
        open();
    }
    if (state_ != SessionState::Trading) {
        return false;
    }

    countdown_ = static_cast<double>(config_.n_ticks - tick_) / static_cast<double>(config_.n_ticks);
    release_assignments();

    std::uniform_int_distribution<size_t> pick(0, traders_.size() - 1);
    Trader& actor = *traders_[pick(rng_)];

    std::optional<Quote> quote;
    try {
        quote = actor.decide(view());
    } catch (const StrategyComputationError& e) {
        stats_.n_strategy_errors += 1;
        LogLine(LogLevel::Warn, "MarketSession")
            << config_.session_id << " t=" << tick_ << " " << actor.id() << " skipped: " << e.what();
    } catch (const std::exception& e) {
        stats_.n_strategy_errors += 1;
        LogLine(LogLevel::Error, "MarketSession")
            << config_.session_id << " t=" << tick_ << " " << actor.id() << " raised: " << e.what();
    }

    if (quote.has_value()) {
        SubmitResult result = process_quote(actor, *quote);
        const Trade* last = result.trades.empty() ? nullptr : &result.trades.back();
        observe_and_respond(last);
    } else {
        stats_.n_idle += 1;
    }

    stats_.record_spread(book_);
    tick_ += 1;
    stats_.n_ticks += 1;

    if (tick_ >= config_.n_ticks || stop_requested_.load()) {
        close();
    }
    return state_ == SessionState::Trading;
}

void MarketSession::run() {
    if (state_ == SessionState::Open) {
        open();
    }
    while (step()) {
    }
}

std::vector<TapeEntry> MarketSession::trades() const {
    std::vector<TapeEntry> out;
    for (const auto& e : tape_) {
        if (e.kind == TapeKind::Trade) {
            out.push_back(e);
        }
    }
    return out;
}

std::vector<BalanceRecord> MarketSession::balances() const {
    std::map<std::string, BalanceRecord> by_type;
    for (const auto& t : traders_) {
        const std::string code = trader_code(t->kind());
        auto& rec = by_type[code];
        rec.session_id = config_.session_id;
        rec.trader_type = code;
        rec.n_traders += 1;
        rec.balance_sum += t->balance();
    }

    std::vector<BalanceRecord> out;
    out.reserve(by_type.size());
    for (auto& kv : by_type) {
        out.push_back(std::move(kv.second));
    }
    return out;
}
