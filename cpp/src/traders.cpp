#include "traders.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

#include "errors.hpp"
#include "log.hpp"

namespace {

int64_t clip(int64_t px, const MarketView& view) {
    return std::max(view.min_px, std::min(view.max_px, px));
}

// Own-side best shaded by `shave` ticks and capped by the limit; a stub quote at the
// system bound when the own side is empty.
int64_t shaved_price(const Assignment& job, const MarketView& view, int64_t shave) {
    if (job.side == Side::Bid) {
        if (!view.best_bid.has_value()) {
            return view.min_px;
        }
        return std::min(view.best_bid->px + shave, job.limit_px);
    }
    if (!view.best_ask.has_value()) {
        return view.max_px;
    }
    return std::max(view.best_ask->px - shave, job.limit_px);
}

}  // namespace

const char* trader_code(TraderKind kind) {
    switch (kind) {
        case TraderKind::Giveaway: return "GVWY";
        case TraderKind::ZIC: return "ZIC";
        case TraderKind::Shaver: return "SHVR";
        case TraderKind::Sniper: return "SNPR";
        case TraderKind::ZIP: return "ZIP";
        case TraderKind::ImpactSensitive: return "IMPS";
        case TraderKind::ImpactSensitiveFiltered: return "IMPF";
    }
    return "?";
}

TraderKind parse_trader_kind(const std::string& code) {
    std::string t = code;
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (t == "GVWY") {
        return TraderKind::Giveaway;
    }
    if (t == "ZIC") {
        return TraderKind::ZIC;
    }
    if (t == "SHVR") {
        return TraderKind::Shaver;
    }
    if (t == "SNPR") {
        return TraderKind::Sniper;
    }
    if (t == "ZIP") {
        return TraderKind::ZIP;
    }
    if (t == "IMPS") {
        return TraderKind::ImpactSensitive;
    }
    if (t == "IMPF") {
        return TraderKind::ImpactSensitiveFiltered;
    }
    throw ConfigError("Unknown trader type: " + code);
}

Trader::Trader(std::string id, TraderKind kind) : id_(std::move(id)), kind_(kind) {}

void Trader::respond(const MarketView& /*view*/, const Trade* /*last_trade*/) {}

void Trader::assign(const Assignment& assignment) {
    if (assignment.qty <= 0 || assignment.limit_px <= 0) {
        throw ValidationError("assignment for " + id_ + " must have positive limit and qty");
    }
    assignment_ = assignment;
}

int64_t Trader::bookkeep(const Trade& trade) {
    if (!assignment_.has_value()) {
        LogLine(LogLevel::Warn, "Trader") << id_ << " filled on trade " << trade.id << " with no assignment";
        return 0;
    }

    int64_t profit = 0;
    if (trade.buyer == id_) {
        profit = (assignment_->limit_px - trade.px) * trade.qty;
    } else {
        profit = (trade.px - assignment_->limit_px) * trade.qty;
    }
    balance_ += profit;
    n_trades_ += 1;

    assignment_->qty -= trade.qty;
    if (assignment_->qty <= 0) {
        assignment_.reset();
    }
    return profit;
}

void Trader::on_rejected(const std::string& reason) {
    n_rejected_ += 1;
    LogLine(LogLevel::Info, "Trader") << id_ << " quote rejected: " << reason;
}

Quote Trader::quote_at(int64_t px) const {
    return Quote{assignment_->side, px, assignment_->qty};
}

GiveawayTrader::GiveawayTrader(std::string id) : Trader(std::move(id), TraderKind::Giveaway) {}

std::optional<Quote> GiveawayTrader::decide(const MarketView& /*view*/) {
    if (!assignment_.has_value()) {
        return std::nullopt;
    }
    return quote_at(assignment_->limit_px);
}

ZicTrader::ZicTrader(std::string id, uint32_t seed)
    : Trader(std::move(id), TraderKind::ZIC), rng_(seed) {}

std::optional<Quote> ZicTrader::decide(const MarketView& view) {
    if (!assignment_.has_value()) {
        return std::nullopt;
    }
    const int64_t limit = clip(assignment_->limit_px, view);
    int64_t px = limit;
    if (assignment_->side == Side::Bid) {
        std::uniform_int_distribution<int64_t> dist(view.min_px, limit);
        px = dist(rng_);
    } else {
        std::uniform_int_distribution<int64_t> dist(limit, view.max_px);
        px = dist(rng_);
    }
    return quote_at(px);
}

ShaverTrader::ShaverTrader(std::string id) : Trader(std::move(id), TraderKind::Shaver) {}

std::optional<Quote> ShaverTrader::decide(const MarketView& view) {
    if (!assignment_.has_value()) {
        return std::nullopt;
    }
    return quote_at(clip(shaved_price(*assignment_, view, 1), view));
}

SniperTrader::SniperTrader(std::string id) : Trader(std::move(id), TraderKind::Sniper) {}

std::optional<Quote> SniperTrader::decide(const MarketView& view) {
    if (!assignment_.has_value() || view.countdown > lurk_threshold) {
        return std::nullopt;
    }
    const auto shave = static_cast<int64_t>(
        1.0 / (0.01 + view.countdown / (shave_growth_rate * lurk_threshold)));
    return quote_at(clip(shaved_price(*assignment_, view, shave), view));
}

ZipTrader::ZipTrader(std::string id, uint32_t seed)
    : Trader(std::move(id), TraderKind::ZIP), rng_(seed) {
    beta_ = 0.1 + 0.4 * uni01_(rng_);
    momentum_ = 0.1 * uni01_(rng_);
    margin_buy_ = -1.0 * (0.05 + 0.3 * uni01_(rng_));
    margin_sell_ = 0.05 + 0.3 * uni01_(rng_);
}

std::optional<Quote> ZipTrader::decide(const MarketView& view) {
    if (!assignment_.has_value()) {
        active_ = false;
        return std::nullopt;
    }
    active_ = true;
    limit_ = assignment_->limit_px;
    job_ = assignment_->side;
    const double margin = (*job_ == Side::Bid) ? margin_buy_ : margin_sell_;
    price_ = static_cast<int64_t>(static_cast<double>(*limit_) * (1.0 + margin));
    return quote_at(clip(*price_, view));
}

int64_t ZipTrader::target_up(int64_t price) {
    double ptrb_abs = ca_ * uni01_(rng_);
    double ptrb_rel = static_cast<double>(price) * (1.0 + cr_ * uni01_(rng_));
    return static_cast<int64_t>(std::llround(ptrb_rel + ptrb_abs));
}

int64_t ZipTrader::target_down(int64_t price) {
    double ptrb_abs = ca_ * uni01_(rng_);
    double ptrb_rel = static_cast<double>(price) * (1.0 - cr_ * uni01_(rng_));
    return static_cast<int64_t>(std::llround(ptrb_rel - ptrb_abs));
}

bool ZipTrader::willing_to_trade(int64_t price) const {
    if (!active_ || !price_.has_value()) {
        return false;
    }
    if (job_ == Side::Bid) {
        return *price_ >= price;
    }
    return *price_ <= price;
}

void ZipTrader::profit_alter(int64_t target) {
    const double price = static_cast<double>(*price_);
    const double limit = static_cast<double>(*limit_);
    double diff = static_cast<double>(target) - price;
    double change = (1.0 - momentum_) * (beta_ * diff) + momentum_ * prev_change_;
    prev_change_ = change;
    double new_margin = (price + change) / limit - 1.0;

    if (*job_ == Side::Bid) {
        if (new_margin < 0.0) {
            margin_buy_ = new_margin;
        }
    } else if (new_margin > 0.0) {
        margin_sell_ = new_margin;
    }

    const double margin = (*job_ == Side::Bid) ? margin_buy_ : margin_sell_;
    price_ = static_cast<int64_t>(std::llround(limit * (1.0 + margin)));
}

void ZipTrader::respond(const MarketView& view, const Trade* last_trade) {
    bool bid_improved = false;
    bool bid_hit = false;
    if (view.best_bid.has_value()) {
        const BookLevel& bid = *view.best_bid;
        if (!prev_best_bid_.has_value() || prev_best_bid_->px < bid.px) {
            bid_improved = true;
        } else if (last_trade != nullptr &&
                   (prev_best_bid_->px > bid.px ||
                    (prev_best_bid_->px == bid.px && prev_best_bid_->qty > bid.qty))) {
            bid_hit = true;
        }
    } else if (prev_best_bid_.has_value()) {
        bid_hit = true;
    }

    bool ask_improved = false;
    bool ask_lifted = false;
    if (view.best_ask.has_value()) {
        const BookLevel& ask = *view.best_ask;
        if (!prev_best_ask_.has_value() || prev_best_ask_->px > ask.px) {
            ask_improved = true;
        } else if (last_trade != nullptr &&
                   (prev_best_ask_->px < ask.px ||
                    (prev_best_ask_->px == ask.px && prev_best_ask_->qty > ask.qty))) {
            ask_lifted = true;
        }
    } else if (prev_best_ask_.has_value()) {
        ask_lifted = true;
    }

    const bool deal = (bid_hit || ask_lifted) && last_trade != nullptr;

    if (job_.has_value() && price_.has_value() && limit_.has_value()) {
        if (*job_ == Side::Ask) {
            if (deal) {
                const int64_t trade_px = last_trade->px;
                if (*price_ <= trade_px) {
                    profit_alter(target_up(trade_px));
                } else if (ask_lifted && active_ && !willing_to_trade(trade_px)) {
                    profit_alter(target_down(trade_px));
                }
            } else if (ask_improved && *price_ > view.best_ask->px) {
                if (view.best_bid.has_value()) {
                    profit_alter(target_up(view.best_bid->px));
                } else {
                    profit_alter(view.max_px);
                }
            }
        } else {
            if (deal) {
                const int64_t trade_px = last_trade->px;
                if (*price_ >= trade_px) {
                    profit_alter(target_down(trade_px));
                } else if (bid_hit && active_ && !willing_to_trade(trade_px)) {
                    profit_alter(target_up(trade_px));
                }
            } else if (bid_improved && *price_ < view.best_bid->px) {
                if (view.best_ask.has_value()) {
                    profit_alter(target_down(view.best_ask->px));
                } else {
                    profit_alter(view.min_px);
                }
            }
        }
    }

    prev_best_bid_ = view.best_bid;
    prev_best_ask_ = view.best_ask;
}

ImpactSensitiveTrader::ImpactSensitiveTrader(std::string id, bool filtered)
    : Trader(std::move(id), filtered ? TraderKind::ImpactSensitiveFiltered : TraderKind::ImpactSensitive),
      filtered_(filtered) {}

int64_t ImpactSensitiveTrader::base_price(const Assignment& job, const MarketView& view) {
    if (job.side == Side::Bid) {
        if (!view.best_bid.has_value()) {
            return job.limit_px;
        }
        return std::min(view.best_bid->px, job.limit_px);
    }
    if (!view.best_ask.has_value()) {
        return job.limit_px;
    }
    return std::max(view.best_ask->px, job.limit_px);
}

bool ImpactSensitiveTrader::signal_active(const ImbalanceSignal& signal) const {
    if (!signal.ready()) {
        return false;
    }
    const double mlofi = signal.latest();
    if (!is_imbalance_significant(mlofi, signal.config().mlofi_threshold)) {
        return false;
    }
    if (filtered_ && !signal.significant()) {
        return false;
    }
    // The windowed offset must point the same way as the latest flow.
    return signal.quote_offset() * mlofi > 0.0;
}

std::optional<Quote> ImpactSensitiveTrader::decide(const MarketView& view) {
    if (!assignment_.has_value()) {
        return std::nullopt;
    }

    const int64_t base = base_price(*assignment_, view);
    const ImbalanceSignal* signal = view.signal;
    if (signal == nullptr || !signal_active(*signal)) {
        return quote_at(clip(base, view));
    }

    const SignalConfig& cfg = signal->config();
    const double offset = signal->quote_offset();
    const double shaded = static_cast<double>(base) + cfg.blend * offset;
    if (!std::isfinite(shaded) || std::abs(shaded) > max_quote_magnitude) {
        throw StrategyComputationError(id_ + ": imbalance-adjusted price out of range (offset=" +
                                       std::to_string(offset) + ")");
    }

    const int64_t limit = assignment_->limit_px;
    int64_t px = static_cast<int64_t>(std::llround(shaded));
    if (assignment_->side == Side::Bid) {
        px = std::min(px, limit);
        if (view.countdown < cfg.cross_countdown && view.best_ask.has_value() && view.best_ask->px < limit) {
            px = view.best_ask->px;
        }
    } else {
        px = std::max(px, limit);
        if (view.countdown < cfg.cross_countdown && view.best_bid.has_value() && view.best_bid->px > limit) {
            px = view.best_bid->px;
        }
    }
    return quote_at(clip(px, view));
}

std::unique_ptr<Trader> make_trader(TraderKind kind, const std::string& id, uint32_t seed) {
    switch (kind) {
        case TraderKind::Giveaway:
            return std::make_unique<GiveawayTrader>(id);
        case TraderKind::ZIC:
            return std::make_unique<ZicTrader>(id, seed);
        case TraderKind::Shaver:
            return std::make_unique<ShaverTrader>(id);
        case TraderKind::Sniper:
            return std::make_unique<SniperTrader>(id);
        case TraderKind::ZIP:
            return std::make_unique<ZipTrader>(id, seed);
        case TraderKind::ImpactSensitive:
            return std::make_unique<ImpactSensitiveTrader>(id, false);
        case TraderKind::ImpactSensitiveFiltered:
            return std::make_unique<ImpactSensitiveTrader>(id, true);
    }
    throw ConfigError("Unhandled trader kind");
}
