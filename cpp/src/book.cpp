#include "book.hpp"

#include <algorithm>

#include "errors.hpp"
#include "log.hpp"

const char* side_name(Side side) {
    return side == Side::Bid ? "BID" : "ASK";
}

std::optional<std::string> order_error(const Order& order) {
    if (order.side != Side::Bid && order.side != Side::Ask) {
        return std::string("unknown side");
    }
    if (order.px <= 0) {
        return "price must be > 0, got " + std::to_string(order.px);
    }
    if (order.qty <= 0) {
        return "qty must be > 0, got " + std::to_string(order.qty);
    }
    return std::nullopt;
}

template <class Levels>
std::vector<BookLevel> LimitOrderBook::aggregate(const Levels& levels, int n) const {
    std::vector<BookLevel> out;
    if (n <= 0) {
        return out;
    }
    out.reserve(static_cast<size_t>(n));

    for (const auto& [px, queue] : levels) {
        int64_t total = 0;
        for (int64_t oid : queue) {
            auto it = orders_.find(oid);
            if (it != orders_.end()) {
                total += it->second.qty;
            }
        }
        out.push_back(BookLevel{px, total});
        if (static_cast<int>(out.size()) >= n) {
            break;
        }
    }
    return out;
}

template <class Levels>
bool LimitOrderBook::erase_from(Levels& levels, const Order& order) {
    auto book_it = levels.find(order.px);
    if (book_it == levels.end()) {
        return false;
    }
    auto& queue = book_it->second;
    auto qit = std::find(queue.begin(), queue.end(), order.id);
    if (qit == queue.end()) {
        return false;
    }
    queue.erase(qit);
    if (queue.empty()) {
        levels.erase(book_it);
    }
    return true;
}

std::optional<BookLevel> LimitOrderBook::best_bid() const {
    if (bids_.empty()) {
        return std::nullopt;
    }
    return aggregate(bids_, 1).front();
}

std::optional<BookLevel> LimitOrderBook::best_ask() const {
    if (asks_.empty()) {
        return std::nullopt;
    }
    return aggregate(asks_, 1).front();
}

std::optional<double> LimitOrderBook::mid() const {
    if (bids_.empty() || asks_.empty()) {
        return std::nullopt;
    }
    return 0.5 * (static_cast<double>(bids_.begin()->first) + static_cast<double>(asks_.begin()->first));
}

std::optional<int64_t> LimitOrderBook::spread() const {
    if (bids_.empty() || asks_.empty()) {
        return std::nullopt;
    }
    return asks_.begin()->first - bids_.begin()->first;
}

std::optional<double> LimitOrderBook::microprice() const {
    auto bid = best_bid();
    auto ask = best_ask();
    if (!bid.has_value() || !ask.has_value()) {
        return std::nullopt;
    }
    double tot = static_cast<double>(bid->qty + ask->qty);
    return (static_cast<double>(bid->px) * static_cast<double>(ask->qty) +
            static_cast<double>(ask->px) * static_cast<double>(bid->qty)) / tot;
}

std::vector<BookLevel> LimitOrderBook::depth(Side side, int levels) const {
    if (side == Side::Bid) {
        return aggregate(bids_, levels);
    }
    return aggregate(asks_, levels);
}

LevelSnapshot LimitOrderBook::levels(int depth) const {
    if (depth <= 0) {
        throw ValidationError("depth must be > 0");
    }
    LevelSnapshot snap;
    snap.revision = revision_;
    snap.bids = aggregate(bids_, depth);
    snap.asks = aggregate(asks_, depth);
    return snap;
}

void LimitOrderBook::insert(const Order& order) {
    if (auto err = order_error(order)) {
        throw ValidationError("order " + std::to_string(order.id) + ": " + *err);
    }
    if (orders_.count(order.id) != 0) {
        throw ValidationError("duplicate order id " + std::to_string(order.id));
    }

    if (order.side == Side::Bid) {
        bids_[order.px].push_back(order.id);
        n_bids_ += 1;
    } else {
        asks_[order.px].push_back(order.id);
        n_asks_ += 1;
    }
    orders_[order.id] = order;
    revision_ += 1;
}

bool LimitOrderBook::cancel(int64_t order_id) {
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        LogLine(LogLevel::Debug, "OrderBook") << "cancel: order " << order_id << " not found";
        return false;
    }

    const Order order = it->second;
    bool removed = (order.side == Side::Bid) ? erase_from(bids_, order) : erase_from(asks_, order);
    if (!removed) {
        LogLine(LogLevel::Error, "OrderBook") << "cancel: order " << order_id << " missing from its level";
        return false;
    }

    // Only erase from orders_ after we successfully removed it from the book structure.
    orders_.erase(it);
    if (order.side == Side::Bid) {
        n_bids_ -= 1;
    } else {
        n_asks_ -= 1;
    }
    revision_ += 1;
    return true;
}

const Order* LimitOrderBook::front(Side side) const {
    if (side == Side::Bid) {
        if (bids_.empty()) {
            return nullptr;
        }
        return find(bids_.begin()->second.front());
    }
    if (asks_.empty()) {
        return nullptr;
    }
    return find(asks_.begin()->second.front());
}

int64_t LimitOrderBook::fill_front(Side side, int64_t qty) {
    const Order* head = front(side);
    if (head == nullptr || qty <= 0) {
        return 0;
    }

    const int64_t order_id = head->id;
    Order& resting = orders_.at(order_id);
    int64_t traded = std::min(qty, resting.qty);
    resting.qty -= traded;

    if (resting.qty == 0) {
        if (side == Side::Bid) {
            auto it = bids_.begin();
            it->second.pop_front();
            if (it->second.empty()) {
                bids_.erase(it);
            }
            n_bids_ -= 1;
        } else {
            auto it = asks_.begin();
            it->second.pop_front();
            if (it->second.empty()) {
                asks_.erase(it);
            }
            n_asks_ -= 1;
        }
        orders_.erase(order_id);
    }
    revision_ += 1;
    return traded;
}

const Order* LimitOrderBook::find(int64_t order_id) const {
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return nullptr;
    }
    return &it->second;
}

size_t LimitOrderBook::order_count() const {
    return orders_.size();
}

size_t LimitOrderBook::order_count(Side side) const {
    return side == Side::Bid ? n_bids_ : n_asks_;
}
