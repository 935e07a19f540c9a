#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class Side { Bid, Ask };

inline Side opposite(Side side) {
    return side == Side::Bid ? Side::Ask : Side::Bid;
}

const char* side_name(Side side);

struct Order {
    int64_t id;
    Side side;
    int64_t px;
    int64_t qty;
    int64_t ts;
    std::string owner = "SIM";
};

struct BookLevel {
    int64_t px = 0;
    int64_t qty = 0;
};

inline bool operator==(const BookLevel& a, const BookLevel& b) {
    return a.px == b.px && a.qty == b.qty;
}

// Top-of-book aggregated levels, best first. Either side may be shorter than the
// requested depth.
struct LevelSnapshot {
    int64_t revision = 0;
    int64_t ts = 0;
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;
};

struct Trade {
    int64_t id;
    int64_t px;
    int64_t qty;
    int64_t buy_order_id;
    int64_t sell_order_id;
    std::string buyer;
    std::string seller;
    Side aggressor;
    int64_t ts;
};

// Returns a reason string when the order can never rest on a book.
std::optional<std::string> order_error(const Order& order);

class LimitOrderBook {
public:
    LimitOrderBook() = default;

    std::optional<BookLevel> best_bid() const;
    std::optional<BookLevel> best_ask() const;
    std::optional<double> mid() const;
    std::optional<int64_t> spread() const;
    std::optional<double> microprice() const;
    std::vector<BookLevel> depth(Side side, int levels = 5) const;
    LevelSnapshot levels(int depth) const;

    void insert(const Order& order);
    bool cancel(int64_t order_id);

    const Order* front(Side side) const;
    int64_t fill_front(Side side, int64_t qty);

    const Order* find(int64_t order_id) const;
    size_t order_count() const;
    size_t order_count(Side side) const;
    int64_t revision() const { return revision_; }

private:
    std::map<int64_t, std::deque<int64_t>, std::greater<int64_t>> bids_;
    std::map<int64_t, std::deque<int64_t>> asks_;
    std::unordered_map<int64_t, Order> orders_;
    size_t n_bids_ = 0;
    size_t n_asks_ = 0;
    int64_t revision_ = 0;

    template <class Levels>
    std::vector<BookLevel> aggregate(const Levels& levels, int n) const;

    template <class Levels>
    bool erase_from(Levels& levels, const Order& order);
};
