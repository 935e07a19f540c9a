#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "book.hpp"

enum class SubmitStatus { Accepted, Rejected, SessionClosed };

struct SubmitResult {
    SubmitStatus status = SubmitStatus::Accepted;
    std::vector<Trade> trades;
    std::optional<int64_t> resting_id;
    std::string reason;

    bool accepted() const { return status == SubmitStatus::Accepted; }
    int64_t traded_qty() const;
};

// Price-time priority matching with execution at the resting order's price.
// The engine does not own the book; the session owns both.
class MatchingEngine {
public:
    explicit MatchingEngine(LimitOrderBook& book);

    SubmitResult submit(Order order);
    bool cancel(int64_t order_id);

    const LimitOrderBook& book() const { return book_; }
    int64_t n_trades() const { return next_trade_id_ - 1; }

private:
    static bool crosses(const Order& incoming, const Order& resting);

    LimitOrderBook& book_;
    int64_t next_trade_id_ = 1;
};
