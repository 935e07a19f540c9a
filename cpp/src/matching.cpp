#include "matching.hpp"

#include <utility>

#include "log.hpp"

int64_t SubmitResult::traded_qty() const {
    int64_t total = 0;
    for (const auto& t : trades) {
        total += t.qty;
    }
    return total;
}

MatchingEngine::MatchingEngine(LimitOrderBook& book) : book_(book) {}

bool MatchingEngine::crosses(const Order& incoming, const Order& resting) {
    if (incoming.side == Side::Bid) {
        return incoming.px >= resting.px;
    }
    return incoming.px <= resting.px;
}

SubmitResult MatchingEngine::submit(Order order) {
    SubmitResult result;

    if (auto err = order_error(order)) {
        result.status = SubmitStatus::Rejected;
        result.reason = *err;
        LogLine(LogLevel::Info, "MatchingEngine") << "rejected order " << order.id << " from " << order.owner << ": " << *err;
        return result;
    }
    if (book_.find(order.id) != nullptr) {
        result.status = SubmitStatus::Rejected;
        result.reason = "duplicate order id " + std::to_string(order.id);
        return result;
    }

    const Side resting_side = opposite(order.side);

    while (order.qty > 0) {
        const Order* resting = book_.front(resting_side);
        if (resting == nullptr || !crosses(order, *resting)) {
            break;
        }

        Trade trade{};
        trade.id = next_trade_id_;
        trade.px = resting->px;
        trade.aggressor = order.side;
        trade.ts = order.ts;
        if (order.side == Side::Bid) {
            trade.buy_order_id = order.id;
            trade.sell_order_id = resting->id;
            trade.buyer = order.owner;
            trade.seller = resting->owner;
        } else {
            trade.buy_order_id = resting->id;
            trade.sell_order_id = order.id;
            trade.buyer = resting->owner;
            trade.seller = order.owner;
        }

        // fill_front may erase the resting order, so nothing below touches `resting`.
        int64_t traded = book_.fill_front(resting_side, order.qty);
        order.qty -= traded;
        trade.qty = traded;

        next_trade_id_ += 1;
        result.trades.push_back(std::move(trade));
    }

    if (order.qty > 0) {
        book_.insert(order);
        result.resting_id = order.id;
    }

    return result;
}

bool MatchingEngine::cancel(int64_t order_id) {
    return book_.cancel(order_id);
}
