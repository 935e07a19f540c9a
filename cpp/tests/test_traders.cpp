#include <catch2/catch.hpp>

#include <limits>
#include <string>

#include "errors.hpp"
#include "mlofi.hpp"
#include "traders.hpp"

namespace {

MarketView view_of(std::optional<BookLevel> bid, std::optional<BookLevel> ask, double countdown = 1.0) {
    MarketView v;
    v.countdown = countdown;
    v.min_px = 1;
    v.max_px = 1000;
    v.best_bid = bid;
    v.best_ask = ask;
    if (bid.has_value() && ask.has_value()) {
        v.mid = 0.5 * static_cast<double>(bid->px + ask->px);
    }
    return v;
}

Assignment job(const std::string& id, Side side, int64_t limit, int64_t qty = 1) {
    return Assignment{id, side, limit, qty, 0};
}

Trade trade_at(int64_t px, int64_t qty, const std::string& buyer, const std::string& seller) {
    Trade t{};
    t.id = 1;
    t.px = px;
    t.qty = qty;
    t.buyer = buyer;
    t.seller = seller;
    return t;
}

}  // namespace

TEST_CASE("trader codes", "[traders]") {
    for (auto kind : {TraderKind::Giveaway, TraderKind::ZIC, TraderKind::Shaver, TraderKind::Sniper,
                      TraderKind::ZIP, TraderKind::ImpactSensitive, TraderKind::ImpactSensitiveFiltered}) {
        REQUIRE(parse_trader_kind(trader_code(kind)) == kind);
        auto t = make_trader(kind, "B00", 1);
        REQUIRE(t->kind() == kind);
        REQUIRE(t->id() == "B00");
    }
    REQUIRE(parse_trader_kind("zic") == TraderKind::ZIC);
    REQUIRE_THROWS_AS(parse_trader_kind("AA"), ConfigError);
}

TEST_CASE("Trader assignment and bookkeeping", "[traders]") {
    GiveawayTrader buyer("B00");
    GiveawayTrader seller("S00");

    REQUIRE_FALSE(buyer.decide(view_of(std::nullopt, std::nullopt)).has_value());
    REQUIRE_THROWS_AS(buyer.assign(job("B00", Side::Bid, 0)), ValidationError);
    REQUIRE_THROWS_AS(buyer.assign(job("B00", Side::Bid, 100, 0)), ValidationError);

    buyer.assign(job("B00", Side::Bid, 120, 2));
    seller.assign(job("S00", Side::Ask, 80, 1));

    auto q = buyer.decide(view_of(std::nullopt, std::nullopt));
    REQUIRE(q.has_value());
    REQUIRE(q->side == Side::Bid);
    REQUIRE(q->px == 120);
    REQUIRE(q->qty == 2);

    const Trade t = trade_at(100, 1, "B00", "S00");
    REQUIRE(buyer.bookkeep(t) == 20);
    REQUIRE(seller.bookkeep(t) == 20);
    REQUIRE(buyer.balance() == 20);
    REQUIRE(seller.balance() == 20);

    // Partially worked: one unit still to buy.
    REQUIRE(buyer.has_assignment());
    REQUIRE(buyer.assignment()->qty == 1);
    REQUIRE_FALSE(seller.has_assignment());

    SECTION("fills without an assignment earn nothing") {
        REQUIRE(seller.bookkeep(t) == 0);
        REQUIRE(seller.balance() == 20);
    }

    SECTION("rejections are counted") {
        buyer.on_rejected("bad price");
        REQUIRE(buyer.n_rejected() == 1);
    }
}

TEST_CASE("ZIC quotes inside its limit", "[traders]") {
    ZicTrader buyer("B00", 11);
    ZicTrader seller("S00", 12);
    buyer.assign(job("B00", Side::Bid, 150));
    seller.assign(job("S00", Side::Ask, 150));
    const auto v = view_of(std::nullopt, std::nullopt);

    for (int i = 0; i < 200; ++i) {
        auto b = buyer.decide(v);
        auto s = seller.decide(v);
        REQUIRE(b->px >= v.min_px);
        REQUIRE(b->px <= 150);
        REQUIRE(s->px >= 150);
        REQUIRE(s->px <= v.max_px);
    }
}

TEST_CASE("Shaver improves the best quote by one tick", "[traders]") {
    ShaverTrader buyer("B00");
    ShaverTrader seller("S00");
    buyer.assign(job("B00", Side::Bid, 120));
    seller.assign(job("S00", Side::Ask, 90));

    SECTION("own side present") {
        auto v = view_of(BookLevel{100, 1}, BookLevel{110, 1});
        REQUIRE(buyer.decide(v)->px == 101);
        REQUIRE(seller.decide(v)->px == 109);
    }
    SECTION("capped at the limit") {
        auto v = view_of(BookLevel{125, 1}, BookLevel{85, 1});
        REQUIRE(buyer.decide(v)->px == 120);
        REQUIRE(seller.decide(v)->px == 90);
    }
    SECTION("empty book gives a stub quote at the bounds") {
        auto v = view_of(std::nullopt, std::nullopt);
        REQUIRE(buyer.decide(v)->px == v.min_px);
        REQUIRE(seller.decide(v)->px == v.max_px);
    }
}

TEST_CASE("Sniper lurks until late in the session", "[traders]") {
    SniperTrader buyer("B00");
    buyer.assign(job("B00", Side::Bid, 120));

    REQUIRE_FALSE(buyer.decide(view_of(BookLevel{100, 1}, BookLevel{110, 1}, 0.5)).has_value());

    // shave = int(1 / (0.01 + 0.1 / 0.6)) = 5
    auto q = buyer.decide(view_of(BookLevel{100, 1}, BookLevel{110, 1}, 0.1));
    REQUIRE(q.has_value());
    REQUIRE(q->px == 105);
}

TEST_CASE("ZIP starts with a margin inside the limit", "[traders]") {
    ZipTrader buyer("B00", 3);
    ZipTrader seller("S00", 4);
    REQUIRE(buyer.margin_buy() <= -0.05);
    REQUIRE(buyer.margin_buy() >= -0.35);
    REQUIRE(seller.margin_sell() >= 0.05);
    REQUIRE(seller.margin_sell() <= 0.35);

    buyer.assign(job("B00", Side::Bid, 100));
    seller.assign(job("S00", Side::Ask, 100));
    const auto v = view_of(std::nullopt, std::nullopt);
    REQUIRE(buyer.decide(v)->px < 100);
    REQUIRE(seller.decide(v)->px > 100);

    SECTION("a trade below its price lowers the buyer's quote") {
        const int64_t before = *buyer.price();
        const Trade t = trade_at(before - 10, 1, "B01", "S01");
        auto after_trade = view_of(std::nullopt, std::nullopt);
        buyer.respond(view_of(BookLevel{before - 10, 1}, std::nullopt), nullptr);
        buyer.respond(after_trade, &t);
        REQUIRE(*buyer.price() < before);
        REQUIRE(*buyer.price() <= 100);
    }
}

TEST_CASE("ImpactSensitiveTrader base price", "[traders][mlofi]") {
    auto buy = job("B00", Side::Bid, 120);
    auto sell = job("S00", Side::Ask, 90);

    REQUIRE(ImpactSensitiveTrader::base_price(buy, view_of(BookLevel{100, 1}, std::nullopt)) == 100);
    REQUIRE(ImpactSensitiveTrader::base_price(buy, view_of(BookLevel{130, 1}, std::nullopt)) == 120);
    REQUIRE(ImpactSensitiveTrader::base_price(buy, view_of(std::nullopt, std::nullopt)) == 120);
    REQUIRE(ImpactSensitiveTrader::base_price(sell, view_of(std::nullopt, BookLevel{110, 1})) == 110);
    REQUIRE(ImpactSensitiveTrader::base_price(sell, view_of(std::nullopt, BookLevel{80, 1})) == 90);
    REQUIRE(ImpactSensitiveTrader::base_price(sell, view_of(std::nullopt, std::nullopt)) == 90);
}

namespace {

// Depth-1 signal that has seen the touch go from 100x10 / 110x10 to the given sizes.
void prime(ImbalanceSignal& signal, int64_t bid_qty, int64_t ask_qty) {
    LevelSnapshot prev;
    prev.bids = {BookLevel{100, 10}};
    prev.asks = {BookLevel{110, 10}};
    LevelSnapshot curr = prev;
    curr.ts = 1;
    curr.bids[0].qty = bid_qty;
    curr.asks[0].qty = ask_qty;
    signal.observe(prev);
    signal.observe(curr);
}

SignalConfig depth_one() {
    SignalConfig c;
    c.depth = 1;
    return c;
}

int64_t quote_px(ImpactSensitiveTrader& t, const ImbalanceSignal& signal, double countdown = 1.0) {
    auto v = view_of(BookLevel{100, 10}, BookLevel{110, 10}, countdown);
    v.signal = &signal;
    return t.decide(v)->px;
}

}  // namespace

TEST_CASE("ImpactSensitiveTrader quotes its base price without a significant MLOFI", "[traders][mlofi]") {
    ImbalanceSignal signal(depth_one());
    ImpactSensitiveTrader buyer("B00", false);
    ImpactSensitiveTrader seller("S00", false);
    buyer.assign(job("B00", Side::Bid, 150));
    seller.assign(job("S00", Side::Ask, 50));

    SECTION("signal not ready") {
        REQUIRE(quote_px(buyer, signal) == 100);
        REQUIRE(quote_px(seller, signal) == 110);
    }

    SECTION("ready but flat book") {
        prime(signal, 10, 10);
        REQUIRE(signal.ready());
        REQUIRE(signal.latest() == 0.0);
        REQUIRE_FALSE(buyer.signal_active(signal));
        REQUIRE(quote_px(buyer, signal) == 100);
        REQUIRE(quote_px(seller, signal) == 110);
    }

    SECTION("flat book late in the session does not cross") {
        prime(signal, 10, 10);
        REQUIRE(quote_px(buyer, signal, 0.1) == 100);
    }

    SECTION("MLOFI at the threshold") {
        SignalConfig c = depth_one();
        c.mlofi_threshold = 10.0;
        ImbalanceSignal gated(c);
        prime(gated, 20, 10);
        REQUIRE(gated.latest() == Approx(10.0));
        REQUIRE(quote_px(buyer, gated) == 100);
    }
}

TEST_CASE("ImpactSensitiveTrader shifts with the sign of the MLOFI", "[traders][mlofi]") {
    ImpactSensitiveTrader buyer("B00", false);
    ImpactSensitiveTrader seller("S00", false);
    buyer.assign(job("B00", Side::Bid, 150));
    seller.assign(job("S00", Side::Ask, 50));

    SECTION("buy pressure raises both quotes") {
        ImbalanceSignal signal(depth_one());
        prime(signal, 20, 10);
        // MLOFI 10, depth (20 + 10) / 2 + 1 = 16, shift 0.8 * 5 * 10 / 16 = 2.5
        REQUIRE(signal.latest() == Approx(10.0));
        REQUIRE(quote_px(buyer, signal) == 103);
        REQUIRE(quote_px(seller, signal) == 113);
    }

    SECTION("sell pressure lowers both quotes") {
        ImbalanceSignal signal(depth_one());
        prime(signal, 10, 20);
        REQUIRE(signal.latest() == Approx(-10.0));
        REQUIRE(quote_px(buyer, signal) == 98);
        REQUIRE(quote_px(seller, signal) == 108);
    }

    SECTION("never beyond the limit") {
        ImbalanceSignal signal(depth_one());
        prime(signal, 20, 10);
        buyer.assign(job("B00", Side::Bid, 101));
        seller.assign(job("S00", Side::Ask, 109));
        REQUIRE(quote_px(buyer, signal) == 101);

        ImbalanceSignal selling(depth_one());
        prime(selling, 10, 20);
        REQUIRE(quote_px(seller, selling) == 109);
    }
}

TEST_CASE("ImpactSensitiveTrader filter needs a lopsided book", "[traders][mlofi]") {
    ImpactSensitiveTrader filtered("B01", true);
    filtered.assign(job("B01", Side::Bid, 150));

    SECTION("mild imbalance is ignored") {
        ImbalanceSignal signal(depth_one());
        prime(signal, 20, 10);
        REQUIRE_FALSE(signal.significant());
        REQUIRE(quote_px(filtered, signal) == 100);
    }

    SECTION("heavy bid depth passes") {
        ImbalanceSignal signal(depth_one());
        prime(signal, 200, 10);
        REQUIRE(signal.significant());
        // 100 + 0.8 * 5 * 190 / 106
        REQUIRE(quote_px(filtered, signal) == 107);
    }
}

TEST_CASE("ImpactSensitiveTrader crosses the spread late in the session", "[traders][mlofi]") {
    ImpactSensitiveTrader buyer("B00", false);
    ImpactSensitiveTrader seller("S00", false);
    buyer.assign(job("B00", Side::Bid, 150));
    seller.assign(job("S00", Side::Ask, 50));

    ImbalanceSignal buying(depth_one());
    prime(buying, 20, 10);
    ImbalanceSignal selling(depth_one());
    prime(selling, 10, 20);

    REQUIRE(quote_px(buyer, buying, 0.1) == 110);
    REQUIRE(quote_px(seller, selling, 0.1) == 100);
    REQUIRE(quote_px(buyer, buying, 0.5) == 103);

    SECTION("touch outside the limit") {
        buyer.assign(job("B00", Side::Bid, 105));
        REQUIRE(quote_px(buyer, buying, 0.1) == 105);
    }

    SECTION("crossing disabled") {
        SignalConfig c = depth_one();
        c.cross_countdown = 0.0;
        ImbalanceSignal late(c);
        prime(late, 20, 10);
        REQUIRE(quote_px(buyer, late, 0.1) == 103);
    }
}

TEST_CASE("ImpactSensitiveTrader reports an unusable price", "[traders][errors]") {
    ImpactSensitiveTrader t("B00", false);
    t.assign(job("B00", Side::Bid, 120));

    SECTION("overflow") {
        SignalConfig c = depth_one();
        c.impact_gain = std::numeric_limits<double>::max();
        ImbalanceSignal signal(c);
        prime(signal, 200, 10);
        auto v = view_of(BookLevel{100, 10}, BookLevel{110, 10});
        v.signal = &signal;
        REQUIRE_THROWS_AS(t.decide(v), StrategyComputationError);
    }

    SECTION("finite but absurd") {
        SignalConfig c = depth_one();
        c.impact_gain = 1e300;
        ImbalanceSignal signal(c);
        prime(signal, 20, 10);
        auto v = view_of(BookLevel{100, 10}, BookLevel{110, 10});
        v.signal = &signal;
        REQUIRE_THROWS_AS(t.decide(v), StrategyComputationError);
    }
}
