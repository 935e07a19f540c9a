#include <catch2/catch.hpp>

#include <limits>
#include <string>
#include <vector>

#include "errors.hpp"
#include "flow.hpp"

namespace {

const int64_t kForever = std::numeric_limits<int64_t>::max();

OrderSchedule fixed_schedule(int64_t lo, int64_t hi, int64_t interval) {
    OrderSchedule s;
    s.supply = {ScheduleZone{0, kForever, {PriceRange{lo, hi}}, StepMode::Fixed}};
    s.demand = {ScheduleZone{0, kForever, {PriceRange{lo, hi}}, StepMode::Fixed}};
    s.interval = interval;
    s.time_mode = TimeMode::DripFixed;
    s.shuffle_times = false;
    return s;
}

}  // namespace

TEST_CASE("schedule mode names", "[flow]") {
    REQUIRE(parse_step_mode("fixed") == StepMode::Fixed);
    REQUIRE(parse_step_mode("Jittered") == StepMode::Jittered);
    REQUIRE(parse_step_mode("random") == StepMode::Random);
    REQUIRE(parse_time_mode("periodic") == TimeMode::Periodic);
    REQUIRE(parse_time_mode("drip-fixed") == TimeMode::DripFixed);
    REQUIRE(parse_time_mode("drip-jitter") == TimeMode::DripJitter);
    REQUIRE(parse_time_mode("drip-poisson") == TimeMode::DripPoisson);
    REQUIRE_THROWS_AS(parse_step_mode("wobbly"), ConfigError);
    REQUIRE_THROWS_AS(parse_time_mode("drip"), ConfigError);
}

TEST_CASE("OrderSchedule validation", "[flow][config]") {
    OrderSchedule s;
    REQUIRE_NOTHROW(s.validate(1000));

    SECTION("zones must cover the session") {
        s.demand = {ScheduleZone{0, 100, {PriceRange{50, 150}}, StepMode::Fixed},
                    ScheduleZone{200, kForever, {PriceRange{50, 150}}, StepMode::Fixed}};
        REQUIRE_NOTHROW(s.validate(100));
        REQUIRE_THROWS_AS(s.validate(150), ConfigError);
    }
    SECTION("zones need price ranges") {
        s.supply = {ScheduleZone{0, kForever, {}, StepMode::Fixed}};
        REQUIRE_THROWS_AS(s.validate(10), ConfigError);
    }
    SECTION("interval and qty must be positive") {
        s.interval = 0;
        REQUIRE_THROWS_AS(s.validate(10), ConfigError);
        s.interval = 10;
        s.qty = 0;
        REQUIRE_THROWS_AS(s.validate(10), ConfigError);
    }
}

TEST_CASE("CustomerOrderFlow drips a full cycle over the interval", "[flow]") {
    CustomerOrderFlow flow(fixed_schedule(50, 150, 300), {"B00", "B01", "B02"}, {"S00", "S01", "S02"}, 1, 1000);

    // Issue offsets 0, 150, 300; fixed steps give 50, 100, 150.
    auto first = flow.step(0);
    REQUIRE(flow.cycles() == 1);
    REQUIRE(first.size() == 2);
    REQUIRE(flow.pending() == 4);
    for (const auto& a : first) {
        REQUIRE(a.limit_px == 50);
        REQUIRE(a.qty == 1);
        REQUIRE(a.issue_ts == 0);
    }
    REQUIRE(first[0].side != first[1].side);

    REQUIRE(flow.step(149).empty());
    auto mid = flow.step(150);
    REQUIRE(mid.size() == 2);
    REQUIRE(mid[0].limit_px == 100);

    auto last = flow.step(300);
    REQUIRE(last.size() == 2);
    REQUIRE(last[0].limit_px == 150);
    REQUIRE(flow.pending() == 0);

    flow.step(301);
    REQUIRE(flow.cycles() == 2);
}

TEST_CASE("CustomerOrderFlow assigns buyers bids and sellers asks", "[flow]") {
    OrderSchedule s = fixed_schedule(50, 150, 10);
    s.time_mode = TimeMode::DripPoisson;
    s.shuffle_times = true;
    CustomerOrderFlow flow(s, {"B00", "B01"}, {"S00", "S01", "S02"}, 1, 1000, 99);

    std::vector<Assignment> all;
    for (int64_t ts = 0; ts <= 10; ++ts) {
        auto due = flow.step(ts);
        for (size_t i = 1; i < due.size(); ++i) {
            REQUIRE(due[i - 1].issue_ts <= due[i].issue_ts);
        }
        all.insert(all.end(), due.begin(), due.end());
    }
    REQUIRE(all.size() == 5);
    for (const auto& a : all) {
        REQUIRE(a.side == (a.trader_id[0] == 'B' ? Side::Bid : Side::Ask));
        REQUIRE(a.issue_ts >= 0);
        REQUIRE(a.issue_ts <= 10);
    }
}

TEST_CASE("CustomerOrderFlow prices stay within bounds", "[flow]") {
    OrderSchedule s = fixed_schedule(20, 400, 50);
    s.demand[0].step_mode = StepMode::Random;
    s.supply[0].step_mode = StepMode::Jittered;
    std::vector<std::string> buyers;
    std::vector<std::string> sellers;
    for (int i = 0; i < 8; ++i) {
        buyers.push_back("B0" + std::to_string(i));
        sellers.push_back("S0" + std::to_string(i));
    }
    CustomerOrderFlow flow(s, buyers, sellers, 60, 300, 5);

    for (int64_t ts = 0; ts < 500; ++ts) {
        for (const auto& a : flow.step(ts)) {
            REQUIRE(a.limit_px >= 60);
            REQUIRE(a.limit_px <= 300);
        }
    }
}

TEST_CASE("CustomerOrderFlow follows zone changes", "[flow]") {
    OrderSchedule s = fixed_schedule(80, 80, 10);
    s.demand = {ScheduleZone{0, 100, {PriceRange{80, 80}}, StepMode::Fixed},
                ScheduleZone{100, kForever, {PriceRange{120, 120}}, StepMode::Fixed}};
    CustomerOrderFlow flow(s, {"B00"}, {"S00"}, 1, 1000);

    auto early = flow.step(0);
    REQUIRE(early.size() == 2);
    REQUIRE(early[0].trader_id == "B00");
    REQUIRE(early[0].limit_px == 80);

    auto late = flow.step(150);
    REQUIRE(late.size() == 2);
    REQUIRE(late[0].limit_px == 120);
    REQUIRE(late[1].limit_px == 80);
}

TEST_CASE("CustomerOrderFlow needs both sides", "[flow][errors]") {
    REQUIRE_THROWS_AS(CustomerOrderFlow(OrderSchedule{}, {}, {"S00"}, 1, 1000), ConfigError);
    REQUIRE_THROWS_AS(CustomerOrderFlow(OrderSchedule{}, {"B00"}, {}, 1, 1000), ConfigError);
}
