// flow.hpp
#pragma once

#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "traders.hpp"

enum class StepMode { Fixed, Jittered, Random };
enum class TimeMode { Periodic, DripFixed, DripJitter, DripPoisson };

StepMode parse_step_mode(const std::string& name);
TimeMode parse_time_mode(const std::string& name);

struct PriceRange {
    int64_t lo = 0;
    int64_t hi = 0;
};

// A supply or demand schedule active over [from, to) ticks.
struct ScheduleZone {
    int64_t from = 0;
    int64_t to = std::numeric_limits<int64_t>::max();
    std::vector<PriceRange> ranges;
    StepMode step_mode = StepMode::Fixed;
};

struct OrderSchedule {
    std::vector<ScheduleZone> supply{ScheduleZone{0, std::numeric_limits<int64_t>::max(), {PriceRange{50, 150}}, StepMode::Fixed}};
    std::vector<ScheduleZone> demand{ScheduleZone{0, std::numeric_limits<int64_t>::max(), {PriceRange{50, 150}}, StepMode::Fixed}};

    int64_t interval = 300;  // ticks per full replenishment cycle
    TimeMode time_mode = TimeMode::DripPoisson;
    bool shuffle_times = true;
    int64_t qty = 1;

    // Throws ConfigError; `horizon` is the session length the zones must cover.
    void validate(int64_t horizon) const;
};

// Issues customer assignments to buyers (bids) and sellers (asks) from the schedule.
// A new cycle is generated whenever nothing is pending.
class CustomerOrderFlow {
public:
    CustomerOrderFlow(
        const OrderSchedule& schedule,
        std::vector<std::string> buyer_ids,
        std::vector<std::string> seller_ids,
        int64_t min_px,
        int64_t max_px,
        int64_t seed = 0
    );

    std::vector<Assignment> step(int64_t ts);

    size_t pending() const { return pending_.size(); }
    int64_t cycles() const { return cycles_; }

    std::vector<double> issue_offsets(size_t n_traders);
    int64_t order_price(size_t i, const ScheduleZone& zone, size_t n_traders);

private:
    const ScheduleZone& zone_at(const std::vector<ScheduleZone>& zones, int64_t ts) const;
    void replenish(int64_t ts);
    int64_t clip(int64_t px) const;

    OrderSchedule schedule_;
    std::vector<std::string> buyer_ids_;
    std::vector<std::string> seller_ids_;
    int64_t min_px_;
    int64_t max_px_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> uni01_{0.0, 1.0};

    std::vector<Assignment> pending_;
    int64_t cycles_ = 0;
};
