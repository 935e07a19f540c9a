// flow.cpp
#include "flow.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

#include "errors.hpp"
#include "log.hpp"

namespace {

std::string lower_ascii(const std::string& s) {
    std::string t = s;
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return t;
}

void validate_zones(const std::vector<ScheduleZone>& zones, const char* which, int64_t horizon) {
    if (zones.empty()) {
        throw ConfigError(std::string(which) + " schedule has no zones");
    }
    for (const auto& z : zones) {
        if (z.to <= z.from) {
            throw ConfigError(std::string(which) + " zone must have from < to");
        }
        if (z.ranges.empty()) {
            throw ConfigError(std::string(which) + " zone has no price ranges");
        }
        for (const auto& r : z.ranges) {
            if (r.lo <= 0 || r.hi <= 0) {
                throw ConfigError(std::string(which) + " price ranges must be positive");
            }
        }
    }

    // Every tick of the session must fall inside some zone.
    int64_t covered = 0;
    bool progressed = true;
    while (covered < horizon && progressed) {
        progressed = false;
        for (const auto& z : zones) {
            if (z.from <= covered && covered < z.to) {
                covered = z.to;
                progressed = true;
            }
        }
    }
    if (covered < horizon) {
        throw ConfigError(std::string(which) + " schedule does not cover tick " + std::to_string(covered));
    }
}

}  // namespace

StepMode parse_step_mode(const std::string& name) {
    const std::string t = lower_ascii(name);
    if (t == "fixed") {
        return StepMode::Fixed;
    }
    if (t == "jittered") {
        return StepMode::Jittered;
    }
    if (t == "random") {
        return StepMode::Random;
    }
    throw ConfigError("Unknown step mode: " + name);
}

TimeMode parse_time_mode(const std::string& name) {
    const std::string t = lower_ascii(name);
    if (t == "periodic") {
        return TimeMode::Periodic;
    }
    if (t == "drip-fixed") {
        return TimeMode::DripFixed;
    }
    if (t == "drip-jitter") {
        return TimeMode::DripJitter;
    }
    if (t == "drip-poisson") {
        return TimeMode::DripPoisson;
    }
    throw ConfigError("Unknown time mode: " + name);
}

void OrderSchedule::validate(int64_t horizon) const {
    if (interval <= 0) {
        throw ConfigError("schedule interval must be positive");
    }
    if (qty <= 0) {
        throw ConfigError("schedule qty must be positive");
    }
    validate_zones(supply, "supply", horizon);
    validate_zones(demand, "demand", horizon);
}

CustomerOrderFlow::CustomerOrderFlow(
    const OrderSchedule& schedule,
    std::vector<std::string> buyer_ids,
    std::vector<std::string> seller_ids,
    int64_t min_px,
    int64_t max_px,
    int64_t seed
)
    : schedule_(schedule),
      buyer_ids_(std::move(buyer_ids)),
      seller_ids_(std::move(seller_ids)),
      min_px_(min_px),
      max_px_(max_px),
      rng_(static_cast<uint32_t>(seed)) {
    if (schedule_.interval <= 0) {
        throw ConfigError("schedule interval must be positive");
    }
    if (buyer_ids_.empty() || seller_ids_.empty()) {
        throw ConfigError("customer order flow needs at least one buyer and one seller");
    }
}

int64_t CustomerOrderFlow::clip(int64_t px) const {
    if (px < min_px_) {
        LogLine(LogLevel::Debug, "CustomerOrderFlow") << "price " << px << " < min price, clipped";
        return min_px_;
    }
    if (px > max_px_) {
        LogLine(LogLevel::Debug, "CustomerOrderFlow") << "price " << px << " > max price, clipped";
        return max_px_;
    }
    return px;
}

const ScheduleZone& CustomerOrderFlow::zone_at(const std::vector<ScheduleZone>& zones, int64_t ts) const {
    // First matching zone wins.
    for (const auto& z : zones) {
        if (z.from <= ts && ts < z.to) {
            return z;
        }
    }
    throw ConfigError("tick " + std::to_string(ts) + " is not within any schedule zone");
}

std::vector<double> CustomerOrderFlow::issue_offsets(size_t n_traders) {
    const double interval = static_cast<double>(schedule_.interval);
    const double tstep = (n_traders > 1) ? interval / static_cast<double>(n_traders - 1) : interval;

    std::vector<double> times;
    times.reserve(n_traders);
    double arrtime = 0.0;
    for (size_t t = 0; t < n_traders; ++t) {
        switch (schedule_.time_mode) {
            case TimeMode::Periodic:
                arrtime = interval;
                break;
            case TimeMode::DripFixed:
                arrtime = static_cast<double>(t) * tstep;
                break;
            case TimeMode::DripJitter:
                arrtime = static_cast<double>(t) * tstep + tstep * uni01_(rng_);
                break;
            case TimeMode::DripPoisson: {
                std::exponential_distribution<double> gap(static_cast<double>(n_traders) / interval);
                arrtime += gap(rng_);
                break;
            }
        }
        times.push_back(arrtime);
    }

    // Squash or stretch so the last arrival falls at t = interval.
    if (arrtime > 0.0 && arrtime != interval) {
        for (auto& t : times) {
            t = interval * (t / arrtime);
        }
    }

    if (schedule_.shuffle_times && n_traders > 1) {
        for (size_t t = 0; t < n_traders; ++t) {
            size_t i = (n_traders - 1) - t;
            std::uniform_int_distribution<size_t> pick(0, i);
            std::swap(times[i], times[pick(rng_)]);
        }
    }
    return times;
}

int64_t CustomerOrderFlow::order_price(size_t i, const ScheduleZone& zone, size_t n_traders) {
    const PriceRange& first = zone.ranges.front();
    int64_t pmin = clip(std::min(first.lo, first.hi));
    int64_t pmax = clip(std::max(first.lo, first.hi));
    const double stepsize = (n_traders > 1)
        ? static_cast<double>(pmax - pmin) / static_cast<double>(n_traders - 1)
        : 0.0;
    const auto halfstep = static_cast<int64_t>(std::llround(stepsize / 2.0));

    int64_t px = pmin;
    switch (zone.step_mode) {
        case StepMode::Fixed:
            px = pmin + static_cast<int64_t>(static_cast<double>(i) * stepsize);
            break;
        case StepMode::Jittered: {
            std::uniform_int_distribution<int64_t> jitter(-halfstep, halfstep);
            px = pmin + static_cast<int64_t>(static_cast<double>(i) * stepsize) + jitter(rng_);
            break;
        }
        case StepMode::Random: {
            if (zone.ranges.size() > 1) {
                std::uniform_int_distribution<size_t> pick(0, zone.ranges.size() - 1);
                const PriceRange& r = zone.ranges[pick(rng_)];
                pmin = clip(std::min(r.lo, r.hi));
                pmax = clip(std::max(r.lo, r.hi));
            }
            std::uniform_int_distribution<int64_t> dist(pmin, pmax);
            px = dist(rng_);
            break;
        }
    }
    return clip(px);
}

void CustomerOrderFlow::replenish(int64_t ts) {
    pending_.clear();

    const ScheduleZone& demand = zone_at(schedule_.demand, ts);
    auto times = issue_offsets(buyer_ids_.size());
    for (size_t t = 0; t < buyer_ids_.size(); ++t) {
        int64_t issue = ts + static_cast<int64_t>(std::llround(times[t]));
        pending_.push_back(Assignment{
            buyer_ids_[t],
            Side::Bid,
            order_price(t, demand, buyer_ids_.size()),
            schedule_.qty,
            issue,
        });
    }

    const ScheduleZone& supply = zone_at(schedule_.supply, ts);
    times = issue_offsets(seller_ids_.size());
    for (size_t t = 0; t < seller_ids_.size(); ++t) {
        int64_t issue = ts + static_cast<int64_t>(std::llround(times[t]));
        pending_.push_back(Assignment{
            seller_ids_[t],
            Side::Ask,
            order_price(t, supply, seller_ids_.size()),
            schedule_.qty,
            issue,
        });
    }

    cycles_ += 1;
    LogLine(LogLevel::Debug, "CustomerOrderFlow")
        << "cycle " << cycles_ << " generated " << pending_.size() << " assignments at t=" << ts;
}

std::vector<Assignment> CustomerOrderFlow::step(int64_t ts) {
    if (pending_.empty()) {
        replenish(ts);
    }

    std::vector<Assignment> due;
    std::vector<Assignment> still_pending;
    still_pending.reserve(pending_.size());
    for (auto& a : pending_) {
        if (a.issue_ts <= ts) {
            due.push_back(std::move(a));
        } else {
            still_pending.push_back(std::move(a));
        }
    }
    pending_ = std::move(still_pending);

    std::stable_sort(due.begin(), due.end(), [](const Assignment& a, const Assignment& b) {
        return a.issue_ts < b.issue_ts;
    });
    return due;
}
