// mlofi.cpp
#include "mlofi.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "errors.hpp"

namespace {

BookLevel level_at(const std::vector<BookLevel>& side, int level) {
    if (level < 1 || static_cast<size_t>(level) > side.size()) {
        return BookLevel{0, 0};
    }
    return side[static_cast<size_t>(level - 1)];
}

template <class Buf>
double column_mean_plus_one(const Buf& buf, size_t idx) {
    if (buf.empty()) {
        return 1.0;
    }
    double sum = 0.0;
    for (const auto& row : buf) {
        sum += row[idx];
    }
    return sum / static_cast<double>(buf.size()) + 1.0;
}

}  // namespace

void SignalConfig::validate() const {
    if (depth <= 0) {
        throw ConfigError("signal depth must be > 0");
    }
    if (window <= 0) {
        throw ConfigError("signal window must be > 0");
    }
    if (!std::isfinite(significance_threshold) || significance_threshold < 0.0) {
        throw ConfigError("significance_threshold must be finite and >= 0");
    }
    if (!std::isfinite(impact_gain)) {
        throw ConfigError("impact_gain must be finite");
    }
    if (!std::isfinite(level_decay) || level_decay < 0.0) {
        throw ConfigError("level_decay must be finite and >= 0");
    }
    if (!std::isfinite(blend) || blend < 0.0 || blend > 1.0) {
        throw ConfigError("blend must be in [0,1]");
    }
    if (!std::isfinite(mlofi_threshold) || mlofi_threshold < 0.0) {
        throw ConfigError("mlofi_threshold must be finite and >= 0");
    }
    if (!std::isfinite(cross_countdown) || cross_countdown < 0.0 || cross_countdown > 1.0) {
        throw ConfigError("cross_countdown must be in [0,1]");
    }
}

double level_ofi(const LevelSnapshot& prev, const LevelSnapshot& curr, int level) {
    const BookLevel b_prev = level_at(prev.bids, level);
    const BookLevel b_curr = level_at(curr.bids, level);
    const BookLevel a_prev = level_at(prev.asks, level);
    const BookLevel a_curr = level_at(curr.asks, level);

    int64_t delta_w = 0;
    if (b_curr.px > b_prev.px) {
        delta_w = b_curr.qty;
    } else if (b_curr.px == b_prev.px) {
        delta_w = b_curr.qty - b_prev.qty;
    } else {
        delta_w = -b_prev.qty;
    }

    int64_t delta_v = 0;
    if (a_curr.px > a_prev.px) {
        delta_v = -a_prev.qty;
    } else if (a_curr.px == a_prev.px) {
        delta_v = a_curr.qty - a_prev.qty;
    } else {
        delta_v = a_curr.qty;
    }

    return static_cast<double>(delta_w - delta_v);
}

ImbalanceSample imbalance_sample(const LevelSnapshot& prev, const LevelSnapshot& curr, int m) {
    if (m <= 0) {
        throw ValidationError("MLOFI depth must be > 0, got " + std::to_string(m));
    }
    ImbalanceSample sample;
    sample.ts = curr.ts;
    sample.level_ofi.reserve(static_cast<size_t>(m));
    for (int n = 1; n <= m; ++n) {
        double e = level_ofi(prev, curr, n);
        sample.level_ofi.push_back(e);
        sample.mlofi += e;
    }
    return sample;
}

double imbalance_alter(const LevelSnapshot& prev, const LevelSnapshot& curr, int m) {
    return imbalance_sample(prev, curr, m).mlofi;
}

bool is_imbalance_significant(double value, double threshold) {
    return std::abs(value) > threshold;
}

ImbalanceSignal::ImbalanceSignal(const SignalConfig& config) : config_(config) {
    config_.validate();
}

void ImbalanceSignal::reset() {
    last_.reset();
    samples_.clear();
    depths_.clear();
    bid_volumes_.clear();
    ask_volumes_.clear();
}

void ImbalanceSignal::push_window(std::deque<std::vector<double>>& buf, std::vector<double> row) {
    buf.push_back(std::move(row));
    while (buf.size() > static_cast<size_t>(config_.window)) {
        buf.pop_front();
    }
}

void ImbalanceSignal::observe(const LevelSnapshot& snapshot) {
    if (!last_.has_value()) {
        last_ = snapshot;
        return;
    }

    const int m = config_.depth;
    ImbalanceSample sample = imbalance_sample(*last_, snapshot, m);
    samples_.push_back(std::move(sample));
    while (samples_.size() > static_cast<size_t>(config_.window)) {
        samples_.pop_front();
    }

    std::vector<double> depth_row;
    std::vector<double> bid_row;
    std::vector<double> ask_row;
    depth_row.reserve(static_cast<size_t>(m));
    bid_row.reserve(static_cast<size_t>(m));
    ask_row.reserve(static_cast<size_t>(m));
    for (int n = 1; n <= m; ++n) {
        double r = static_cast<double>(level_at(snapshot.bids, n).qty);
        double q = static_cast<double>(level_at(snapshot.asks, n).qty);
        depth_row.push_back(0.5 * (r + q));
        bid_row.push_back(r);
        ask_row.push_back(q);
    }
    push_window(depths_, std::move(depth_row));
    push_window(bid_volumes_, std::move(bid_row));
    push_window(ask_volumes_, std::move(ask_row));

    last_ = snapshot;
}

double ImbalanceSignal::latest() const {
    if (samples_.empty()) {
        return 0.0;
    }
    return samples_.back().mlofi;
}

std::optional<ImbalanceSample> ImbalanceSignal::latest_sample() const {
    if (samples_.empty()) {
        return std::nullopt;
    }
    return samples_.back();
}

double ImbalanceSignal::cumulative_ofi(int level) const {
    if (level < 1 || level > config_.depth) {
        throw ValidationError("level out of range: " + std::to_string(level));
    }
    double sum = 0.0;
    for (const auto& s : samples_) {
        sum += s.level_ofi[static_cast<size_t>(level - 1)];
    }
    return sum;
}

double ImbalanceSignal::average_depth(int level) const {
    if (level < 1 || level > config_.depth) {
        throw ValidationError("level out of range: " + std::to_string(level));
    }
    return column_mean_plus_one(depths_, static_cast<size_t>(level - 1));
}

double ImbalanceSignal::pressure() const {
    double p = 0.0;
    double weight = 1.0;
    for (int n = 1; n <= config_.depth; ++n) {
        p += weight * cumulative_ofi(n) / average_depth(n);
        weight *= config_.level_decay;
    }
    return p;
}

double ImbalanceSignal::quote_offset() const {
    return config_.impact_gain * pressure();
}

// Weighted (V_bid - V_ask) / (V_bid + V_ask) over the window; each level average is +1 so
// an empty window gives 0.
double ImbalanceSignal::volume_ratio() const {
    double v_bid = 0.0;
    double v_ask = 0.0;
    for (int i = 0; i < config_.depth; ++i) {
        double w = std::exp(-0.5 * static_cast<double>(i));
        v_bid += w * column_mean_plus_one(bid_volumes_, static_cast<size_t>(i));
        v_ask += w * column_mean_plus_one(ask_volumes_, static_cast<size_t>(i));
    }
    return (v_bid - v_ask) / (v_bid + v_ask);
}

bool ImbalanceSignal::significant() const {
    return ready() && is_imbalance_significant(volume_ratio(), config_.significance_threshold);
}
