// mlofi.hpp
#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "book.hpp"

// Multi-level order-flow imbalance (Cont/Kukanov/Stoikov OFI generalised to m levels).

struct ImbalanceSample {
    int64_t ts = 0;
    std::vector<double> level_ofi;  // e_1 .. e_m
    double mlofi = 0.0;             // sum of level_ofi
};

struct SignalConfig {
    int depth = 3;                         // m
    double significance_threshold = 0.6;   // on volume_ratio()
    int window = 10;                       // samples kept for the rolling sums
    double impact_gain = 5.0;              // c in the offset mapping
    double level_decay = 0.8;              // weight decay per level in the offset mapping
    double blend = 0.8;                    // fraction of the offset applied to the base quote
    double mlofi_threshold = 0.0;          // |latest MLOFI| must exceed this before a trader shifts
    double cross_countdown = 0.3;          // below this countdown an active trader crosses the spread

    void validate() const;
};

// e_n for the n-th level (1-based). Levels missing from a snapshot count as price 0, qty 0.
double level_ofi(const LevelSnapshot& prev, const LevelSnapshot& curr, int level);

ImbalanceSample imbalance_sample(const LevelSnapshot& prev, const LevelSnapshot& curr, int m);

double imbalance_alter(const LevelSnapshot& prev, const LevelSnapshot& curr, int m);

bool is_imbalance_significant(double value, double threshold);

// Rolling MLOFI state fed with consecutive book snapshots.
class ImbalanceSignal {
public:
    explicit ImbalanceSignal(const SignalConfig& config = SignalConfig{});

    void observe(const LevelSnapshot& snapshot);
    void reset();

    bool ready() const { return !samples_.empty(); }
    double latest() const;
    std::optional<ImbalanceSample> latest_sample() const;

    double cumulative_ofi(int level) const;
    double average_depth(int level) const;

    // Depth-normalised MLOFI over the window, level n weighted by level_decay^(n-1).
    double pressure() const;
    double quote_offset() const;
    double volume_ratio() const;
    bool significant() const;

    const SignalConfig& config() const { return config_; }
    size_t n_samples() const { return samples_.size(); }

private:
    SignalConfig config_;
    std::optional<LevelSnapshot> last_;
    std::deque<ImbalanceSample> samples_;
    std::deque<std::vector<double>> depths_;      // (bid + ask) / 2 per level
    std::deque<std::vector<double>> bid_volumes_;
    std::deque<std::vector<double>> ask_volumes_;

    void push_window(std::deque<std::vector<double>>& buf, std::vector<double> row);
};
