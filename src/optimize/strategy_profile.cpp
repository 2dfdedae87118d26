#include "optimize/strategy_profile.hpp"

namespace vram_sizer {

namespace {

const StrategyProfile kThroughputProfile = {
    OptimizationTarget::THROUGHPUT,
    "Maximum Throughput",
    "Maximizes concurrent sequences at a 2048-token context to saturate the GPUs.",
    0.90,   // gpu_memory_utilization
    2048,   // max_model_len
    1,      // min_num_seqs
    256,    // max_num_seqs
    0.0,    // headroom_band_low
    1.0,    // headroom_band_high
    0.15,   // swap_ratio
    false,  // allow_length_reduction
    2048,
    512
};

// The small sequence cap is the latency policy: the search still takes the
// largest count that fits, but never more than 8 concurrent sequences.
const StrategyProfile kLatencyProfile = {
    OptimizationTarget::LATENCY,
    "Minimum Latency",
    "Keeps batches small so each request is scheduled immediately, with a longer 4096-token context.",
    0.80,
    4096,
    1,
    8,
    0.0,
    1.0,
    0.05,
    true,
    4096,
    128
};

const StrategyProfile kBalancedProfile = {
    OptimizationTarget::BALANCED,
    "Balanced Performance",
    "Trades batch size against context length and keeps 10-20% of VRAM free for bursts.",
    0.85,
    3072,
    1,
    128,
    0.10,
    0.20,
    0.10,
    true,
    2048,
    128
};

const int kLengthLadder[] = {4096, 3072, 2048, 1024, 512};

} // namespace

std::string optimization_target_to_string(OptimizationTarget target) {
    switch (target) {
        case OptimizationTarget::THROUGHPUT: return "throughput";
        case OptimizationTarget::LATENCY:    return "latency";
        case OptimizationTarget::BALANCED:   return "balanced";
        default:                             return "balanced";
    }
}

OptimizationTarget string_to_optimization_target(const std::string& str) {
    if (str == "throughput") return OptimizationTarget::THROUGHPUT;
    if (str == "latency")    return OptimizationTarget::LATENCY;
    return OptimizationTarget::BALANCED;  // default
}

const StrategyProfile& strategy_profile(OptimizationTarget target) {
    switch (target) {
        case OptimizationTarget::THROUGHPUT: return kThroughputProfile;
        case OptimizationTarget::LATENCY:    return kLatencyProfile;
        case OptimizationTarget::BALANCED:
        default:                             return kBalancedProfile;
    }
}

const std::vector<OptimizationTarget>& all_optimization_targets() {
    static const std::vector<OptimizationTarget> targets = {
        OptimizationTarget::THROUGHPUT,
        OptimizationTarget::LATENCY,
        OptimizationTarget::BALANCED
    };
    return targets;
}

std::vector<int> sequence_length_ladder(int start_len) {
    std::vector<int> ladder;
    for (int len : kLengthLadder) {
        if (len < start_len) {
            ladder.push_back(len);
        }
    }
    return ladder;
}

} // namespace vram_sizer
