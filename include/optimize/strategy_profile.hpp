#pragma once
#include <string>
#include <vector>

namespace vram_sizer {

enum class OptimizationTarget {
    THROUGHPUT,
    LATENCY,
    BALANCED
};

std::string optimization_target_to_string(OptimizationTarget target);
OptimizationTarget string_to_optimization_target(const std::string& str);

/**
 * @brief Policy record for one optimization strategy
 *
 * The search keeps total * max(1 - gpu_memory_utilization, headroom_band_low)
 * of VRAM unused and picks the largest sequence count in
 * [min_num_seqs, max_num_seqs] that fits at max_model_len.
 */
struct StrategyProfile {
    OptimizationTarget target;
    const char* title;
    const char* description;
    double gpu_memory_utilization;
    int max_model_len;
    int min_num_seqs;
    int max_num_seqs;
    double headroom_band_low;       // fraction of total VRAM left available
    double headroom_band_high;
    double swap_ratio;
    bool allow_length_reduction;    // step down max_model_len when nothing fits

    // Fixed values used when the search cannot run.
    int fallback_max_model_len;
    int fallback_max_num_seqs;
};

const StrategyProfile& strategy_profile(OptimizationTarget target);

// throughput, latency, balanced
const std::vector<OptimizationTarget>& all_optimization_targets();

// Candidate lengths tried below the profile length, longest first.
std::vector<int> sequence_length_ladder(int start_len);

} // namespace vram_sizer
