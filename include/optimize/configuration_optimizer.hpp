#pragma once
#include <string>
#include <vector>

#include "command/command_formatter.hpp"
#include "core/engine_settings.hpp"
#include "core/hardware.hpp"
#include "core/model_spec.hpp"
#include "memory/vram_breakdown.hpp"
#include "optimize/strategy_profile.hpp"
#include "quant/quantization_table.hpp"

namespace vram_sizer {

/**
 * @brief Parameter values chosen by a strategy
 */
struct ServingParameters {
    std::string model;
    double gpu_memory_utilization = 0.85;
    int max_model_len = 2048;
    int max_num_seqs = 16;
    int tensor_parallel_size = 0;   // 0 = single unit, flag omitted
    int swap_space_gb = 4;
    QuantFormat quantization = QuantFormat::FP16;  // primary model; fp16 omits --quantization
    std::string kv_cache_dtype;                      // --kv-cache-dtype value, empty = omitted
};

/**
 * @brief Coarse, advisory performance estimates
 */
struct PerformanceMetrics {
    std::string throughput;
    std::string latency;
    std::string memory_usage;
};

struct Configuration {
    OptimizationTarget type = OptimizationTarget::BALANCED;
    std::string title;
    std::string description;
    std::vector<CommandParameter> parameters;
    PerformanceMetrics metrics;
    std::string command;
    std::vector<std::string> considerations;

    ServingParameters chosen;
    VRAMBreakdown breakdown;        // breakdown at the chosen parameters
    bool degraded = false;          // fixed fallback values were used
    std::string fallback_reason;
    bool memory_constrained = false;  // even the smallest candidate oversubscribes
};

// Runs one strategy; never throws. Internal failures yield the fixed
// fallback configuration for the strategy with degraded = true.
Configuration optimize_configuration(
    const HardwareInventory& inventory,
    const std::vector<ModelSpec>& models,
    OptimizationTarget target,
    const EngineSettings& settings = EngineSettings{}
);

// Throughput, latency and balanced, in that order. Empty when the inventory
// or the model list is empty.
std::vector<Configuration> optimize_all(
    const HardwareInventory& inventory,
    const std::vector<ModelSpec>& models,
    const EngineSettings& settings = EngineSettings{}
);

Configuration fallback_configuration(
    OptimizationTarget target,
    int total_unit_count,
    const std::string& model_id,
    const std::string& reason,
    const EngineSettings& settings = EngineSettings{},
    QuantFormat quantization = QuantFormat::FP16
);

std::vector<CommandParameter> build_parameter_list(const ServingParameters& chosen);

} // namespace vram_sizer
