#pragma once
#include <string>
#include <vector>

namespace vram_sizer {

enum class MemoryPressure {
    UNKNOWN,
    LOW,
    MODERATE,
    HIGH,
    CRITICAL
};

std::string memory_pressure_to_string(MemoryPressure pressure);

// Ratio of total model size to total VRAM; UNKNOWN when there is no VRAM.
MemoryPressure classify_memory_pressure(double total_model_size_gb, double total_vram_gb);

struct ConfigurationHealth {
    std::string status = "healthy";   // healthy | warning | critical
    std::vector<std::string> issues;
};

ConfigurationHealth assess_configuration_health(
    double total_model_size_gb,
    double total_vram_gb,
    int total_unit_count
);

/**
 * @brief Swap space (CPU offload for preempted sequences) in GiB
 *
 * ratio * VRAM, at least max(1, 10% of model size), at most min(16, 25% of VRAM).
 */
double calculate_swap_space_gb(double total_vram_gb, double model_size_gb, double swap_ratio);

} // namespace vram_sizer
