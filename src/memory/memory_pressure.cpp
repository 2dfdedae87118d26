#include "memory/memory_pressure.hpp"

#include <algorithm>
#include <cmath>

namespace vram_sizer {

namespace {
constexpr int kExcessiveUnitCount = 16;
constexpr double kSwapCapGB = 16.0;
}

std::string memory_pressure_to_string(MemoryPressure pressure) {
    switch (pressure) {
        case MemoryPressure::LOW:      return "low";
        case MemoryPressure::MODERATE: return "moderate";
        case MemoryPressure::HIGH:     return "high";
        case MemoryPressure::CRITICAL: return "critical";
        case MemoryPressure::UNKNOWN:
        default:                       return "unknown";
    }
}

MemoryPressure classify_memory_pressure(double total_model_size_gb, double total_vram_gb) {
    if (!(total_vram_gb > 0.0) || !std::isfinite(total_model_size_gb)) {
        return MemoryPressure::UNKNOWN;
    }
    const double ratio = total_model_size_gb / total_vram_gb;
    if (ratio > 0.9) return MemoryPressure::CRITICAL;
    if (ratio > 0.8) return MemoryPressure::HIGH;
    if (ratio > 0.6) return MemoryPressure::MODERATE;
    return MemoryPressure::LOW;
}

ConfigurationHealth assess_configuration_health(
    double total_model_size_gb,
    double total_vram_gb,
    int total_unit_count
) {
    ConfigurationHealth health;
    if (classify_memory_pressure(total_model_size_gb, total_vram_gb) == MemoryPressure::CRITICAL) {
        health.issues.push_back("Critical memory pressure - models may not fit");
    }
    if (total_unit_count > kExcessiveUnitCount) {
        health.issues.push_back("Excessive GPU count may impact performance");
    }
    if (total_model_size_gb > total_vram_gb * 0.9) {
        health.issues.push_back("Model size approaching VRAM limits");
    }

    if (total_unit_count > kExcessiveUnitCount) {
        health.status = "critical";
    } else if (health.issues.size() == 1) {
        health.status = "warning";
    } else if (health.issues.size() > 1) {
        health.status = "critical";
    }
    return health;
}

double calculate_swap_space_gb(double total_vram_gb, double model_size_gb, double swap_ratio) {
    const double vram = std::max(0.0, total_vram_gb);
    const double max_swap = std::min(kSwapCapGB, vram * 0.25);
    const double min_swap = std::max(1.0, std::max(0.0, model_size_gb) * 0.1);
    return std::min(max_swap, std::max(min_swap, vram * swap_ratio));
}

} // namespace vram_sizer
