#pragma once
#include <iosfwd>
#include <vector>

#include "core/engine_settings.hpp"
#include "core/hardware.hpp"
#include "core/model_spec.hpp"
#include "engine/configuration_cache.hpp"
#include "memory/memory_pressure.hpp"
#include "memory/vram_breakdown.hpp"
#include "optimize/configuration_optimizer.hpp"
#include "optimize/quantization_advisor.hpp"

namespace vram_sizer {

struct SizingReport {
    bool has_valid_configuration = false;
    double total_vram_gb = 0.0;
    int total_unit_count = 0;
    double total_model_size_gb = 0.0;

    std::vector<Configuration> configurations;      // empty or exactly three
    BreakdownResult breakdown;                      // UNAVAILABLE when inputs are incomplete
    std::vector<QuantizationRecommendation> recommendations;
    MemoryPressure memory_pressure = MemoryPressure::UNKNOWN;
    ConfigurationHealth health;
};

/**
 * @brief Pure evaluation of an inventory and model list
 *
 * Holds no mutable state of its own. When a cache is supplied, the
 * configurations are memoized under make_cache_key(); the caller clears it.
 */
class SizingEngine {
public:
    explicit SizingEngine(EngineSettings settings = EngineSettings{}, ConfigurationCache* cache = nullptr);

    SizingReport evaluate(const HardwareInventory& inventory, const std::vector<ModelSpec>& models) const;

    const EngineSettings& settings() const { return settings_; }

private:
    EngineSettings settings_;
    ConfigurationCache* cache_;
};

void print_sizing_report(std::ostream& os, const SizingReport& report);

} // namespace vram_sizer
