#pragma once
#include <string>
#include <vector>

#include "core/engine_settings.hpp"
#include "core/model_spec.hpp"
#include "quant/quantization_table.hpp"

namespace vram_sizer {

struct QuantizationRecommendation {
    std::string model_name;
    QuantFormat current_format = QuantFormat::FP16;
    QuantFormat recommended_format = QuantFormat::FP16;
    double memory_savings_gb = 0.0;
    double overhead_gb = 0.0;       // scales/zero points the proposed format adds on top
    QualityImpact quality_impact;
    std::string reason;
    double weight_pressure = 0.0;   // weight memory / total VRAM
};

struct AdvisorResult {
    bool recommended = false;
    QuantizationRecommendation recommendation;
    std::string message;
};

/**
 * @brief Propose a more compact format for one model
 *
 * Advice is given when weight memory / VRAM exceeds the target utilization,
 * or when constraint_violation reports that the serving breakdown is
 * oversubscribed. The proposal is the lowest memory factor strictly below
 * the current one whose quality loss stays within the tolerance.
 */
AdvisorResult recommend_quantization(
    double total_vram_gb,
    const ModelSpec& model,
    const AdvisorSettings& settings = AdvisorSettings{},
    bool constraint_violation = false
);

std::vector<QuantizationRecommendation> recommend_quantizations(
    double total_vram_gb,
    const std::vector<ModelSpec>& models,
    const AdvisorSettings& settings = AdvisorSettings{},
    bool constraint_violation = false
);

} // namespace vram_sizer
