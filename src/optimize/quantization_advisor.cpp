#include "optimize/quantization_advisor.hpp"

#include "command/command_formatter.hpp"
#include "memory/model_memory.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>

namespace vram_sizer {

namespace {

bool select_candidate(QuantFormat current, double quality_tolerance, QuantFormat& out) {
    const QuantInfo& cur = lookup_quantization(current);
    bool found = false;
    QuantInfo best;
    for (QuantFormat f : supported_quant_formats()) {
        const QuantInfo& info = lookup_quantization(f);
        if (info.memory_factor >= cur.memory_factor) continue;
        if (info.quality_loss > quality_tolerance) continue;
        if (!found ||
            info.memory_factor < best.memory_factor ||
            (info.memory_factor == best.memory_factor && info.quality_loss < best.quality_loss)) {
            best = info;
            found = true;
        }
    }
    if (found) {
        out = best.format;
    }
    return found;
}

} // namespace

AdvisorResult recommend_quantization(
    double total_vram_gb,
    const ModelSpec& model,
    const AdvisorSettings& settings,
    bool constraint_violation
) {
    AdvisorResult result;
    if (!std::isfinite(total_vram_gb) || total_vram_gb <= 0.0) {
        result.message = "no accelerator memory";
        return result;
    }
    if (!std::isfinite(model.size_gb) || model.size_gb < 0.0 || model.parameters < 0) {
        result.message = "invalid model size";
        Logger::get().warn("quantization advice skipped for %s: invalid size", model.name.c_str());
        return result;
    }
    if (model.size_gb <= 0.0 && model.parameters <= 0) {
        result.message = "model size unknown";
        return result;
    }

    const double params = effective_parameters(model);
    const double current_gb = weight_memory_gb(params, model.quantization);
    const double pressure = current_gb / total_vram_gb;

    if (pressure <= settings.target_memory_utilization && !constraint_violation) {
        result.message = "fits comfortably";
        return result;
    }

    QuantFormat proposed = model.quantization;
    if (!select_candidate(model.quantization, settings.quality_tolerance, proposed)) {
        result.message = "no more compact format within quality tolerance";
        return result;
    }

    const double billions = params / 1.0e9;
    QuantizationRecommendation& rec = result.recommendation;
    rec.model_name = model.name;
    rec.current_format = model.quantization;
    rec.recommended_format = proposed;
    const double proposed_gb = weight_memory_gb(params, proposed);
    const QuantInfo& proposed_info = lookup_quantization(proposed);
    rec.memory_savings_gb = std::max(0.0, current_gb - proposed_gb);
    rec.overhead_gb = proposed_gb * proposed_info.overhead;
    rec.quality_impact = estimate_quality_impact(proposed, billions);
    rec.weight_pressure = pressure;
    rec.reason = "Weights need " + format_decimal(current_gb, 1) + " GB (" +
                 format_decimal(pressure * 100.0, 0) + "% of " + format_decimal(total_vram_gb, 1) +
                 " GB VRAM) in " + quant_format_to_string(model.quantization) + ". " +
                 proposed_info.description + ": " + quantization_recommendation_text(proposed, billions);
    if (rec.overhead_gb > 0.0) {
        rec.reason += " (plus ~" + format_decimal(rec.overhead_gb, 2) + " GB for quantization scales)";
    }

    result.recommended = true;
    result.message = "recommend " + quant_format_to_string(proposed);
    return result;
}

std::vector<QuantizationRecommendation> recommend_quantizations(
    double total_vram_gb,
    const std::vector<ModelSpec>& models,
    const AdvisorSettings& settings,
    bool constraint_violation
) {
    std::vector<QuantizationRecommendation> recs;
    for (const auto& model : models) {
        AdvisorResult r = recommend_quantization(total_vram_gb, model, settings, constraint_violation);
        if (r.recommended) {
            recs.push_back(r.recommendation);
        }
    }
    return recs;
}

} // namespace vram_sizer
