#include "memory/vram_breakdown.hpp"

#include "memory/model_memory.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace vram_sizer {

namespace {

constexpr double kFallbackKvRatio = 0.3;
constexpr double kFallbackActivationRatio = 0.15;

void close_breakdown(VRAMBreakdown& b) {
    const double used = b.used_gb();
    const double residual = b.total_vram_gb - used;
    b.available_gb = std::max(0.0, residual);
    b.oversubscribed_gb = std::max(0.0, -residual);
}

void require_finite(double value, const char* what) {
    if (!std::isfinite(value) || value < 0.0) {
        std::ostringstream oss;
        oss << "invalid " << what << " (" << value << ")";
        throw std::domain_error(oss.str());
    }
}

VRAMBreakdown precise_breakdown(
    double total_vram_gb,
    const std::vector<ModelSpec>& models,
    const BreakdownCandidate& candidate,
    const BreakdownSettings& settings
) {
    const int seqs = (candidate.max_num_seqs > 0) ? candidate.max_num_seqs : settings.default_max_num_seqs;
    const int seq_len = (candidate.max_model_len > 0) ? candidate.max_model_len : settings.default_max_model_len;

    VRAMBreakdown b;
    b.total_vram_gb = total_vram_gb;
    for (const auto& model : models) {
        require_finite(model.size_gb, "model size");
        if (model.parameters < 0) {
            throw std::domain_error("negative parameter count for model " + model.name);
        }
        const double params = effective_parameters(model);
        b.model_weights_gb += weight_memory_gb(params, model.quantization);
        b.kv_cache_gb += kv_cache_memory_gb(params, seqs, seq_len, settings.kv_cache_dtype);
    }
    b.activations_gb = b.model_weights_gb * settings.activation_factor;
    b.system_overhead_gb = total_vram_gb * settings.overhead_factor;

    require_finite(b.model_weights_gb, "weight memory");
    require_finite(b.kv_cache_gb, "kv cache memory");
    require_finite(b.activations_gb, "activation memory");
    require_finite(b.system_overhead_gb, "system overhead");

    close_breakdown(b);
    return b;
}

} // namespace

std::string breakdown_status_to_string(BreakdownStatus status) {
    switch (status) {
        case BreakdownStatus::PRECISE:     return "precise";
        case BreakdownStatus::DEGRADED:    return "degraded";
        case BreakdownStatus::UNAVAILABLE: return "unavailable";
        default:                           return "unavailable";
    }
}

VRAMBreakdown conservative_breakdown(
    double total_vram_gb,
    double total_model_size_gb,
    const BreakdownSettings& settings
) {
    const double total = std::isfinite(total_vram_gb) ? std::max(0.0, total_vram_gb) : 0.0;
    const double size = std::isfinite(total_model_size_gb) ? std::max(0.0, total_model_size_gb) : 0.0;
    const double overhead_factor = std::isfinite(settings.overhead_factor) ? settings.overhead_factor : 0.08;

    VRAMBreakdown b;
    b.total_vram_gb = total;
    b.model_weights_gb = size;
    b.kv_cache_gb = size * kFallbackKvRatio;
    b.activations_gb = size * kFallbackActivationRatio;
    b.system_overhead_gb = total * overhead_factor;
    close_breakdown(b);
    return b;
}

BreakdownResult compute_breakdown(
    double total_vram_gb,
    const std::vector<ModelSpec>& models,
    const BreakdownCandidate& candidate,
    const BreakdownSettings& settings
) {
    BreakdownResult result;
    if (models.empty()) {
        result.message = "no models selected";
        return result;
    }
    if (!std::isfinite(total_vram_gb) || total_vram_gb <= 0.0) {
        result.message = "no accelerator memory selected";
        return result;
    }

    try {
        result.breakdown = precise_breakdown(total_vram_gb, models, candidate, settings);
        result.status = BreakdownStatus::PRECISE;
        result.message = (result.breakdown.oversubscribed_gb > 0.0) ? "oversubscribed" : "ok";
    } catch (const std::exception& e) {
        double size = 0.0;
        for (const auto& m : models) {
            if (std::isfinite(m.size_gb) && m.size_gb > 0.0) {
                size += m.size_gb;
            }
        }
        result.breakdown = conservative_breakdown(total_vram_gb, size, settings);
        result.status = BreakdownStatus::DEGRADED;
        result.message = std::string("fallback estimate: ") + e.what();
        Logger::get().warn("vram breakdown degraded: %s", e.what());
    }
    return result;
}

} // namespace vram_sizer
