#pragma once

#include <string>
#include <vector>

#include "core/engine_settings.hpp"
#include "core/model_spec.hpp"

namespace vram_sizer {

/**
 * @brief Candidate serving shape checked against the breakdown.
 * Zero fields fall back to BreakdownSettings defaults.
 */
struct BreakdownCandidate {
    int max_num_seqs = 0;
    int max_model_len = 0;
};

/**
 * @brief Accounting of total accelerator memory, all in GiB
 *
 * When the components fit, used + available == total. When they do not,
 * available is floored at 0 and oversubscribed_gb carries the deficit so
 * that used - oversubscribed_gb == total.
 */
struct VRAMBreakdown {
    double model_weights_gb = 0.0;
    double kv_cache_gb = 0.0;
    double activations_gb = 0.0;
    double system_overhead_gb = 0.0;
    double available_gb = 0.0;
    double total_vram_gb = 0.0;
    double oversubscribed_gb = 0.0;

    double used_gb() const {
        return model_weights_gb + kv_cache_gb + activations_gb + system_overhead_gb;
    }
    double available_fraction() const {
        return (total_vram_gb > 0.0) ? available_gb / total_vram_gb : 0.0;
    }
};

enum class BreakdownStatus {
    PRECISE,       // computed from the per-model estimators
    DEGRADED,      // fixed-ratio fallback after a computation failure
    UNAVAILABLE    // no hardware or no models selected
};

std::string breakdown_status_to_string(BreakdownStatus status);

struct BreakdownResult {
    BreakdownStatus status = BreakdownStatus::UNAVAILABLE;
    VRAMBreakdown breakdown;
    std::string message;

    bool has_value() const { return status != BreakdownStatus::UNAVAILABLE; }
    bool precise() const { return status == BreakdownStatus::PRECISE; }
};

BreakdownResult compute_breakdown(
    double total_vram_gb,
    const std::vector<ModelSpec>& models,
    const BreakdownCandidate& candidate = BreakdownCandidate{},
    const BreakdownSettings& settings = BreakdownSettings{}
);

// Fixed-ratio estimate from aggregate model size only; never throws.
VRAMBreakdown conservative_breakdown(
    double total_vram_gb,
    double total_model_size_gb,
    const BreakdownSettings& settings = BreakdownSettings{}
);

} // namespace vram_sizer
