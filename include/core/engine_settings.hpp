#pragma once
#include <cmath>
#include <stdexcept>
#include <string>

#include "quant/quantization_table.hpp"

namespace vram_sizer {

// The serving runtime keeps the KV cache in the model dtype (fp16/bf16) or in
// 8-bit fp8, which the int8 entry sizes.
inline bool is_supported_kv_cache_dtype(QuantFormat format) {
    return format == QuantFormat::FP16 || format == QuantFormat::BF16 || format == QuantFormat::INT8;
}

// Value for --kv-cache-dtype, empty when the runtime default applies.
inline std::string kv_cache_dtype_flag_value(QuantFormat format) {
    return (format == QuantFormat::INT8) ? "fp8" : "";
}

/**
 * @brief Heuristic factors for the VRAM breakdown
 */
struct BreakdownSettings {
    double activation_factor = 0.15;     // activations = weights * factor
    double overhead_factor = 0.08;       // system overhead = total VRAM * factor
    int default_max_num_seqs = 16;       // used when no candidate is supplied
    int default_max_model_len = 2048;
    QuantFormat kv_cache_dtype = QuantFormat::FP16;
};

/**
 * @brief Thresholds for the quantization advisor
 */
struct AdvisorSettings {
    double target_memory_utilization = 0.85;  // weights / VRAM above this triggers advice
    double quality_tolerance = 0.10;          // max acceptable quality loss of a proposal
};

/**
 * @brief Complete engine configuration
 */
struct EngineSettings {
    BreakdownSettings breakdown;
    AdvisorSettings advisor;
    std::string entrypoint = "python -m vllm.entrypoints.openai.api_server";
    int log_level = 2;

    /**
     * @brief Validate settings, throws std::invalid_argument if invalid
     */
    void validate() const {
        if (!std::isfinite(breakdown.activation_factor) || breakdown.activation_factor < 0.0) {
            throw std::invalid_argument("activation_factor must be a non-negative number");
        }
        if (!std::isfinite(breakdown.overhead_factor) ||
            breakdown.overhead_factor < 0.0 || breakdown.overhead_factor >= 1.0) {
            throw std::invalid_argument("overhead_factor must be in [0, 1)");
        }
        if (breakdown.default_max_num_seqs < 1) {
            throw std::invalid_argument("default_max_num_seqs must be at least 1");
        }
        if (breakdown.default_max_model_len < 1) {
            throw std::invalid_argument("default_max_model_len must be at least 1");
        }
        if (!is_supported_kv_cache_dtype(breakdown.kv_cache_dtype)) {
            throw std::invalid_argument("kv_cache_dtype must be fp16, bf16 or int8 (served as fp8)");
        }
        if (!(advisor.target_memory_utilization > 0.0 && advisor.target_memory_utilization <= 1.0)) {
            throw std::invalid_argument("target_memory_utilization must be in (0, 1]");
        }
        if (!(advisor.quality_tolerance >= 0.0 && advisor.quality_tolerance <= 1.0)) {
            throw std::invalid_argument("quality_tolerance must be in [0, 1]");
        }
        if (entrypoint.empty()) {
            throw std::invalid_argument("entrypoint must not be empty");
        }
        if (log_level < 0 || log_level > 4) {
            throw std::invalid_argument("log_level must be in [0, 4]");
        }
    }
};

} // namespace vram_sizer
