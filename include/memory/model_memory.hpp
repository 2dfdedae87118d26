#pragma once

#include "quant/quantization_table.hpp"

namespace vram_sizer {

constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;

/**
 * @brief Transformer shape inferred from a parameter count
 */
struct InferredArchitecture {
    int layers = 0;
    int hidden_size = 0;
};

// layers = floor(sqrt(params / 1e6)) unless layer_hint > 0; hidden size
// from params ~= 12 * layers * hidden^2. Throws std::domain_error when either
// dimension does not fit in an int.
InferredArchitecture infer_architecture(double parameters, int layer_hint = 0);

double weight_memory_gb(double parameters, QuantFormat format);

// 2 (K and V) * seqs * seq_len * layers * hidden * bytes(kv_precision), in GiB.
double kv_cache_memory_gb(
    double parameters,
    int max_num_seqs,
    int max_model_len,
    QuantFormat kv_precision = QuantFormat::FP16,
    int layer_hint = 0
);

} // namespace vram_sizer
