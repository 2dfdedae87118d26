#include "memory/model_memory.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace vram_sizer {

namespace {

constexpr int kFallbackLayers = 32;
constexpr int kFallbackHidden = 4096;
constexpr double kParamsPerLayerHidden2 = 12.0;
constexpr double kMaxDimension = static_cast<double>(std::numeric_limits<int>::max());

} // namespace

InferredArchitecture infer_architecture(double parameters, int layer_hint) {
    InferredArchitecture arch;
    if (!(parameters > 0.0) || !std::isfinite(parameters)) {
        arch.layers = (layer_hint > 0) ? layer_hint : kFallbackLayers;
        arch.hidden_size = kFallbackHidden;
        return arch;
    }

    int layers = layer_hint;
    if (layers <= 0) {
        const double estimated = std::floor(std::sqrt(parameters / 1.0e6));
        if (estimated > kMaxDimension) {
            throw std::domain_error("parameter count out of range for layer estimate");
        }
        layers = static_cast<int>(estimated);
    }
    if (layers <= 0) {
        layers = kFallbackLayers;
    }

    const double hidden = std::floor(std::sqrt(parameters / (kParamsPerLayerHidden2 * layers)));
    if (hidden > kMaxDimension) {
        throw std::domain_error("parameter count out of range for hidden size estimate");
    }
    arch.layers = layers;
    arch.hidden_size = std::max(1, static_cast<int>(hidden));
    return arch;
}

double weight_memory_gb(double parameters, QuantFormat format) {
    const QuantInfo& info = lookup_quantization(format);
    return parameters * info.bytes_per_param / kBytesPerGiB;
}

double kv_cache_memory_gb(
    double parameters,
    int max_num_seqs,
    int max_model_len,
    QuantFormat kv_precision,
    int layer_hint
) {
    if (max_num_seqs <= 0 || max_model_len <= 0) {
        return 0.0;
    }
    const InferredArchitecture arch = infer_architecture(parameters, layer_hint);
    const QuantInfo& info = lookup_quantization(kv_precision);

    const double per_token_bytes =
        2.0 * static_cast<double>(arch.layers) * static_cast<double>(arch.hidden_size) * info.bytes_per_param;
    const double tokens = static_cast<double>(max_num_seqs) * static_cast<double>(max_model_len);
    return std::max(0.0, tokens * per_token_bytes / kBytesPerGiB);
}

} // namespace vram_sizer
