#pragma once
#include <string>
#include <vector>

namespace vram_sizer {

/**
 * @brief Weight/KV encodings understood by the serving runtime
 */
enum class QuantFormat {
    FP32,
    FP16,
    BF16,
    INT8,
    INT4,
    AWQ,
    GPTQ,
    GGML
};

/**
 * @brief Immutable per-format record
 *
 * memory_factor is relative to fp32 (fp16 = 0.5). overhead is the extra
 * fraction some packed formats carry for scales/zero points.
 */
struct QuantInfo {
    QuantFormat format = QuantFormat::FP16;
    int bits_per_param = 16;
    double bytes_per_param = 2.0;
    double memory_factor = 0.5;
    double quality_loss = 0.02;
    double overhead = 0.0;
    const char* description = "";
};

struct QualityImpact {
    QuantFormat format = QuantFormat::FP16;
    double quality_loss = 0.0;
    std::string severity;     // low | medium | high
    std::string recommendation;
};

// Unknown or unparsable formats resolve to the fp16 entry.
const QuantInfo& lookup_quantization(QuantFormat format);
const QuantInfo& lookup_quantization(const std::string& name);

std::string quant_format_to_string(QuantFormat format);
QuantFormat string_to_quant_format(const std::string& name);
bool is_known_quant_format(const std::string& name);

std::vector<QuantFormat> supported_quant_formats();

// Sorted by memory factor, most compact first. Ties keep input order.
std::vector<QuantInfo> compare_quant_formats(const std::vector<QuantFormat>& formats);

QualityImpact estimate_quality_impact(QuantFormat format, double params_billions);

std::string quantization_recommendation_text(QuantFormat format, double params_billions);

} // namespace vram_sizer
