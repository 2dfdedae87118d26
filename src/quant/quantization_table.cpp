#include "quant/quantization_table.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace vram_sizer {

namespace {

constexpr QuantInfo kQuantTable[] = {
    {QuantFormat::FP32, 32, 4.0, 1.0,   0.00, 0.00, "Full 32-bit floating point precision"},
    {QuantFormat::FP16, 16, 2.0, 0.5,   0.02, 0.00, "16-bit floating point (recommended default)"},
    {QuantFormat::BF16, 16, 2.0, 0.5,   0.01, 0.00, "Brain Float 16 (better numerical stability than fp16)"},
    {QuantFormat::INT8,  8, 1.0, 0.25,  0.05, 0.02, "Dynamic 8-bit integer quantization"},
    {QuantFormat::INT4,  4, 0.5, 0.125, 0.15, 0.03, "Static 4-bit integer quantization"},
    {QuantFormat::AWQ,   4, 0.5, 0.125, 0.03, 0.01, "Activation-aware Weight Quantization (4-bit)"},
    {QuantFormat::GPTQ,  4, 0.5, 0.125, 0.05, 0.02, "GPTQ post-training quantization (4-bit)"},
    {QuantFormat::GGML,  4, 0.5, 0.125, 0.08, 0.02, "GGML/GGUF quantization format"},
};

constexpr std::size_t kFp16Index = 1;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool parse_format(const std::string& raw, QuantFormat& out) {
    const std::string name = to_lower(strip(raw));
    if (name == "fp32" || name == "float32") { out = QuantFormat::FP32; return true; }
    if (name == "fp16" || name == "float16" || name == "half") { out = QuantFormat::FP16; return true; }
    if (name == "bf16" || name == "bfloat16") { out = QuantFormat::BF16; return true; }
    if (name == "int8") { out = QuantFormat::INT8; return true; }
    if (name == "int4") { out = QuantFormat::INT4; return true; }
    if (name == "awq")  { out = QuantFormat::AWQ;  return true; }
    if (name == "gptq") { out = QuantFormat::GPTQ; return true; }
    if (name == "ggml" || name == "gguf") { out = QuantFormat::GGML; return true; }
    return false;
}

} // namespace

const QuantInfo& lookup_quantization(QuantFormat format) {
    for (const QuantInfo& info : kQuantTable) {
        if (info.format == format) {
            return info;
        }
    }
    return kQuantTable[kFp16Index];
}

const QuantInfo& lookup_quantization(const std::string& name) {
    return lookup_quantization(string_to_quant_format(name));
}

std::string quant_format_to_string(QuantFormat format) {
    switch (format) {
        case QuantFormat::FP32: return "fp32";
        case QuantFormat::FP16: return "fp16";
        case QuantFormat::BF16: return "bf16";
        case QuantFormat::INT8: return "int8";
        case QuantFormat::INT4: return "int4";
        case QuantFormat::AWQ:  return "awq";
        case QuantFormat::GPTQ: return "gptq";
        case QuantFormat::GGML: return "ggml";
        default:                return "fp16";
    }
}

QuantFormat string_to_quant_format(const std::string& name) {
    QuantFormat format = QuantFormat::FP16;
    if (!parse_format(name, format)) {
        return QuantFormat::FP16;  // default
    }
    return format;
}

bool is_known_quant_format(const std::string& name) {
    QuantFormat ignored;
    return parse_format(name, ignored);
}

std::vector<QuantFormat> supported_quant_formats() {
    std::vector<QuantFormat> formats;
    for (const QuantInfo& info : kQuantTable) {
        formats.push_back(info.format);
    }
    return formats;
}

std::vector<QuantInfo> compare_quant_formats(const std::vector<QuantFormat>& formats) {
    std::vector<QuantInfo> infos;
    infos.reserve(formats.size());
    for (QuantFormat f : formats) {
        infos.push_back(lookup_quantization(f));
    }
    std::stable_sort(infos.begin(), infos.end(), [](const QuantInfo& a, const QuantInfo& b) {
        return a.memory_factor < b.memory_factor;
    });
    return infos;
}

QualityImpact estimate_quality_impact(QuantFormat format, double params_billions) {
    const QuantInfo& info = lookup_quantization(format);

    // Larger models tolerate quantization better.
    const double size_multiplier = (params_billions >= 7.0) ? 0.8 : 1.2;
    const double adjusted = info.quality_loss * size_multiplier;

    QualityImpact impact;
    impact.format = info.format;
    impact.quality_loss = std::round(adjusted * 100.0) / 100.0;
    if (adjusted > 0.10) {
        impact.severity = "high";
    } else if (adjusted > 0.05) {
        impact.severity = "medium";
    } else {
        impact.severity = "low";
    }
    impact.recommendation = quantization_recommendation_text(format, params_billions);
    return impact;
}

std::string quantization_recommendation_text(QuantFormat format, double params_billions) {
    const QuantInfo& info = lookup_quantization(format);
    const long savings_pct = std::lround((1.0 - info.memory_factor) * 100.0);

    std::ostringstream oss;
    switch (info.format) {
        case QuantFormat::FP32:
            return "Use only for research or when maximum precision is required";
        case QuantFormat::FP16:
        case QuantFormat::BF16:
            return "Recommended for most production deployments with good balance of speed and quality";
        case QuantFormat::AWQ:
            oss << "Excellent for " << (params_billions >= 7.0 ? "large" : "smaller")
                << " models, ~" << savings_pct << "% memory savings with minimal quality loss";
            return oss.str();
        case QuantFormat::GPTQ:
            oss << "Good for memory-constrained environments, " << savings_pct << "% memory reduction";
            return oss.str();
        case QuantFormat::INT8:
            return "Use when memory is very limited, may impact quality on smaller models";
        case QuantFormat::INT4:
            return "Extreme memory savings but significant quality trade-offs for most models";
        default:
            oss << savings_pct << "% memory savings - evaluate quality trade-offs for your use case";
            return oss.str();
    }
}

} // namespace vram_sizer
