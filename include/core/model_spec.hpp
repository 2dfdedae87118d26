#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "quant/quantization_table.hpp"

namespace vram_sizer {

constexpr double kDefaultParameterCount = 7.0e9;

struct ModelSpec {
    std::string name;
    std::string hf_id;              // optional repository id used in commands
    double size_gb = 0.0;           // weights at native precision
    std::int64_t parameters = 0;    // 0 = estimate from size_gb
    QuantFormat quantization = QuantFormat::FP16;
    std::string architecture;       // optional tag, e.g. "llama"
};

// Assumes fp16 storage regardless of the declared quantization.
double estimate_parameters_from_size(double size_gb);

// Declared parameter count, or the fp16 size estimate when absent.
double effective_parameters(const ModelSpec& model);

double total_model_size_gb(const std::vector<ModelSpec>& models);
double total_parameters(const std::vector<ModelSpec>& models);

// hf_id, else name, else "MODEL_PATH".
std::string model_identifier(const ModelSpec& model);

} // namespace vram_sizer
