#include "core/model_spec.hpp"

#include <cmath>

namespace vram_sizer {

double estimate_parameters_from_size(double size_gb) {
    if (!(size_gb > 0.0)) {
        return kDefaultParameterCount;
    }
    return std::round(size_gb * 1024.0 * 1024.0 * 1024.0 / 2.0);
}

double effective_parameters(const ModelSpec& model) {
    if (model.parameters > 0) {
        return static_cast<double>(model.parameters);
    }
    return estimate_parameters_from_size(model.size_gb);
}

double total_model_size_gb(const std::vector<ModelSpec>& models) {
    double total = 0.0;
    for (const auto& m : models) {
        total += m.size_gb;
    }
    return total;
}

double total_parameters(const std::vector<ModelSpec>& models) {
    double total = 0.0;
    for (const auto& m : models) {
        total += effective_parameters(m);
    }
    return total;
}

std::string model_identifier(const ModelSpec& model) {
    if (!model.hf_id.empty()) return model.hf_id;
    if (!model.name.empty()) return model.name;
    return "MODEL_PATH";
}

} // namespace vram_sizer
