#pragma once
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/engine_settings.hpp"
#include "core/hardware.hpp"
#include "core/model_spec.hpp"

namespace vram_sizer {

/**
 * @brief Everything one sizing run consumes
 */
struct SizingRequest {
    EngineSettings settings;
    HardwareInventory inventory;
    std::vector<ModelSpec> models;

    /**
     * @brief Validate request, throws std::invalid_argument if invalid
     *
     * Empty inventories and model lists are valid; they produce an empty report.
     */
    void validate() const {
        settings.validate();
        if (!validate_selections(inventory.selections())) {
            throw std::invalid_argument(
                "accelerator selections need a unique name, vram_gb > 0 and quantity in [1, 8]");
        }
        for (const auto& m : models) {
            if (m.name.empty()) {
                throw std::invalid_argument("model name must not be empty");
            }
            if (!std::isfinite(m.size_gb) || m.size_gb < 0.0) {
                throw std::invalid_argument("model " + m.name + ": size_gb must be non-negative");
            }
            if (m.parameters < 0) {
                throw std::invalid_argument("model " + m.name + ": parameters must be non-negative");
            }
            if (m.size_gb <= 0.0 && m.parameters <= 0) {
                throw std::invalid_argument("model " + m.name + ": size_gb or parameters is required");
            }
        }
    }
};

} // namespace vram_sizer
