#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/engine_settings.hpp"
#include "core/hardware.hpp"
#include "core/model_spec.hpp"
#include "optimize/configuration_optimizer.hpp"

namespace vram_sizer {

/**
 * @brief Caller-owned memo of optimizer output
 *
 * get_or_compute holds the lock while computing, so each key is computed at
 * most once. Entries live until clear().
 */
class ConfigurationCache {
public:
    using Compute = std::function<std::vector<Configuration>()>;

    std::vector<Configuration> get_or_compute(const std::string& key, const Compute& compute);

    bool contains(const std::string& key) const;
    std::size_t size() const;
    std::size_t computations() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Configuration>> entries_;
    std::size_t computations_ = 0;
};

// Lossless key over every unit (name, VRAM, quantity, custom), every model
// (name, hf_id, size, parameters, quantization) and the settings that shape
// the output.
std::string make_cache_key(
    const HardwareInventory& inventory,
    const std::vector<ModelSpec>& models,
    const EngineSettings& settings
);

} // namespace vram_sizer
