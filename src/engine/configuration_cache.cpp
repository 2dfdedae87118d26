#include "engine/configuration_cache.hpp"

#include "command/command_formatter.hpp"

#include <sstream>

namespace vram_sizer {

std::vector<Configuration> ConfigurationCache::get_or_compute(const std::string& key, const Compute& compute) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }
    std::vector<Configuration> value = compute();
    ++computations_;
    entries_.emplace(key, value);
    return value;
}

bool ConfigurationCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(key) != entries_.end();
}

std::size_t ConfigurationCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t ConfigurationCache::computations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return computations_;
}

void ConfigurationCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::string make_cache_key(
    const HardwareInventory& inventory,
    const std::vector<ModelSpec>& models,
    const EngineSettings& settings
) {
    std::ostringstream oss;
    oss << "gpus[";
    for (const auto& sel : inventory.selections()) {
        oss << sel.unit.name.size() << ':' << sel.unit.name << '/'
            << format_decimal(sel.unit.vram_gb, 6) << 'x' << sel.quantity
            << (sel.unit.custom ? "c" : "") << ';';
    }
    oss << "]models[";
    for (const auto& m : models) {
        oss << m.name.size() << ':' << m.name << '/'
            << m.hf_id.size() << ':' << m.hf_id << '/'
            << format_decimal(m.size_gb, 6) << '/' << m.parameters << '/'
            << quant_format_to_string(m.quantization) << ';';
    }
    oss << "]settings["
        << format_decimal(settings.breakdown.activation_factor, 6) << '/'
        << format_decimal(settings.breakdown.overhead_factor, 6) << '/'
        << settings.breakdown.default_max_num_seqs << '/'
        << settings.breakdown.default_max_model_len << '/'
        << quant_format_to_string(settings.breakdown.kv_cache_dtype) << '/'
        << settings.entrypoint << ']';
    return oss.str();
}

} // namespace vram_sizer
