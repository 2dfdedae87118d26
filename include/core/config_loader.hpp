#pragma once
#include "core/sizing_request.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace vram_sizer {

/**
 * @brief Configuration section holding key-value pairs
 */
struct ConfigSection {
    std::unordered_map<std::string, std::string> values;

    std::string get(const std::string& key, const std::string& default_val = "") const {
        auto it = values.find(key);
        return (it != values.end()) ? it->second : default_val;
    }

    double get_double(const std::string& key, double default_val = 0.0) const {
        auto it = values.find(key);
        if (it != values.end()) {
            try {
                return std::stod(it->second);
            } catch (const std::exception&) {
                return default_val;
            }
        }
        return default_val;
    }

    int get_int(const std::string& key, int default_val = 0) const {
        auto it = values.find(key);
        if (it != values.end()) {
            try {
                return std::stoi(it->second);
            } catch (const std::exception&) {
                return default_val;
            }
        }
        return default_val;
    }

    bool get_bool(const std::string& key, bool default_val = false) const {
        auto it = values.find(key);
        if (it != values.end()) {
            std::string val = it->second;
            std::transform(val.begin(), val.end(), val.begin(), ::tolower);
            return (val == "true" || val == "1" || val == "yes" || val == "on");
        }
        return default_val;
    }

    bool has(const std::string& key) const {
        return values.find(key) != values.end();
    }
};

/**
 * @brief Simple key-value configuration file parser
 *
 * File format (INI-style with sections, section order is preserved):
 * ```
 * [engine]
 * activation_factor = 0.15
 * overhead_factor = 0.08
 * kv_cache_dtype = fp16
 *
 * [gpu.A100-80GB]
 * vram_gb = 80
 * quantity = 2
 *
 * [model.Llama-2-7B]
 * size_gb = 13.5
 * quantization = fp16
 * hf_id = meta-llama/Llama-2-7b-hf
 * ```
 */
class ConfigLoader {
public:
    std::unordered_map<std::string, ConfigSection> sections;
    std::vector<std::string> section_order;

    /**
     * @brief Load configuration from file
     */
    bool load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }
        return parse(file);
    }

    /**
     * @brief Parse configuration text from a stream
     */
    bool parse(std::istream& in) {
        sections.clear();
        section_order.clear();
        std::string current_section = "default";

        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                current_section = trim(line.substr(1, line.length() - 2));
                touch_section(current_section);
                continue;
            }

            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = trim(line.substr(0, pos));
                std::string value = trim(line.substr(pos + 1));

                // Remove quotes if present
                if (value.size() >= 2 &&
                    ((value.front() == '"' && value.back() == '"') ||
                     (value.front() == '\'' && value.back() == '\''))) {
                    value = value.substr(1, value.length() - 2);
                }

                touch_section(current_section);
                sections[current_section].values[key] = value;
            }
        }

        return true;
    }

    /**
     * @brief Get section by name
     */
    ConfigSection get_section(const std::string& name) const {
        auto it = sections.find(name);
        if (it != sections.end()) {
            return it->second;
        }
        return ConfigSection{};
    }

    bool has_section(const std::string& name) const {
        return sections.find(name) != sections.end();
    }

    /**
     * @brief Names of sections starting with prefix, in file order, prefix stripped
     */
    std::vector<std::string> sections_with_prefix(const std::string& prefix) const {
        std::vector<std::string> names;
        for (const auto& name : section_order) {
            if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
                names.push_back(name.substr(prefix.size()));
            }
        }
        return names;
    }

private:
    void touch_section(const std::string& name) {
        if (sections.find(name) == sections.end()) {
            sections[name] = ConfigSection{};
            section_order.push_back(name);
        }
    }

    static std::string trim(const std::string& str) {
        size_t start = 0;
        while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
            ++start;
        }
        if (start == str.length()) {
            return "";
        }

        size_t end = str.length() - 1;
        while (end > start && std::isspace(static_cast<unsigned char>(str[end]))) {
            --end;
        }

        return str.substr(start, end - start + 1);
    }
};

inline QuantFormat parse_quant_setting(const std::string& raw, const std::string& where) {
    if (!raw.empty() && !is_known_quant_format(raw)) {
        Logger::get().warn("%s: unknown quantization '%s', using fp16", where.c_str(), raw.c_str());
    }
    return string_to_quant_format(raw);
}

/**
 * @brief Build a SizingRequest from parsed sections
 */
inline SizingRequest sizing_request_from_loader(const ConfigLoader& loader) {
    SizingRequest request;

    // [engine] section
    ConfigSection engine_sec = loader.get_section("engine");
    BreakdownSettings& bd = request.settings.breakdown;
    bd.activation_factor = engine_sec.get_double("activation_factor", bd.activation_factor);
    bd.overhead_factor = engine_sec.get_double("overhead_factor", bd.overhead_factor);
    bd.default_max_num_seqs = engine_sec.get_int("default_max_num_seqs", bd.default_max_num_seqs);
    bd.default_max_model_len = engine_sec.get_int("default_max_model_len", bd.default_max_model_len);
    if (engine_sec.has("kv_cache_dtype")) {
        bd.kv_cache_dtype = parse_quant_setting(engine_sec.get("kv_cache_dtype"), "engine.kv_cache_dtype");
    }
    AdvisorSettings& adv = request.settings.advisor;
    adv.target_memory_utilization = engine_sec.get_double("target_memory_utilization", adv.target_memory_utilization);
    adv.quality_tolerance = engine_sec.get_double("quality_tolerance", adv.quality_tolerance);
    request.settings.entrypoint = engine_sec.get("entrypoint", request.settings.entrypoint);
    request.settings.log_level = engine_sec.get_int("log_level", request.settings.log_level);

    // [gpu.<name>] sections
    std::vector<AcceleratorSelection> selections;
    for (const auto& name : loader.sections_with_prefix("gpu.")) {
        ConfigSection sec = loader.get_section("gpu." + name);
        AcceleratorSelection sel;
        sel.unit.name = name;
        sel.unit.vram_gb = sec.get_double("vram_gb", 0.0);
        sel.unit.custom = sec.get_bool("custom", false);
        sel.quantity = sec.get_int("quantity", 1);
        selections.push_back(sel);
    }
    request.inventory = HardwareInventory(selections);

    // [model.<name>] sections
    for (const auto& name : loader.sections_with_prefix("model.")) {
        ConfigSection sec = loader.get_section("model." + name);
        ModelSpec model;
        model.name = name;
        model.hf_id = sec.get("hf_id", "");
        model.size_gb = sec.get_double("size_gb", 0.0);
        model.parameters = static_cast<std::int64_t>(sec.get_double("parameters", 0.0));
        model.quantization = parse_quant_setting(sec.get("quantization", "fp16"), "model." + name);
        model.architecture = sec.get("architecture", "");
        request.models.push_back(model);
    }

    return request;
}

/**
 * @brief Load SizingRequest from file
 */
inline SizingRequest load_sizing_request(const std::string& filename) {
    ConfigLoader loader;
    if (!loader.load(filename)) {
        throw std::runtime_error("Failed to load configuration file: " + filename);
    }
    return sizing_request_from_loader(loader);
}

/**
 * @brief Save SizingRequest to file
 */
inline bool save_sizing_request(const std::string& filename, const SizingRequest& request) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    const EngineSettings& s = request.settings;
    file << "# VRAM sizing request\n";
    file << "# Auto-generated by vram_sizer\n\n";

    file << "[engine]\n";
    file << "activation_factor = " << s.breakdown.activation_factor << "\n";
    file << "overhead_factor = " << s.breakdown.overhead_factor << "\n";
    file << "default_max_num_seqs = " << s.breakdown.default_max_num_seqs << "\n";
    file << "default_max_model_len = " << s.breakdown.default_max_model_len << "\n";
    file << "kv_cache_dtype = " << quant_format_to_string(s.breakdown.kv_cache_dtype) << "\n";
    file << "target_memory_utilization = " << s.advisor.target_memory_utilization << "\n";
    file << "quality_tolerance = " << s.advisor.quality_tolerance << "\n";
    file << "entrypoint = " << s.entrypoint << "\n";
    file << "log_level = " << s.log_level << "\n\n";

    for (const auto& sel : request.inventory.selections()) {
        file << "[gpu." << sel.unit.name << "]\n";
        file << "vram_gb = " << sel.unit.vram_gb << "\n";
        file << "quantity = " << sel.quantity << "\n";
        file << "custom = " << (sel.unit.custom ? "true" : "false") << "\n\n";
    }

    for (const auto& m : request.models) {
        file << "[model." << m.name << "]\n";
        file << "size_gb = " << m.size_gb << "\n";
        if (m.parameters > 0) {
            file << "parameters = " << m.parameters << "\n";
        }
        file << "quantization = " << quant_format_to_string(m.quantization) << "\n";
        if (!m.hf_id.empty()) {
            file << "hf_id = " << m.hf_id << "\n";
        }
        if (!m.architecture.empty()) {
            file << "architecture = " << m.architecture << "\n";
        }
        file << "\n";
    }

    return true;
}

/**
 * @brief Print request summary to stream
 */
inline void print_request_summary(std::ostream& os, const SizingRequest& request) {
    os << "=== Sizing Request ===\n";
    for (const auto& sel : request.inventory.selections()) {
        os << "GPU: " << sel.quantity << " x " << sel.unit.name
           << " (" << sel.unit.vram_gb << " GB" << (sel.unit.custom ? ", custom" : "") << ")\n";
    }
    os << "Total VRAM: " << request.inventory.total_vram_gb() << " GB across "
       << request.inventory.total_unit_count() << " GPU(s)\n";
    for (const auto& m : request.models) {
        os << "Model: " << m.name << " (" << m.size_gb << " GB, "
           << quant_format_to_string(m.quantization) << ")";
        if (!m.hf_id.empty()) {
            os << " [" << m.hf_id << "]";
        }
        os << "\n";
    }
    os << "KV cache dtype: " << quant_format_to_string(request.settings.breakdown.kv_cache_dtype) << "\n";
    os << "======================\n";
}

} // namespace vram_sizer
