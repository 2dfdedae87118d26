#pragma once
#include <string>
#include <vector>

namespace vram_sizer {

constexpr const char* kDefaultEntrypoint = "python -m vllm.entrypoints.openai.api_server";
constexpr const char* kPlaceholderModel = "MODEL_PATH";

/**
 * @brief One launch flag. Names carry the leading "--".
 * An empty value renders as a bare switch.
 */
struct CommandParameter {
    std::string name;
    std::string value;
    std::string explanation;
};

// Adds the "--" prefix when missing.
std::string normalize_flag_name(const std::string& name);

// Single-quotes values containing whitespace or shell metacharacters.
std::string shell_quote(const std::string& value);

// Fixed-point, locale-independent rendering.
std::string format_decimal(double value, int precision);

/**
 * @brief Order parameters canonically
 *
 * --model, --gpu-memory-utilization, --max-model-len, --max-num-seqs,
 * --tensor-parallel-size, --swap-space, then everything else in insertion
 * order. Later duplicates of a flag are dropped.
 */
std::vector<CommandParameter> canonical_order(const std::vector<CommandParameter>& params);

// "<entrypoint> --model <id> --gpu-memory-utilization <v> ..."; inserts
// --model MODEL_PATH when no model flag is present.
std::string render_command(
    const std::vector<CommandParameter>& params,
    const std::string& entrypoint = kDefaultEntrypoint
);

} // namespace vram_sizer
