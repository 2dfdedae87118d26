#include "command/command_formatter.hpp"

#include <cctype>
#include <cstring>
#include <iomanip>
#include <locale>
#include <sstream>

namespace vram_sizer {

namespace {

const char* const kCanonicalFlags[] = {
    "--model",
    "--gpu-memory-utilization",
    "--max-model-len",
    "--max-num-seqs",
    "--tensor-parallel-size",
    "--swap-space",
};

bool is_canonical(const std::string& flag) {
    for (const char* c : kCanonicalFlags) {
        if (flag == c) return true;
    }
    return false;
}

bool contains_flag(const std::vector<CommandParameter>& params, const std::string& flag) {
    for (const auto& p : params) {
        if (p.name == flag) return true;
    }
    return false;
}

bool needs_quoting(const std::string& value) {
    for (unsigned char c : value) {
        if (std::isspace(c) || (c != 0 && std::strchr("'\"\\$`;&|<>()*?[]{}!#~", c) != nullptr)) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string shell_quote(const std::string& value) {
    if (!needs_quoting(value)) {
        return value;
    }
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string normalize_flag_name(const std::string& name) {
    if (name.rfind("--", 0) == 0) {
        return name;
    }
    return "--" + name;
}

std::string format_decimal(double value, int precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(precision < 0 ? 0 : precision) << value;
    return oss.str();
}

std::vector<CommandParameter> canonical_order(const std::vector<CommandParameter>& params) {
    std::vector<CommandParameter> normalized;
    normalized.reserve(params.size());
    for (const auto& p : params) {
        CommandParameter n = p;
        n.name = normalize_flag_name(p.name);
        if (!contains_flag(normalized, n.name)) {
            normalized.push_back(n);
        }
    }

    std::vector<CommandParameter> ordered;
    ordered.reserve(normalized.size());
    for (const char* flag : kCanonicalFlags) {
        for (const auto& p : normalized) {
            if (p.name == flag) {
                ordered.push_back(p);
                break;
            }
        }
    }
    for (const auto& p : normalized) {
        if (!is_canonical(p.name)) {
            ordered.push_back(p);
        }
    }
    return ordered;
}

std::string render_command(
    const std::vector<CommandParameter>& params,
    const std::string& entrypoint
) {
    std::vector<CommandParameter> ordered = canonical_order(params);
    if (!contains_flag(ordered, "--model")) {
        ordered.insert(ordered.begin(), CommandParameter{"--model", kPlaceholderModel, ""});
    }

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << (entrypoint.empty() ? std::string(kDefaultEntrypoint) : entrypoint);
    for (const auto& p : ordered) {
        oss << " " << p.name;
        if (!p.value.empty()) {
            oss << " " << shell_quote(p.value);
        }
    }
    return oss.str();
}

} // namespace vram_sizer
