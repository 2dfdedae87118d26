#include "optimize/configuration_optimizer.hpp"

#include "memory/memory_pressure.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace vram_sizer {

namespace {

constexpr double kBandwidthUtilization = 0.7;
constexpr int kFallbackSwapSpaceGB = 4;
constexpr double kFallbackMemoryUtilization = 0.85;

struct SearchOutcome {
    int max_num_seqs = 0;
    int max_model_len = 0;
    VRAMBreakdown breakdown;
    bool constrained = false;
    bool length_reduced = false;
};

class StrategySearch {
public:
    StrategySearch(
        const StrategyProfile& profile,
        double total_vram_gb,
        const std::vector<ModelSpec>& models,
        const BreakdownSettings& settings
    ) : profile_(profile), total_vram_gb_(total_vram_gb), models_(models), settings_(settings) {
        const double reserve_fraction = std::max(1.0 - profile.gpu_memory_utilization, profile.headroom_band_low);
        reserve_gb_ = total_vram_gb * reserve_fraction;
    }

    SearchOutcome run() {
        SearchOutcome out;
        out.max_model_len = profile_.max_model_len;
        out.max_num_seqs = largest_fitting(profile_.max_model_len);

        if (out.max_num_seqs == 0 && profile_.allow_length_reduction) {
            for (int len : sequence_length_ladder(profile_.max_model_len)) {
                const int seqs = largest_fitting(len);
                if (seqs > 0) {
                    out.max_model_len = len;
                    out.max_num_seqs = seqs;
                    out.length_reduced = true;
                    break;
                }
            }
        }

        if (out.max_num_seqs == 0) {
            out.max_num_seqs = profile_.min_num_seqs;
            out.max_model_len = profile_.max_model_len;
            out.constrained = true;
        }
        out.breakdown = evaluate(out.max_model_len, out.max_num_seqs);
        return out;
    }

private:
    VRAMBreakdown evaluate(int max_model_len, int max_num_seqs) const {
        BreakdownCandidate candidate;
        candidate.max_num_seqs = max_num_seqs;
        candidate.max_model_len = max_model_len;
        const BreakdownResult r = compute_breakdown(total_vram_gb_, models_, candidate, settings_);
        if (!r.precise()) {
            throw std::runtime_error("breakdown " + breakdown_status_to_string(r.status) + ": " + r.message);
        }
        return r.breakdown;
    }

    bool fits(int max_model_len, int max_num_seqs) const {
        const VRAMBreakdown b = evaluate(max_model_len, max_num_seqs);
        return b.oversubscribed_gb <= 0.0 && b.available_gb >= reserve_gb_;
    }

    // KV cache grows monotonically with the sequence count, so the feasible
    // set is a prefix of [min, max].
    int largest_fitting(int max_model_len) const {
        int lo = profile_.min_num_seqs;
        int hi = profile_.max_num_seqs;
        if (!fits(max_model_len, lo)) {
            return 0;
        }
        while (lo < hi) {
            const int mid = lo + (hi - lo + 1) / 2;
            if (fits(max_model_len, mid)) {
                lo = mid;
            } else {
                hi = mid - 1;
            }
        }
        return lo;
    }

    const StrategyProfile& profile_;
    double total_vram_gb_;
    const std::vector<ModelSpec>& models_;
    const BreakdownSettings& settings_;
    double reserve_gb_ = 0.0;
};

std::string memory_utilization_explanation(OptimizationTarget target) {
    switch (target) {
        case OptimizationTarget::THROUGHPUT:
            return "High GPU memory utilization leaves maximum room for KV cache blocks.";
        case OptimizationTarget::LATENCY:
            return "Moderate GPU memory utilization keeps allocation stalls and fragmentation low.";
        case OptimizationTarget::BALANCED:
        default:
            return "GPU memory utilization balanced between KV cache capacity and headroom.";
    }
}

PerformanceMetrics estimate_metrics(
    const HardwareInventory& inventory,
    const SearchOutcome& outcome
) {
    PerformanceMetrics m;
    const VRAMBreakdown& b = outcome.breakdown;
    const int units = std::max(1, inventory.total_unit_count());
    const double bandwidth = inventory.average_memory_bandwidth_gbps() * units * kBandwidthUtilization;

    if (b.model_weights_gb > 0.0 && bandwidth > 0.0) {
        // Decode is memory-bound: one pass over the weights per generated token.
        const double per_sequence_tps = bandwidth / b.model_weights_gb;
        const double tokens_per_sec = per_sequence_tps * outcome.max_num_seqs;
        m.throughput = "~" + format_decimal(std::floor(tokens_per_sec), 0) + " tokens/s";
        m.latency = "~" + format_decimal(1000.0 / per_sequence_tps, 1) + " ms/token";
    } else {
        m.throughput = "N/A";
        m.latency = "N/A";
    }

    const double used = std::min(b.used_gb(), b.total_vram_gb);
    const double pct = (b.total_vram_gb > 0.0) ? used / b.total_vram_gb * 100.0 : 0.0;
    m.memory_usage = format_decimal(used, 1) + " GB of " + format_decimal(b.total_vram_gb, 1) +
                     " GB (" + format_decimal(pct, 0) + "%)";
    return m;
}

std::vector<std::string> strategy_considerations(OptimizationTarget target) {
    switch (target) {
        case OptimizationTarget::THROUGHPUT:
            return {
                "Large batches raise per-request latency under load.",
                "Monitor KV cache usage; preemption increases when the cache is full."
            };
        case OptimizationTarget::LATENCY:
            return {
                "Small batches leave GPU compute underutilized at high request rates.",
                "Scale out with more replicas rather than larger batches."
            };
        case OptimizationTarget::BALANCED:
        default:
            return {
                "Suitable for general serving with mixed prompt lengths.",
                "Raise max-num-seqs if sustained throughput matters more than tail latency."
            };
    }
}

std::string memory_budget_description(const StrategyProfile& profile, const SearchOutcome& out) {
    std::ostringstream oss;
    oss << profile.description << " " << out.max_num_seqs << " sequences of up to "
        << out.max_model_len << " tokens.";
    return oss.str();
}

} // namespace

std::vector<CommandParameter> build_parameter_list(const ServingParameters& chosen) {
    std::vector<CommandParameter> params;
    params.push_back({"--model", chosen.model.empty() ? std::string(kPlaceholderModel) : chosen.model,
                      "Model served by this configuration."});
    params.push_back({"--gpu-memory-utilization", format_decimal(chosen.gpu_memory_utilization, 2),
                      "Fraction of GPU memory the server may claim for weights and KV cache."});
    params.push_back({"--max-model-len", std::to_string(chosen.max_model_len),
                      "Maximum sequence length (prompt plus output) per request."});
    params.push_back({"--max-num-seqs", std::to_string(chosen.max_num_seqs),
                      "Maximum number of sequences processed concurrently."});
    if (chosen.tensor_parallel_size > 1) {
        params.push_back({"--tensor-parallel-size", std::to_string(chosen.tensor_parallel_size),
                          "Number of GPUs the model weights are sharded across."});
    }
    params.push_back({"--swap-space", std::to_string(chosen.swap_space_gb),
                      "CPU swap space in GiB for preempted sequences."});
    if (chosen.quantization != QuantFormat::FP16) {
        params.push_back({"--quantization", quant_format_to_string(chosen.quantization),
                          "Weight format the memory estimate assumed."});
    }
    if (!chosen.kv_cache_dtype.empty()) {
        params.push_back({"--kv-cache-dtype", chosen.kv_cache_dtype,
                          "KV cache storage type the sequence count was sized for."});
    }
    return params;
}

Configuration fallback_configuration(
    OptimizationTarget target,
    int total_unit_count,
    const std::string& model_id,
    const std::string& reason,
    const EngineSettings& settings,
    QuantFormat quantization
) {
    const StrategyProfile& profile = strategy_profile(target);

    Configuration cfg;
    cfg.type = target;
    cfg.title = profile.title;
    cfg.description = "Basic " + optimization_target_to_string(target) + " configuration.";
    cfg.degraded = true;
    cfg.fallback_reason = reason;

    cfg.chosen.model = model_id;
    cfg.chosen.gpu_memory_utilization = kFallbackMemoryUtilization;
    cfg.chosen.max_model_len = profile.fallback_max_model_len;
    cfg.chosen.max_num_seqs = profile.fallback_max_num_seqs;
    cfg.chosen.tensor_parallel_size = (total_unit_count > 1) ? total_unit_count : 0;
    cfg.chosen.swap_space_gb = kFallbackSwapSpaceGB;
    cfg.chosen.quantization = quantization;
    cfg.chosen.kv_cache_dtype = kv_cache_dtype_flag_value(settings.breakdown.kv_cache_dtype);

    cfg.parameters = build_parameter_list(cfg.chosen);
    cfg.command = render_command(cfg.parameters, settings.entrypoint);
    cfg.metrics.throughput = "Estimated";
    cfg.metrics.latency = "Estimated";
    cfg.metrics.memory_usage = "Estimated";
    cfg.considerations.push_back("This is a fallback configuration.");
    if (!reason.empty()) {
        cfg.considerations.push_back("Fallback reason: " + reason);
    }
    return cfg;
}

Configuration optimize_configuration(
    const HardwareInventory& inventory,
    const std::vector<ModelSpec>& models,
    OptimizationTarget target,
    const EngineSettings& settings
) {
    const StrategyProfile& profile = strategy_profile(target);
    const int units = inventory.total_unit_count();
    const std::string model_id = models.empty() ? std::string(kPlaceholderModel) : model_identifier(models.front());
    const QuantFormat quantization = models.empty() ? QuantFormat::FP16 : models.front().quantization;

    try {
        const double total_vram = inventory.total_vram_gb();
        if (!std::isfinite(total_vram) || total_vram <= 0.0) {
            throw std::domain_error("no usable accelerator memory");
        }
        if (models.empty()) {
            throw std::invalid_argument("no models selected");
        }
        if (!is_supported_kv_cache_dtype(settings.breakdown.kv_cache_dtype)) {
            throw std::invalid_argument("kv cache dtype " + quant_format_to_string(settings.breakdown.kv_cache_dtype) +
                                        " is not supported by the server");
        }

        StrategySearch search(profile, total_vram, models, settings.breakdown);
        const SearchOutcome out = search.run();

        Configuration cfg;
        cfg.type = target;
        cfg.title = profile.title;
        cfg.description = memory_budget_description(profile, out);
        cfg.breakdown = out.breakdown;
        cfg.memory_constrained = out.constrained;

        cfg.chosen.model = model_id;
        cfg.chosen.gpu_memory_utilization = profile.gpu_memory_utilization;
        cfg.chosen.max_model_len = out.max_model_len;
        cfg.chosen.max_num_seqs = out.max_num_seqs;
        cfg.chosen.tensor_parallel_size = (units > 1) ? units : 0;
        cfg.chosen.swap_space_gb = static_cast<int>(std::lround(
            calculate_swap_space_gb(total_vram, total_model_size_gb(models), profile.swap_ratio)));
        cfg.chosen.quantization = quantization;
        cfg.chosen.kv_cache_dtype = kv_cache_dtype_flag_value(settings.breakdown.kv_cache_dtype);

        cfg.parameters = build_parameter_list(cfg.chosen);
        // Strategy-specific wording for the utilization flag.
        cfg.parameters[1].explanation = memory_utilization_explanation(target);
        cfg.command = render_command(cfg.parameters, settings.entrypoint);
        cfg.metrics = estimate_metrics(inventory, out);

        cfg.considerations = strategy_considerations(target);
        if (cfg.chosen.tensor_parallel_size > 1) {
            cfg.considerations.push_back("Tensor parallelism across " + std::to_string(units) +
                                         " GPUs adds inter-GPU communication on every layer.");
        }
        if (models.size() > 1) {
            cfg.considerations.push_back("Multiple models share the same accelerator memory.");
        }
        if (out.length_reduced) {
            cfg.considerations.push_back("max-model-len reduced from " + std::to_string(profile.max_model_len) +
                                         " to " + std::to_string(out.max_model_len) + " to fit in memory.");
        }
        if (out.constrained && out.breakdown.oversubscribed_gb > 0.0) {
            cfg.considerations.push_back("Estimated memory exceeds the available VRAM by " +
                                         format_decimal(out.breakdown.oversubscribed_gb, 1) +
                                         " GB; consider quantization or more GPUs.");
        } else if (out.constrained) {
            cfg.considerations.push_back("Even a single sequence leaves less headroom than the " +
                                         format_decimal(profile.gpu_memory_utilization, 2) +
                                         " utilization target reserves.");
        } else if (profile.headroom_band_high < 1.0 &&
                   out.breakdown.available_fraction() > profile.headroom_band_high) {
            cfg.considerations.push_back("Free VRAM stays above " +
                                         format_decimal(profile.headroom_band_high * 100.0, 0) +
                                         "% even at the sequence cap.");
        }

        Logger::get().debug("%s: max_num_seqs=%d max_model_len=%d available=%.2f GB",
                            cfg.title.c_str(), cfg.chosen.max_num_seqs, cfg.chosen.max_model_len,
                            cfg.breakdown.available_gb);
        return cfg;
    } catch (const std::exception& e) {
        Logger::get().warn("%s optimization fell back to fixed values: %s",
                           optimization_target_to_string(target).c_str(), e.what());
        return fallback_configuration(target, units, model_id, e.what(), settings, quantization);
    }
}

std::vector<Configuration> optimize_all(
    const HardwareInventory& inventory,
    const std::vector<ModelSpec>& models,
    const EngineSettings& settings
) {
    std::vector<Configuration> configs;
    if (inventory.empty() || models.empty()) {
        return configs;
    }
    for (OptimizationTarget target : all_optimization_targets()) {
        configs.push_back(optimize_configuration(inventory, models, target, settings));
    }
    return configs;
}

} // namespace vram_sizer
