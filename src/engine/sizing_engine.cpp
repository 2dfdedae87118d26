#include "engine/sizing_engine.hpp"

#include "command/command_formatter.hpp"
#include "utils/logger.hpp"

#include <ostream>
#include <utility>

namespace vram_sizer {

SizingEngine::SizingEngine(EngineSettings settings, ConfigurationCache* cache)
    : settings_(std::move(settings)), cache_(cache) {}

SizingReport SizingEngine::evaluate(const HardwareInventory& inventory, const std::vector<ModelSpec>& models) const {
    SizingReport report;
    report.total_vram_gb = inventory.total_vram_gb();
    report.total_unit_count = inventory.total_unit_count();
    report.total_model_size_gb = total_model_size_gb(models);
    report.memory_pressure = classify_memory_pressure(report.total_model_size_gb, report.total_vram_gb);
    report.health = assess_configuration_health(
        report.total_model_size_gb, report.total_vram_gb, report.total_unit_count);

    report.has_valid_configuration = !inventory.empty() && !models.empty();
    if (!report.has_valid_configuration) {
        report.breakdown.message = inventory.empty() ? "no accelerators selected" : "no models selected";
        return report;
    }

    report.breakdown = compute_breakdown(report.total_vram_gb, models, BreakdownCandidate{}, settings_.breakdown);

    auto compute = [&]() { return optimize_all(inventory, models, settings_); };
    if (cache_ != nullptr) {
        report.configurations = cache_->get_or_compute(make_cache_key(inventory, models, settings_), compute);
    } else {
        report.configurations = compute();
    }

    const bool oversubscribed = report.breakdown.has_value() && report.breakdown.breakdown.oversubscribed_gb > 0.0;
    report.recommendations = recommend_quantizations(report.total_vram_gb, models, settings_.advisor, oversubscribed);

    Logger::get().debug("evaluated %d unit(s), %zu model(s): breakdown %s, %zu recommendation(s)",
                        report.total_unit_count, models.size(),
                        breakdown_status_to_string(report.breakdown.status).c_str(),
                        report.recommendations.size());
    return report;
}

void print_sizing_report(std::ostream& os, const SizingReport& report) {
    os << "=== VRAM Sizing Report ===\n";
    os << "GPUs: " << report.total_unit_count << " (" << format_decimal(report.total_vram_gb, 1) << " GB total)\n";
    os << "Models: " << format_decimal(report.total_model_size_gb, 1) << " GB total\n";
    os << "Memory pressure: " << memory_pressure_to_string(report.memory_pressure) << "\n";
    os << "Health: " << report.health.status << "\n";
    for (const auto& issue : report.health.issues) {
        os << "  - " << issue << "\n";
    }

    if (!report.has_valid_configuration) {
        os << "No configuration available: " << report.breakdown.message << "\n";
        return;
    }

    const VRAMBreakdown& b = report.breakdown.breakdown;
    os << "\n--- VRAM Breakdown (" << breakdown_status_to_string(report.breakdown.status) << ") ---\n";
    os << "Model weights:   " << format_decimal(b.model_weights_gb, 2) << " GB\n";
    os << "KV cache:        " << format_decimal(b.kv_cache_gb, 2) << " GB\n";
    os << "Activations:     " << format_decimal(b.activations_gb, 2) << " GB\n";
    os << "System overhead: " << format_decimal(b.system_overhead_gb, 2) << " GB\n";
    os << "Available:       " << format_decimal(b.available_gb, 2) << " GB\n";
    if (b.oversubscribed_gb > 0.0) {
        os << "Oversubscribed:  " << format_decimal(b.oversubscribed_gb, 2) << " GB\n";
    }

    for (const auto& cfg : report.configurations) {
        os << "\n--- " << cfg.title << (cfg.degraded ? " (fallback)" : "") << " ---\n";
        os << cfg.description << "\n";
        for (const auto& p : cfg.parameters) {
            os << "  " << p.name << " " << p.value << "  # " << p.explanation << "\n";
        }
        os << "Throughput: " << cfg.metrics.throughput
           << ", latency: " << cfg.metrics.latency
           << ", memory: " << cfg.metrics.memory_usage << "\n";
        os << "Command: " << cfg.command << "\n";
        for (const auto& c : cfg.considerations) {
            os << "  * " << c << "\n";
        }
    }

    if (!report.recommendations.empty()) {
        os << "\n--- Quantization Recommendations ---\n";
        for (const auto& r : report.recommendations) {
            os << r.model_name << ": " << quant_format_to_string(r.current_format)
               << " -> " << quant_format_to_string(r.recommended_format)
               << ", saves " << format_decimal(r.memory_savings_gb, 1) << " GB"
               << ", quality impact " << r.quality_impact.severity << "\n";
            os << "  " << r.reason << "\n";
        }
    }
    os << "==========================\n";
}

} // namespace vram_sizer
