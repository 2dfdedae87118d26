#include "core/hardware.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace vram_sizer {

HardwareInventory::HardwareInventory(std::vector<AcceleratorSelection> selections)
    : selections_(std::move(selections)) {}

void HardwareInventory::add_unit(const AcceleratorUnit& unit, int quantity) {
    if (quantity <= 0) {
        return;
    }
    auto it = std::find_if(selections_.begin(), selections_.end(),
                           [&](const AcceleratorSelection& s) { return s.unit.name == unit.name; });
    if (it != selections_.end()) {
        it->quantity = std::min(kMaxUnitsPerSelection, it->quantity + quantity);
        return;
    }
    AcceleratorSelection sel;
    sel.unit = unit;
    sel.quantity = std::min(kMaxUnitsPerSelection, quantity);
    selections_.push_back(sel);
}

bool HardwareInventory::remove_unit(const std::string& name) {
    auto it = std::find_if(selections_.begin(), selections_.end(),
                           [&](const AcceleratorSelection& s) { return s.unit.name == name; });
    if (it == selections_.end()) {
        return false;
    }
    selections_.erase(it);
    return true;
}

bool HardwareInventory::update_quantity(const std::string& name, int quantity) {
    if (quantity <= 0) {
        return remove_unit(name);
    }
    for (auto& sel : selections_) {
        if (sel.unit.name == name) {
            sel.quantity = std::min(kMaxUnitsPerSelection, quantity);
            return true;
        }
    }
    return false;
}

void HardwareInventory::clear() {
    selections_.clear();
}

double HardwareInventory::total_vram_gb() const {
    double total = 0.0;
    for (const auto& sel : selections_) {
        total += sel.unit.vram_gb * sel.quantity;
    }
    return total;
}

int HardwareInventory::total_unit_count() const {
    int count = 0;
    for (const auto& sel : selections_) {
        count += sel.quantity;
    }
    return count;
}

bool HardwareInventory::has_custom_units() const {
    return std::any_of(selections_.begin(), selections_.end(),
                       [](const AcceleratorSelection& s) { return s.unit.custom; });
}

std::vector<std::string> HardwareInventory::unit_names() const {
    std::vector<std::string> names;
    names.reserve(selections_.size());
    for (const auto& sel : selections_) {
        names.push_back(sel.unit.name);
    }
    return names;
}

double HardwareInventory::average_memory_bandwidth_gbps() const {
    const int count = total_unit_count();
    if (count <= 0) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& sel : selections_) {
        total += estimate_unit_bandwidth_gbps(sel.unit.vram_gb) * sel.quantity;
    }
    return total / count;
}

bool validate_selections(const std::vector<AcceleratorSelection>& selections) {
    for (size_t i = 0; i < selections.size(); ++i) {
        const auto& sel = selections[i];
        if (sel.unit.name.empty()) return false;
        if (!std::isfinite(sel.unit.vram_gb) || sel.unit.vram_gb <= 0.0) return false;
        if (sel.quantity < 1 || sel.quantity > kMaxUnitsPerSelection) return false;
        for (size_t j = 0; j < i; ++j) {
            if (selections[j].unit.name == sel.unit.name) return false;
        }
    }
    return true;
}

double estimate_unit_bandwidth_gbps(double vram_gb) {
    if (vram_gb >= 80.0) return 3500.0;  // H100/A100 class
    if (vram_gb > 40.0) return 2000.0;
    if (vram_gb > 20.0) return 1000.0;
    return 800.0;
}

} // namespace vram_sizer
