#pragma once
#include <string>
#include <vector>

namespace vram_sizer {

constexpr int kMaxUnitsPerSelection = 8;

/**
 * @brief A single accelerator model (e.g. "A100 80GB"), identified by name
 */
struct AcceleratorUnit {
    std::string name;
    double vram_gb = 0.0;
    bool custom = false;
};

struct AcceleratorSelection {
    AcceleratorUnit unit;
    int quantity = 1;
};

/**
 * @brief Ordered hardware selection; one entry per unit name
 */
class HardwareInventory {
public:
    HardwareInventory() = default;
    explicit HardwareInventory(std::vector<AcceleratorSelection> selections);

    // Merges into an existing selection with the same name. Quantities are
    // capped at kMaxUnitsPerSelection.
    void add_unit(const AcceleratorUnit& unit, int quantity = 1);
    bool remove_unit(const std::string& name);
    // quantity <= 0 removes the selection.
    bool update_quantity(const std::string& name, int quantity);
    void clear();

    const std::vector<AcceleratorSelection>& selections() const { return selections_; }
    bool empty() const { return selections_.empty(); }

    double total_vram_gb() const;
    int total_unit_count() const;
    bool has_custom_units() const;
    std::vector<std::string> unit_names() const;
    // Quantity-weighted memory bandwidth estimate in GB/s, 0 when empty.
    double average_memory_bandwidth_gbps() const;

private:
    std::vector<AcceleratorSelection> selections_;
};

bool validate_selections(const std::vector<AcceleratorSelection>& selections);

double estimate_unit_bandwidth_gbps(double vram_gb);

} // namespace vram_sizer
