#include <gtest/gtest.h>
#include "core/hardware.hpp"

using namespace vram_sizer;

TEST(HardwareInventoryTest, TotalVramSumsUnitsTimesQuantity) {
    HardwareInventory inv;
    inv.add_unit({"A100", 80.0, false}, 2);
    inv.add_unit({"RTX 4090", 24.0, false}, 1);
    EXPECT_DOUBLE_EQ(inv.total_vram_gb(), 184.0);
    EXPECT_EQ(inv.total_unit_count(), 3);
}

TEST(HardwareInventoryTest, AddMergesByNameAndCapsQuantity) {
    HardwareInventory inv;
    inv.add_unit({"H100", 80.0, false}, 5);
    inv.add_unit({"H100", 80.0, false}, 6);
    ASSERT_EQ(inv.selections().size(), 1u);
    EXPECT_EQ(inv.selections()[0].quantity, kMaxUnitsPerSelection);
}

TEST(HardwareInventoryTest, NamesAreCaseSensitive) {
    HardwareInventory inv;
    inv.add_unit({"a100", 40.0, false});
    inv.add_unit({"A100", 80.0, false});
    EXPECT_EQ(inv.selections().size(), 2u);
}

TEST(HardwareInventoryTest, UpdateToZeroRemoves) {
    HardwareInventory inv;
    inv.add_unit({"L4", 24.0, false}, 2);
    EXPECT_TRUE(inv.update_quantity("L4", 3));
    EXPECT_EQ(inv.total_unit_count(), 3);
    EXPECT_TRUE(inv.update_quantity("L4", 0));
    EXPECT_TRUE(inv.empty());
    EXPECT_FALSE(inv.remove_unit("L4"));
}

TEST(HardwareInventoryTest, CustomUnitsAndBandwidth) {
    HardwareInventory inv;
    inv.add_unit({"A100", 80.0, false}, 1);
    inv.add_unit({"MyCard", 16.0, true}, 1);
    EXPECT_TRUE(inv.has_custom_units());
    EXPECT_DOUBLE_EQ(inv.average_memory_bandwidth_gbps(), (3500.0 + 800.0) / 2.0);
    EXPECT_EQ(inv.unit_names(), (std::vector<std::string>{"A100", "MyCard"}));
}

TEST(HardwareInventoryTest, ValidateSelections) {
    EXPECT_TRUE(validate_selections({{{"A100", 80.0, false}, 8}}));
    EXPECT_FALSE(validate_selections({{{"A100", 80.0, false}, 9}}));
    EXPECT_FALSE(validate_selections({{{"A100", 80.0, false}, 0}}));
    EXPECT_FALSE(validate_selections({{{"A100", -1.0, false}, 1}}));
    EXPECT_FALSE(validate_selections({{{"", 24.0, false}, 1}}));
    EXPECT_FALSE(validate_selections({{{"A100", 80.0, false}, 1}, {{"A100", 80.0, false}, 1}}));
}
