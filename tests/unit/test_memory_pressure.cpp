#include <gtest/gtest.h>
#include "memory/memory_pressure.hpp"

using namespace vram_sizer;

TEST(MemoryPressureTest, ClassifiesByModelToVramRatio) {
    EXPECT_EQ(classify_memory_pressure(13.5, 160.0), MemoryPressure::LOW);
    EXPECT_EQ(classify_memory_pressure(60.0, 80.0), MemoryPressure::MODERATE);
    EXPECT_EQ(classify_memory_pressure(68.0, 80.0), MemoryPressure::HIGH);
    EXPECT_EQ(classify_memory_pressure(26.0, 24.0), MemoryPressure::CRITICAL);
    EXPECT_EQ(classify_memory_pressure(10.0, 0.0), MemoryPressure::UNKNOWN);
    EXPECT_EQ(memory_pressure_to_string(MemoryPressure::HIGH), "high");
}

TEST(MemoryPressureTest, HealthyConfiguration) {
    ConfigurationHealth h = assess_configuration_health(13.5, 160.0, 2);
    EXPECT_EQ(h.status, "healthy");
    EXPECT_TRUE(h.issues.empty());
}

TEST(MemoryPressureTest, OversizedModelIsCritical) {
    ConfigurationHealth h = assess_configuration_health(26.0, 24.0, 1);
    EXPECT_EQ(h.status, "critical");
    EXPECT_EQ(h.issues.size(), 2u);
}

TEST(MemoryPressureTest, TooManyUnitsIsCritical) {
    ConfigurationHealth h = assess_configuration_health(13.5, 24.0 * 17, 17);
    EXPECT_EQ(h.status, "critical");
    ASSERT_EQ(h.issues.size(), 1u);
    EXPECT_EQ(h.issues[0], "Excessive GPU count may impact performance");
}

TEST(MemoryPressureTest, SwapSpaceIsClamped) {
    // 15% of 160 GB = 24, capped at 16
    EXPECT_DOUBLE_EQ(calculate_swap_space_gb(160.0, 13.5, 0.15), 16.0);
    // 5% of 160 GB = 8
    EXPECT_DOUBLE_EQ(calculate_swap_space_gb(160.0, 13.5, 0.05), 8.0);
    // 5% of 24 GB = 1.2, raised to 10% of the model size
    EXPECT_DOUBLE_EQ(calculate_swap_space_gb(24.0, 26.0, 0.05), 2.6);
    // 25% of 4 GB caps below the model-size floor
    EXPECT_DOUBLE_EQ(calculate_swap_space_gb(4.0, 30.0, 0.10), 1.0);
}
