#include <gtest/gtest.h>
#include "quant/quantization_table.hpp"
#include "memory/model_memory.hpp"

using namespace vram_sizer;

TEST(QuantizationTableTest, Fp16IsHalfOfFp32) {
    const QuantInfo& fp32 = lookup_quantization(QuantFormat::FP32);
    const QuantInfo& fp16 = lookup_quantization(QuantFormat::FP16);
    EXPECT_DOUBLE_EQ(fp32.memory_factor, 1.0);
    EXPECT_DOUBLE_EQ(fp16.memory_factor, 0.5);
    EXPECT_DOUBLE_EQ(fp16.bytes_per_param, 2.0);
    EXPECT_EQ(fp16.bits_per_param, 16);
}

TEST(QuantizationTableTest, PrecisionLadderIsMonotonic) {
    const QuantFormat ladder[] = {QuantFormat::FP32, QuantFormat::FP16, QuantFormat::INT8, QuantFormat::INT4};
    const double params = 7.0e9;
    for (size_t i = 1; i < 4; ++i) {
        EXPECT_LE(lookup_quantization(ladder[i]).memory_factor,
                  lookup_quantization(ladder[i - 1]).memory_factor);
        EXPECT_LE(weight_memory_gb(params, ladder[i]), weight_memory_gb(params, ladder[i - 1]));
    }
}

TEST(QuantizationTableTest, UnknownNameFallsBackToFp16) {
    const QuantInfo& info = lookup_quantization("exotic-3bit");
    EXPECT_EQ(info.format, QuantFormat::FP16);
    EXPECT_FALSE(is_known_quant_format("exotic-3bit"));
}

TEST(QuantizationTableTest, ParsesAliasesCaseInsensitively) {
    EXPECT_EQ(string_to_quant_format("GGUF"), QuantFormat::GGML);
    EXPECT_EQ(string_to_quant_format(" bfloat16 "), QuantFormat::BF16);
    EXPECT_EQ(string_to_quant_format("AWQ"), QuantFormat::AWQ);
    EXPECT_EQ(quant_format_to_string(QuantFormat::GPTQ), "gptq");
}

TEST(QuantizationTableTest, CompareSortsMostCompactFirst) {
    std::vector<QuantInfo> sorted = compare_quant_formats(
        {QuantFormat::FP32, QuantFormat::INT4, QuantFormat::FP16, QuantFormat::INT8});
    ASSERT_EQ(sorted.size(), 4u);
    EXPECT_EQ(sorted[0].format, QuantFormat::INT4);
    EXPECT_EQ(sorted[1].format, QuantFormat::INT8);
    EXPECT_EQ(sorted[2].format, QuantFormat::FP16);
    EXPECT_EQ(sorted[3].format, QuantFormat::FP32);
}

TEST(QuantizationTableTest, QualityImpactDependsOnModelSize) {
    QualityImpact large = estimate_quality_impact(QuantFormat::INT4, 13.0);
    QualityImpact small = estimate_quality_impact(QuantFormat::INT4, 1.0);
    EXPECT_NEAR(large.quality_loss, 0.12, 1e-9);
    EXPECT_NEAR(small.quality_loss, 0.18, 1e-9);
    EXPECT_EQ(large.severity, "high");
    EXPECT_EQ(estimate_quality_impact(QuantFormat::AWQ, 7.0).severity, "low");
    EXPECT_NE(large.recommendation.find("Extreme memory savings"), std::string::npos);
}
