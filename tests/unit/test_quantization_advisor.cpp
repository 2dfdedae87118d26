#include <gtest/gtest.h>
#include "optimize/quantization_advisor.hpp"

#include <limits>

using namespace vram_sizer;

namespace {

ModelSpec make_model(const std::string& name, double size_gb, QuantFormat q = QuantFormat::FP16) {
    ModelSpec m;
    m.name = name;
    m.size_gb = size_gb;
    m.quantization = q;
    return m;
}

} // namespace

TEST(QuantizationAdvisorTest, NoAdviceWhenWeightsFit) {
    AdvisorResult r = recommend_quantization(160.0, make_model("Llama-2-7B", 13.5));
    EXPECT_FALSE(r.recommended);
    EXPECT_EQ(r.message, "fits comfortably");
}

TEST(QuantizationAdvisorTest, OversizedFp16ModelGetsAwq) {
    AdvisorResult r = recommend_quantization(24.0, make_model("Llama-2-13B", 26.0));
    ASSERT_TRUE(r.recommended);
    const QuantizationRecommendation& rec = r.recommendation;
    EXPECT_EQ(rec.current_format, QuantFormat::FP16);
    EXPECT_EQ(rec.recommended_format, QuantFormat::AWQ);
    EXPECT_NEAR(rec.memory_savings_gb, 19.5, 1e-6);
    EXPECT_GT(rec.weight_pressure, 1.0);
    EXPECT_EQ(r.message, "recommend awq");
    EXPECT_NEAR(rec.overhead_gb, 6.5 * 0.01, 1e-6);
    EXPECT_NE(rec.reason.find("Activation-aware Weight Quantization"), std::string::npos);
    EXPECT_NE(rec.reason.find("for quantization scales"), std::string::npos);
}

TEST(QuantizationAdvisorTest, NeverProposesALargerFormat) {
    const QuantFormat formats[] = {QuantFormat::FP32, QuantFormat::FP16, QuantFormat::BF16,
                                   QuantFormat::INT8, QuantFormat::INT4, QuantFormat::AWQ};
    for (QuantFormat f : formats) {
        AdvisorResult r = recommend_quantization(8.0, make_model("m", 26.0, f));
        if (r.recommended) {
            EXPECT_LT(lookup_quantization(r.recommendation.recommended_format).memory_factor,
                      lookup_quantization(f).memory_factor);
            EXPECT_GE(r.recommendation.memory_savings_gb, 0.0);
            EXPECT_LE(lookup_quantization(r.recommendation.recommended_format).quality_loss, 0.10);
        }
    }
}

TEST(QuantizationAdvisorTest, MostCompactFormatHasNoFurtherAdvice) {
    AdvisorResult r = recommend_quantization(8.0, make_model("m", 26.0, QuantFormat::AWQ));
    EXPECT_FALSE(r.recommended);
    EXPECT_EQ(r.message, "no more compact format within quality tolerance");
}

TEST(QuantizationAdvisorTest, ConstraintViolationTriggersAdvice) {
    AdvisorResult r = recommend_quantization(160.0, make_model("m", 13.5), AdvisorSettings{}, true);
    EXPECT_TRUE(r.recommended);
}

TEST(QuantizationAdvisorTest, InvalidInputsGiveNoAdvice) {
    EXPECT_EQ(recommend_quantization(0.0, make_model("m", 13.5)).message, "no accelerator memory");
    EXPECT_EQ(recommend_quantization(24.0, make_model("m", std::numeric_limits<double>::quiet_NaN())).message,
              "invalid model size");
    EXPECT_EQ(recommend_quantization(24.0, make_model("m", 0.0)).message, "model size unknown");
}

TEST(QuantizationAdvisorTest, RecommendsPerModel) {
    std::vector<QuantizationRecommendation> recs = recommend_quantizations(
        24.0, {make_model("small", 4.0), make_model("large", 26.0)});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].model_name, "large");
}
