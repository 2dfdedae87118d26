#include <gtest/gtest.h>
#include "command/command_formatter.hpp"

using namespace vram_sizer;

TEST(CommandFormatterTest, RendersCanonicalOrder) {
    std::vector<CommandParameter> params = {
        {"--swap-space", "4", ""},
        {"--max-num-seqs", "64", ""},
        {"--model", "meta-llama/Llama-2-7b-hf", ""},
        {"--gpu-memory-utilization", "0.90", ""},
        {"--max-model-len", "2048", ""},
        {"--tensor-parallel-size", "2", ""},
    };
    EXPECT_EQ(render_command(params),
              "python -m vllm.entrypoints.openai.api_server --model meta-llama/Llama-2-7b-hf "
              "--gpu-memory-utilization 0.90 --max-model-len 2048 --max-num-seqs 64 "
              "--tensor-parallel-size 2 --swap-space 4");
}

TEST(CommandFormatterTest, ExtraFlagsKeepInsertionOrder) {
    std::vector<CommandParameter> params = {
        {"enforce-eager", "", ""},
        {"--model", "m", ""},
        {"--dtype", "half", ""},
    };
    EXPECT_EQ(render_command(params, "vllm serve"), "vllm serve --model m --enforce-eager --dtype half");
}

TEST(CommandFormatterTest, MissingModelUsesPlaceholder) {
    std::string cmd = render_command({{"--max-num-seqs", "8", ""}});
    EXPECT_EQ(cmd, "python -m vllm.entrypoints.openai.api_server --model MODEL_PATH --max-num-seqs 8");
}

TEST(CommandFormatterTest, OrderingIsIdempotent) {
    std::vector<CommandParameter> params = {
        {"--max-num-seqs", "8", ""},
        {"--model", "m", ""},
        {"--max-num-seqs", "99", ""},
    };
    std::vector<CommandParameter> once = canonical_order(params);
    ASSERT_EQ(once.size(), 2u);
    EXPECT_EQ(once[1].value, "8");
    EXPECT_EQ(render_command(once), render_command(canonical_order(once)));
}

TEST(CommandFormatterTest, DecimalFormattingIsFixed) {
    EXPECT_EQ(format_decimal(0.9, 2), "0.90");
    EXPECT_EQ(format_decimal(13.456, 1), "13.5");
    EXPECT_EQ(format_decimal(66.0, 0), "66");
    EXPECT_EQ(normalize_flag_name("swap-space"), "--swap-space");
}

TEST(CommandFormatterTest, QuotesValuesForTheShell) {
    EXPECT_EQ(shell_quote("meta-llama/Llama-2-7b-hf"), "meta-llama/Llama-2-7b-hf");
    EXPECT_EQ(shell_quote("Llama 2 7B"), "'Llama 2 7B'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote("a;rm"), "'a;rm'");

    std::string cmd = render_command({{"--model", "/models/my model", ""}, {"--max-num-seqs", "8", ""}});
    EXPECT_EQ(cmd, "python -m vllm.entrypoints.openai.api_server --model '/models/my model' --max-num-seqs 8");
}
