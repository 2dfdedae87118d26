#include <gtest/gtest.h>
#include "engine/configuration_cache.hpp"

#include <thread>

using namespace vram_sizer;

namespace {

HardwareInventory two_a100() {
    HardwareInventory inv;
    inv.add_unit({"A100", 80.0, false}, 2);
    return inv;
}

ModelSpec make_model(const std::string& name, double size_gb) {
    ModelSpec m;
    m.name = name;
    m.size_gb = size_gb;
    return m;
}

} // namespace

TEST(ConfigurationCacheTest, ComputesOncePerKey) {
    ConfigurationCache cache;
    int calls = 0;
    auto compute = [&]() {
        ++calls;
        return optimize_all(two_a100(), {make_model("m", 13.5)});
    };
    std::vector<Configuration> first = cache.get_or_compute("k", compute);
    std::vector<Configuration> second = cache.get_or_compute("k", compute);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cache.computations(), 1u);
    ASSERT_EQ(first.size(), second.size());
    EXPECT_EQ(first[0].command, second[0].command);
    EXPECT_TRUE(cache.contains("k"));

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    cache.get_or_compute("k", compute);
    EXPECT_EQ(calls, 2);
}

TEST(ConfigurationCacheTest, ConcurrentCallersShareOneComputation) {
    ConfigurationCache cache;
    auto compute = []() { return optimize_all(two_a100(), {make_model("m", 13.5)}); };
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() { cache.get_or_compute("shared", compute); });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(cache.computations(), 1u);
}

TEST(ConfigurationCacheTest, KeyDistinguishesModelMixes) {
    EngineSettings settings;
    // Same unit count, same total VRAM, same total model size.
    HardwareInventory a;
    a.add_unit({"A100", 80.0, false}, 1);
    a.add_unit({"L4", 24.0, false}, 1);
    HardwareInventory b;
    b.add_unit({"A100-custom", 80.0, true}, 1);
    b.add_unit({"L4", 24.0, false}, 1);

    std::vector<ModelSpec> mix1 = {make_model("x", 10.0), make_model("y", 20.0)};
    std::vector<ModelSpec> mix2 = {make_model("x", 15.0), make_model("y", 15.0)};

    EXPECT_NE(make_cache_key(a, mix1, settings), make_cache_key(a, mix2, settings));
    EXPECT_NE(make_cache_key(a, mix1, settings), make_cache_key(b, mix1, settings));
    EXPECT_EQ(make_cache_key(a, mix1, settings), make_cache_key(a, mix1, settings));

    EngineSettings int8_kv;
    int8_kv.breakdown.kv_cache_dtype = QuantFormat::INT8;
    EXPECT_NE(make_cache_key(a, mix1, settings), make_cache_key(a, mix1, int8_kv));
}
