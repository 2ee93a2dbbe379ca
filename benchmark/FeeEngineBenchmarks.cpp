/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "pegfee/config/Config.hpp"
#include "pegfee/fee/FeeEngine.hpp"

#include <vector>

//-------------------------------------------------------------------------

static const fs::path kTestDataPath{
    fs::path{__FILE__}.parent_path().parent_path() / "test" / "cpp-tests" / "data"};

static const fs::path kConfigPath{kTestDataPath / "PegFee.xml"};

// Pool prices between 1.0 and 3.0 against the 1.002 peg, covering all three fee zones.
static std::vector<pegfee::price_t> makePoolPrices(int64_t count)
{
    std::vector<pegfee::price_t> prices;
    prices.reserve(count);
    for (int64_t i = 0; i < count; ++i) {
        prices.push_back(pegfee::fixed::parseWad(fmt::format("{}.{:04}", 1 + i % 2, (i * 37) % 10'000)));
    }
    return prices;
}

//-------------------------------------------------------------------------

struct HookFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        const auto nodes = pegfee::config::parseConfigFile(kConfigPath);
        feeHook = pegfee::config::makePegFeeHook(nodes);
        poolPrices = makePoolPrices(state.range(0));
    }

    void TearDown(benchmark::State&) override
    {
        feeHook.reset();
        poolPrices.clear();
    }

    std::unique_ptr<pegfee::hook::PegFeeHook> feeHook;
    std::vector<pegfee::price_t> poolPrices;
};

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(HookFixture, ComputeFee)(benchmark::State& state)
{
    const auto& engine = feeHook->engine();
    const auto pegPrice = feeHook->oracle().pegPrice();

    for (auto _ : state) {
        for (size_t i = 0; i < poolPrices.size(); ++i) {
            const auto direction =
                i % 2 == 0 ? pegfee::fee::PriceImpact::DECREASE : pegfee::fee::PriceImpact::INCREASE;
            benchmark::DoNotOptimize(engine.computeFee(poolPrices[i], pegPrice, direction));
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(HookFixture, ComputeFee)->Arg(1'000)->Arg(10'000);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(HookFixture, BeforeSwap)(benchmark::State& state)
{
    std::vector<pegfee::price_t> sqrtPrices;
    sqrtPrices.reserve(poolPrices.size());
    for (const auto& price : poolPrices) {
        sqrtPrices.push_back(pegfee::fixed::priceToSqrtPriceX96(price));
    }

    for (auto _ : state) {
        for (size_t i = 0; i < sqrtPrices.size(); ++i) {
            benchmark::DoNotOptimize(feeHook->beforeSwap(
                pegfee::hook::PoolState{.sqrtPriceX96 = sqrtPrices[i]},
                pegfee::hook::SwapParams{.zeroForOne = i % 2 == 0}));
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(HookFixture, BeforeSwap)->Arg(1'000)->Arg(10'000);

//-------------------------------------------------------------------------

static void BM_PriceToSqrtPriceX96(benchmark::State& state)
{
    const auto prices = makePoolPrices(state.range(0));

    for (auto _ : state) {
        for (const auto& price : prices) {
            benchmark::DoNotOptimize(pegfee::fixed::priceToSqrtPriceX96(price));
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PriceToSqrtPriceX96)->Arg(1'000);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}

//-------------------------------------------------------------------------
