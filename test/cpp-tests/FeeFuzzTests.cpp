/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/fee/FeeEngine.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <limits>
#include <random>

//-------------------------------------------------------------------------

using namespace pegfee;
using namespace pegfee::fee;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

class FeeFuzzTest : public TestWithParam<uint64_t>
{
protected:
    void SetUp() override
    {
        rng.seed(GetParam());
    }

    FeeParameters randomParameters()
    {
        std::uniform_int_distribution<fee_t> feeDist{0, kMaxLpFee};
        std::array<fee_t, 3> fees{feeDist(rng), feeDist(rng), feeDist(rng)};
        std::ranges::sort(fees);

        std::uniform_int_distribution<bps_t> deadzoneDist{0, 500};
        const bps_t deadzoneBps = deadzoneDist(rng);
        std::uniform_int_distribution<bps_t> arbDist{deadzoneBps + 1, 20'000};

        std::uniform_int_distribution<fee_t> slopeDist{0, 50'000};

        return {
            .baseFee = fees[1],
            .minFee = fees[0],
            .maxFee = fees[2],
            .deadzoneBps = deadzoneBps,
            .slopeToward = slopeDist(rng),
            .slopeAway = slopeDist(rng),
            .arbTriggerBps = arbDist(rng)
        };
    }

    // Between 1e-6 and ~3e6 in WAD terms.
    price_t randomPrice()
    {
        std::uniform_int_distribution<uint64_t> mantissaDist{1, std::numeric_limits<uint64_t>::max()};
        std::uniform_int_distribution<uint32_t> shiftDist{0, 12};
        return price_t{mantissaDist(rng) / 10'000'000u + 1'000'000'000'000u}
            * boost::multiprecision::pow(price_t{10}, shiftDist(rng));
    }

    PriceImpact randomDirection()
    {
        return std::bernoulli_distribution{}(rng) ? PriceImpact::DECREASE : PriceImpact::INCREASE;
    }

    std::mt19937_64 rng;
};

}  // namespace

//-------------------------------------------------------------------------

TEST_P(FeeFuzzTest, FeeStaysWithinBounds)
{
    static constexpr int kIterations = 2000;

    for (int i = 0; i < kIterations; ++i) {
        const auto params = randomParameters();
        const auto poolPrice = randomPrice();
        const auto pegPrice = randomPrice();
        const auto direction = randomDirection();

        const auto result = computeFee(poolPrice, pegPrice, direction, params);
        ASSERT_TRUE(result.has_value());

        const auto& diagnostics = result->diagnostics;
        EXPECT_GE(result->fee, params.minFee);
        EXPECT_LE(result->fee, params.maxFee);
        EXPECT_EQ(diagnostics.clampedFee, result->fee);
        EXPECT_EQ(diagnostics.baseFee, params.baseFee);
        EXPECT_EQ(diagnostics.devBps, deviationBps(poolPrice, pegPrice));

        if (diagnostics.devBps <= params.deadzoneBps) {
            EXPECT_EQ(result->fee, params.baseFee);
            EXPECT_EQ(diagnostics.zone, FeeZone::DEADZONE);
        }
        else if (diagnostics.devBps >= params.arbTriggerBps) {
            EXPECT_TRUE(diagnostics.arbZone);
            EXPECT_EQ(diagnostics.pctUnits, 0);
            EXPECT_EQ(result->fee, diagnostics.toward ? params.minFee : params.maxFee);
        }
        else {
            EXPECT_EQ(diagnostics.zone, FeeZone::GRADUATED);
            if (diagnostics.toward) {
                EXPECT_LE(result->fee, params.baseFee);
            } else {
                EXPECT_GE(result->fee, params.baseFee);
            }
        }
    }
}

INSTANTIATE_TEST_SUITE_P(
    FeeFuzz,
    FeeFuzzTest,
    Values(1ull, 42ull, 1337ull, 69420ull));

//-------------------------------------------------------------------------
