/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/fee/FeeEngine.hpp"

#include <algorithm>
#include <limits>

//-------------------------------------------------------------------------

namespace pegfee::fee
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] fee_t saturateFee(uint64_t value) noexcept
{
    static constexpr uint64_t feeMax = std::numeric_limits<fee_t>::max();
    return static_cast<fee_t>(std::min(value, feeMax));
}

}  // namespace

//-------------------------------------------------------------------------

FeeEngine::FeeEngine(const FeeParameters& params)
    : m_params{params}
{
    if (const auto ec = validateFeeParameters(params); ec != FeeErrorCode::VALID) {
        throw std::invalid_argument{fmt::format(
            "{}: {} (baseFee {}, minFee {}, maxFee {}, deadzoneBps {}, arbTriggerBps {})",
            std::source_location::current().function_name(),
            ec,
            params.baseFee,
            params.minFee,
            params.maxFee,
            params.deadzoneBps,
            params.arbTriggerBps)};
    }
}

//-------------------------------------------------------------------------

std::expected<FeeEngine, FeeErrorCode> FeeEngine::create(const FeeParameters& params) noexcept
{
    if (const auto ec = validateFeeParameters(params); ec != FeeErrorCode::VALID) {
        return std::unexpected{ec};
    }
    return FeeEngine{params, Validated{}};
}

//-------------------------------------------------------------------------

ExpectedFeeResult FeeEngine::computeFee(
    const price_t& poolPrice, const price_t& pegPrice, PriceImpact direction) const
{
    if (poolPrice == 0 || pegPrice == 0) {
        return std::unexpected{FeeErrorCode::INVALID_PRICE};
    }

    const uint64_t devBps = deviationBps(poolPrice, pegPrice);
    const bool toward = isToward(poolPrice, pegPrice, direction);

    FeeDiagnostics diagnostics{
        .baseFee = m_params.baseFee,
        .devBps = devBps,
        .toward = toward
    };

    // Below the arbitrage trigger devBps fits in 32 bits, so pctUnits * slope < 2^58.
    uint64_t unclamped = m_params.baseFee;
    if (devBps >= m_params.arbTriggerBps) {
        diagnostics.arbZone = true;
        diagnostics.zone = FeeZone::ARBITRAGE;
        unclamped = toward ? m_params.minFee : m_params.maxFee;
    }
    else if (devBps > m_params.deadzoneBps) {
        diagnostics.zone = FeeZone::GRADUATED;
        diagnostics.pctUnits = (devBps - m_params.deadzoneBps) / kBpsPerPercent;
        const uint64_t magnitude =
            diagnostics.pctUnits * (toward ? m_params.slopeToward : m_params.slopeAway);
        if (toward) {
            unclamped = magnitude >= m_params.baseFee ? 0 : m_params.baseFee - magnitude;
        } else {
            unclamped = m_params.baseFee + magnitude;
        }
    }

    const auto fee = static_cast<fee_t>(std::clamp<uint64_t>(
        unclamped, m_params.minFee, m_params.maxFee));

    diagnostics.unclampedFee = saturateFee(unclamped);
    diagnostics.clampedFee = fee;

    return FeeResult{.fee = fee, .diagnostics = diagnostics};
}

//-------------------------------------------------------------------------

ExpectedFeeResult computeFee(
    const price_t& poolPrice,
    const price_t& pegPrice,
    PriceImpact direction,
    const FeeParameters& params)
{
    return FeeEngine::create(params).and_then([&](const FeeEngine& engine) {
        return engine.computeFee(poolPrice, pegPrice, direction);
    });
}

//-------------------------------------------------------------------------

uint64_t deviationBps(const price_t& poolPrice, const price_t& pegPrice)
{
    static const wide_t devMax{std::numeric_limits<uint64_t>::max()};

    const price_t diff = poolPrice > pegPrice ? price_t{poolPrice - pegPrice} : price_t{pegPrice - poolPrice};
    const wide_t dev = wide_t{diff} * kBpsDenominator / wide_t{pegPrice};

    return dev > devMax ? std::numeric_limits<uint64_t>::max() : dev.convert_to<uint64_t>();
}

//-------------------------------------------------------------------------

bool isToward(const price_t& poolPrice, const price_t& pegPrice, PriceImpact direction) noexcept
{
    if (poolPrice == pegPrice) return true;

    switch (direction) {
        case PriceImpact::DECREASE:
            return pegPrice <= poolPrice;
        case PriceImpact::INCREASE:
            return pegPrice >= poolPrice;
        default:
            std::unreachable();
    }
}

//-------------------------------------------------------------------------

}  // namespace pegfee::fee

//-------------------------------------------------------------------------
