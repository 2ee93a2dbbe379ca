/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "pegfee/fee/FeeErrorCode.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace pegfee::fee
{

//-------------------------------------------------------------------------

inline constexpr fee_t kFeeDenominator = 1'000'000;
inline constexpr fee_t kMaxLpFee = kFeeDenominator;

inline constexpr bps_t kBpsDenominator = 10'000;
inline constexpr bps_t kBpsPerPercent = 100;

//-------------------------------------------------------------------------

struct FeeParameters
{
    fee_t baseFee;
    fee_t minFee;
    fee_t maxFee;
    bps_t deadzoneBps;
    fee_t slopeToward;
    fee_t slopeAway;
    bps_t arbTriggerBps;
};

//-------------------------------------------------------------------------

/**
 * Checks minFee <= baseFee <= maxFee <= kMaxLpFee and deadzoneBps < arbTriggerBps.
 * Slopes and thresholds are unsigned, so non-negativity holds by construction.
 */
[[nodiscard]] FeeErrorCode validateFeeParameters(const FeeParameters& params) noexcept;

/**
 * Reads a <FeeParameters> node. Throws std::invalid_argument on a missing attribute or
 * an inconsistent parameter set.
 */
[[nodiscard]] FeeParameters makeFeeParameters(pugi::xml_node node);

[[nodiscard]] inline decimal_t feeRate(fee_t fee)
{
    return decimal_t{fee} / decimal_t{kFeeDenominator};
}

//-------------------------------------------------------------------------

}  // namespace pegfee::fee

//-------------------------------------------------------------------------
