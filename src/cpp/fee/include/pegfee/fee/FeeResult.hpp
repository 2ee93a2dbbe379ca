/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <msgpack.hpp>

//-------------------------------------------------------------------------

namespace pegfee::fee
{

//-------------------------------------------------------------------------

enum class FeeZone : uint32_t
{
    DEADZONE,
    GRADUATED,
    ARBITRAGE
};

[[nodiscard]] constexpr std::string_view FeeZone2StrView(FeeZone zone) noexcept
{
    return magic_enum::enum_name(zone);
}

//-------------------------------------------------------------------------

struct FeeDiagnostics
{
    fee_t baseFee{};
    fee_t unclampedFee{};
    fee_t clampedFee{};
    uint64_t devBps{};
    uint64_t pctUnits{};
    bool toward{};
    bool arbZone{};
    FeeZone zone{FeeZone::DEADZONE};

    MSGPACK_DEFINE_MAP(baseFee, unclampedFee, clampedFee, devBps, pctUnits, toward, arbZone, zone);
};

struct FeeResult
{
    fee_t fee{};
    FeeDiagnostics diagnostics;

    MSGPACK_DEFINE_MAP(fee, diagnostics);
};

//-------------------------------------------------------------------------

}  // namespace pegfee::fee

//-------------------------------------------------------------------------

MSGPACK_ADD_ENUM(pegfee::fee::FeeZone);

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<pegfee::fee::FeeZone>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(pegfee::fee::FeeZone zone, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", pegfee::fee::FeeZone2StrView(zone));
    }
};

//-------------------------------------------------------------------------
