/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cstdint>
#include <string_view>

//-------------------------------------------------------------------------

namespace pegfee::fee
{

enum class FeeErrorCode : uint32_t
{
    VALID,
    INVALID_PRICE,
    INVALID_PARAMETERS
};

[[nodiscard]] constexpr std::string_view FeeErrorCode2StrView(FeeErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

}  // namespace pegfee::fee

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<pegfee::fee::FeeErrorCode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(pegfee::fee::FeeErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", pegfee::fee::FeeErrorCode2StrView(ec));
    }
};

//-------------------------------------------------------------------------
