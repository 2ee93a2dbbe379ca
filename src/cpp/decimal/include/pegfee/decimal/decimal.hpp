/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <fmt/format.h>

#include <spanstream>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace pegfee
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace pegfee

//-------------------------------------------------------------------------

namespace pegfee::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace pegfee::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<pegfee::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(pegfee::decimal_t val, FormatContext& ctx) const
    {
        using namespace pegfee::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
