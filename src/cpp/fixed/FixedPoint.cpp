/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/fixed/FixedPoint.hpp"

#include <limits>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace pegfee::fixed
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] bool isDigit(char c) noexcept
{
    return '0' <= c && c <= '9';
}

}  // namespace

//-------------------------------------------------------------------------

price_t parseWad(std::string_view str)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto dot = str.find('.');
    const auto intPart = str.substr(0, dot);
    const auto fracPart = dot == std::string_view::npos ? std::string_view{} : str.substr(dot + 1);

    if (intPart.empty() || (dot != std::string_view::npos && fracPart.empty())) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' is not a decimal number", ctx, str)};
    }
    if (fracPart.size() > kWadDecimals) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' has more than {} fractional digits", ctx, str, kWadDecimals)};
    }

    static const wide_t maxPrice{std::numeric_limits<price_t>::max()};

    wide_t value{};
    for (char c : intPart) {
        if (!isDigit(c)) {
            throw std::invalid_argument{fmt::format(
                "{}: '{}' is not a decimal number", ctx, str)};
        }
        value = value * 10 + (c - '0');
        if (value > maxPrice) {
            throw std::invalid_argument{fmt::format(
                "{}: '{}' does not fit in 256 bits", ctx, str)};
        }
    }
    value *= wide_t{kWad};

    wide_t scale{kWad};
    for (char c : fracPart) {
        if (!isDigit(c)) {
            throw std::invalid_argument{fmt::format(
                "{}: '{}' is not a decimal number", ctx, str)};
        }
        scale /= 10;
        value += scale * (c - '0');
    }

    if (value > maxPrice) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' does not fit in 256 bits", ctx, str)};
    }

    return static_cast<price_t>(value);
}

//-------------------------------------------------------------------------

std::string formatWad(const price_t& wad)
{
    const price_t whole = wad / kWad;
    const price_t frac = wad % kWad;

    if (frac == 0) {
        return fmt::format("{}.0", whole.str());
    }

    auto fracStr = fmt::format("{:0>{}}", frac.str(), kWadDecimals);
    fracStr.erase(fracStr.find_last_not_of('0') + 1);

    return fmt::format("{}.{}", whole.str(), fracStr);
}

//-------------------------------------------------------------------------

wide_t isqrt(const wide_t& x)
{
    if (x < 2) return x;

    wide_t z = wide_t{1} << (boost::multiprecision::msb(x) / 2 + 1);
    wide_t y = (z + x / z) >> 1;
    while (y < z) {
        z = y;
        y = (z + x / z) >> 1;
    }

    return z;
}

//-------------------------------------------------------------------------

price_t priceToSqrtPriceX96(const price_t& wad)
{
    const wide_t ratioX192 = (wide_t{wad} << 192) / wide_t{kWad};
    return static_cast<price_t>(isqrt(ratioX192));
}

//-------------------------------------------------------------------------

price_t sqrtPriceX96ToPrice(const price_t& sqrtPriceX96)
{
    static const price_t maxUint160 = (price_t{1} << 160) - 1;

    if (sqrtPriceX96 > maxUint160) {
        throw std::out_of_range{fmt::format(
            "{}: sqrtPriceX96 {} exceeds 160 bits",
            std::source_location::current().function_name(),
            sqrtPriceX96.str())};
    }

    const wide_t s{sqrtPriceX96};
    return static_cast<price_t>((s * s * wide_t{kWad}) >> 192);
}

//-------------------------------------------------------------------------

}  // namespace pegfee::fixed

//-------------------------------------------------------------------------
