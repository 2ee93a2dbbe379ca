/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace pegfee
{

using price_t = boost::multiprecision::uint256_t;
using wide_t = boost::multiprecision::uint512_t;

}  // namespace pegfee

//-------------------------------------------------------------------------

namespace pegfee::fixed
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kWadDecimals = 18;
inline const price_t kWad{1'000'000'000'000'000'000ull};
inline const price_t kQ96 = price_t{1} << 96;

// Bounds of the pool's native price encoding (ticks -887272 and 887272).
inline const price_t kMinSqrtPriceX96{4295128739ull};
inline const price_t kMaxSqrtPriceX96{"1461446703485210103287273052203988822378723970342"};

//-------------------------------------------------------------------------

/**
 * Parses a plain decimal string ("1.0020", "42") into an 18-decimal fixed-point value.
 * Throws std::invalid_argument on malformed input or excess fractional digits.
 */
[[nodiscard]] price_t parseWad(std::string_view str);

[[nodiscard]] std::string formatWad(const price_t& wad);

/**
 * Floor of the square root, by Newton's method seeded above the root.
 */
[[nodiscard]] wide_t isqrt(const wide_t& x);

/**
 * floor(sqrt(price) * 2^96) for a WAD price.
 */
[[nodiscard]] price_t priceToSqrtPriceX96(const price_t& wad);

/**
 * floor(sqrtPriceX96^2 * 10^18 / 2^192). The argument must fit in 160 bits.
 */
[[nodiscard]] price_t sqrtPriceX96ToPrice(const price_t& sqrtPriceX96);

[[nodiscard]] inline bool isValidSqrtPriceX96(const price_t& sqrtPriceX96) noexcept
{
    return kMinSqrtPriceX96 <= sqrtPriceX96 && sqrtPriceX96 <= kMaxSqrtPriceX96;
}

//-------------------------------------------------------------------------

}  // namespace pegfee::fixed

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<pegfee::price_t> : fmt::formatter<std::string>
{
    template<typename FormatContext>
    auto format(const pegfee::price_t& val, FormatContext& ctx) const
    {
        return fmt::formatter<std::string>::format(val.str(), ctx);
    }
};

//-------------------------------------------------------------------------
