/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "pegfee/fee/FeeErrorCode.hpp"
#include "pegfee/fee/FeeParameters.hpp"
#include "pegfee/fee/FeeResult.hpp"
#include "pegfee/fixed/FixedPoint.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace pegfee::fee
{

//-------------------------------------------------------------------------

/**
 * Which way the pending trade pushes the pool price.
 */
enum class PriceImpact : uint32_t
{
    DECREASE,
    INCREASE
};

[[nodiscard]] constexpr std::string_view PriceImpact2StrView(PriceImpact impact) noexcept
{
    return magic_enum::enum_name(impact);
}

//-------------------------------------------------------------------------

using ExpectedFeeResult = std::expected<FeeResult, FeeErrorCode>;

/**
 * Derives an asymmetric swap fee from the pool's deviation to its peg.
 *
 * Trades that move the pool price toward the peg are charged less than the base fee,
 * trades that move it away are charged more, in whole-percentage-point steps beyond a
 * dead-zone. Past the arbitrage trigger the fee snaps to the matching bound. The result
 * is always clamped into [minFee, maxFee].
 *
 * Stateless apart from the immutable parameters; safe to call from any thread.
 */
class FeeEngine
{
public:
    /**
     * Throws std::invalid_argument if the parameters are inconsistent.
     */
    explicit FeeEngine(const FeeParameters& params);

    [[nodiscard]] static std::expected<FeeEngine, FeeErrorCode> create(
        const FeeParameters& params) noexcept;

    [[nodiscard]] ExpectedFeeResult computeFee(
        const price_t& poolPrice, const price_t& pegPrice, PriceImpact direction) const;

    [[nodiscard]] const FeeParameters& parameters() const noexcept { return m_params; }

private:
    struct Validated {};

    FeeEngine(const FeeParameters& params, Validated) noexcept : m_params{params} {}

    FeeParameters m_params;
};

//-------------------------------------------------------------------------

/**
 * One-shot form: validates the parameters, then the prices, then computes.
 */
[[nodiscard]] ExpectedFeeResult computeFee(
    const price_t& poolPrice,
    const price_t& pegPrice,
    PriceImpact direction,
    const FeeParameters& params);

/**
 * |poolPrice - pegPrice| * 10000 / pegPrice, truncated. The product is formed in 512 bits;
 * the quotient saturates at the uint64_t maximum, which is far above any bps threshold.
 * pegPrice must be nonzero.
 */
[[nodiscard]] uint64_t deviationBps(const price_t& poolPrice, const price_t& pegPrice);

[[nodiscard]] bool isToward(
    const price_t& poolPrice, const price_t& pegPrice, PriceImpact direction) noexcept;

//-------------------------------------------------------------------------

}  // namespace pegfee::fee

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<pegfee::fee::PriceImpact>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(pegfee::fee::PriceImpact impact, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", pegfee::fee::PriceImpact2StrView(impact));
    }
};

//-------------------------------------------------------------------------
