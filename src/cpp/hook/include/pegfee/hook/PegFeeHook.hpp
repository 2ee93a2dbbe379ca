/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "pegfee/fee/FeeEngine.hpp"
#include "pegfee/hook/FeeLogEvent.hpp"
#include "pegfee/hook/PegOracle.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace pegfee::hook
{

//-------------------------------------------------------------------------

// Set on a returned fee to make the pool apply it to the current swap only.
inline constexpr fee_t kOverrideFeeFlag = 0x400000;

struct PoolState
{
    price_t sqrtPriceX96;
};

struct SwapParams
{
    // Selling token0 for token1 lowers the token0 price.
    bool zeroForOne;
};

struct HookResult
{
    fee_t fee;
    fee_t overrideFee;
    price_t poolPrice;
    price_t pegPrice;
    price_t pegSqrtPriceX96;
    fee::FeeResult result;
};

using ExpectedHookResult = std::expected<HookResult, fee::FeeErrorCode>;

struct HookSignals
{
    UnsyncSignal<void(const FeeLogEvent&)> feeLog;
};

//-------------------------------------------------------------------------

/**
 * Swap-time boundary around the fee engine. Reads the pool price from its sqrt encoding,
 * asks the oracle for the peg, maps the swap to a price impact, and hands back the fee
 * tagged with the override flag. Every successful quote is published on feeLog.
 *
 * Not thread-safe: quotes are sequenced and signal slots run on the caller's thread.
 */
class PegFeeHook
{
public:
    PegFeeHook(fee::FeeEngine engine, std::unique_ptr<PegOracle> oracle);

    [[nodiscard]] ExpectedHookResult beforeSwap(const PoolState& pool, const SwapParams& swap);
    [[nodiscard]] ExpectedHookResult quote(const price_t& poolPrice, fee::PriceImpact direction);

    [[nodiscard]] const fee::FeeEngine& engine() const noexcept { return m_engine; }
    [[nodiscard]] const PegOracle& oracle() const noexcept { return *m_oracle; }
    [[nodiscard]] HookSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] uint64_t quoteCount() const noexcept { return m_sequence; }

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const
    {
        if (m_debug) {
            fmt::print("{}\n", fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    void setDebug(bool flag) noexcept { m_debug = flag; }
    [[nodiscard]] bool debug() const noexcept { return m_debug; }

    [[nodiscard]] static fee::PriceImpact priceImpactOf(const SwapParams& swap) noexcept
    {
        return swap.zeroForOne ? fee::PriceImpact::DECREASE : fee::PriceImpact::INCREASE;
    }

private:
    fee::FeeEngine m_engine;
    std::unique_ptr<PegOracle> m_oracle;
    HookSignals m_signals;
    uint64_t m_sequence{};
    bool m_debug{};
};

//-------------------------------------------------------------------------

}  // namespace pegfee::hook

//-------------------------------------------------------------------------
