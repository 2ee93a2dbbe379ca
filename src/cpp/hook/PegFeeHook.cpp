/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/hook/PegFeeHook.hpp"

//-------------------------------------------------------------------------

namespace pegfee::hook
{

//-------------------------------------------------------------------------

PegFeeHook::PegFeeHook(fee::FeeEngine engine, std::unique_ptr<PegOracle> oracle)
    : m_engine{std::move(engine)},
      m_oracle{std::move(oracle)}
{
    if (!m_oracle) {
        throw std::invalid_argument{fmt::format(
            "{}: A peg oracle is required", std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

ExpectedHookResult PegFeeHook::beforeSwap(const PoolState& pool, const SwapParams& swap)
{
    if (!fixed::isValidSqrtPriceX96(pool.sqrtPriceX96)) {
        logDebug("beforeSwap | sqrtPriceX96 {} OUT OF RANGE", pool.sqrtPriceX96);
        return std::unexpected{fee::FeeErrorCode::INVALID_PRICE};
    }
    return quote(fixed::sqrtPriceX96ToPrice(pool.sqrtPriceX96), priceImpactOf(swap));
}

//-------------------------------------------------------------------------

ExpectedHookResult PegFeeHook::quote(const price_t& poolPrice, fee::PriceImpact direction)
{
    const price_t pegPrice = m_oracle->pegPrice();

    auto result = m_engine.computeFee(poolPrice, pegPrice, direction);
    if (!result) {
        logDebug("QUOTE | POOL {} PEG {} | {}", poolPrice, pegPrice, result.error());
        return std::unexpected{result.error()};
    }

    const auto& diagnostics = result->diagnostics;
    logDebug(
        "QUOTE #{} | {} | POOL {} PEG {} | DEV {}bps {} {} | UNITS {} | FEE {} -> {}",
        m_sequence,
        direction,
        poolPrice,
        pegPrice,
        diagnostics.devBps,
        diagnostics.zone,
        diagnostics.toward ? "TOWARD" : "AWAY",
        diagnostics.pctUnits,
        diagnostics.unclampedFee,
        result->fee);

    m_signals.feeLog(FeeLogEvent{
        .sequence = m_sequence,
        .direction = direction,
        .poolPrice = poolPrice,
        .pegPrice = pegPrice,
        .result = *result
    });
    ++m_sequence;

    return HookResult{
        .fee = result->fee,
        .overrideFee = result->fee | kOverrideFeeFlag,
        .poolPrice = poolPrice,
        .pegPrice = pegPrice,
        .pegSqrtPriceX96 = fixed::priceToSqrtPriceX96(pegPrice),
        .result = *result
    };
}

//-------------------------------------------------------------------------

}  // namespace pegfee::hook

//-------------------------------------------------------------------------
