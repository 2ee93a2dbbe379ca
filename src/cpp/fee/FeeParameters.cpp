/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/fee/FeeParameters.hpp"

#include <fmt/format.h>

#include <charconv>

//-------------------------------------------------------------------------

namespace pegfee::fee
{

//-------------------------------------------------------------------------

namespace
{

enum class ParameterRule : uint32_t
{
    FEE_ORDER,
    FEE_CEILING,
    THRESHOLD_ORDER
};

[[nodiscard]] std::optional<ParameterRule> firstViolatedRule(const FeeParameters& params) noexcept
{
    if (!(params.minFee <= params.baseFee && params.baseFee <= params.maxFee)) {
        return ParameterRule::FEE_ORDER;
    }
    if (params.maxFee > kMaxLpFee) {
        return ParameterRule::FEE_CEILING;
    }
    if (!(params.deadzoneBps < params.arbTriggerBps)) {
        return ParameterRule::THRESHOLD_ORDER;
    }
    return std::nullopt;
}

}  // namespace

//-------------------------------------------------------------------------

FeeErrorCode validateFeeParameters(const FeeParameters& params) noexcept
{
    return firstViolatedRule(params).has_value()
        ? FeeErrorCode::INVALID_PARAMETERS
        : FeeErrorCode::VALID;
}

//-------------------------------------------------------------------------

FeeParameters makeFeeParameters(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getAttr = [](pugi::xml_node node, const char* name) {
        if (pugi::xml_attribute attr = node.attribute(name)) {
            return attr;
        }
        throw std::invalid_argument{fmt::format(
            "{}: Missing required argument '{}'", ctx, name)};
    };

    // Plain digits only; signs, whitespace and values beyond 32 bits are rejected.
    auto getUint = [&](const char* name) {
        const std::string_view text = getAttr(node, name).as_string();
        uint32_t value{};
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
            throw std::invalid_argument{fmt::format(
                "{}: '{}' should be a non-negative integer; was '{}'", ctx, name, text)};
        }
        return value;
    };

    const FeeParameters params{
        .baseFee = getUint("baseFee"),
        .minFee = getUint("minFee"),
        .maxFee = getUint("maxFee"),
        .deadzoneBps = getUint("deadzoneBps"),
        .slopeToward = getUint("slopeToward"),
        .slopeAway = getUint("slopeAway"),
        .arbTriggerBps = getUint("arbTriggerBps")
    };

    const auto violated = firstViolatedRule(params);
    if (!violated) {
        return params;
    }

    switch (*violated) {
        case ParameterRule::FEE_ORDER:
            throw std::invalid_argument{fmt::format(
                "{}: Fees should satisfy minFee <= baseFee <= maxFee; were {}, {}, {}",
                ctx, params.minFee, params.baseFee, params.maxFee)};
        case ParameterRule::FEE_CEILING:
            throw std::invalid_argument{fmt::format(
                "{}: 'maxFee' should be at most {}; was {}", ctx, kMaxLpFee, params.maxFee)};
        case ParameterRule::THRESHOLD_ORDER:
            throw std::invalid_argument{fmt::format(
                "{}: 'arbTriggerBps' {} should exceed 'deadzoneBps' {}",
                ctx, params.arbTriggerBps, params.deadzoneBps)};
        default:
            std::unreachable();
    }
}

//-------------------------------------------------------------------------

}  // namespace pegfee::fee

//-------------------------------------------------------------------------
