/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/hook/PegOracle.hpp"

#include <fmt/format.h>

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace pegfee::hook
{

//-------------------------------------------------------------------------

std::unique_ptr<FixedPegOracle> FixedPegOracle::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_attribute attr = node.attribute("price");
    if (!attr) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing required argument 'price'", ctx)};
    }

    price_t pegPrice = fixed::parseWad(attr.as_string());
    if (pegPrice == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Peg price should be positive; was {}", ctx, attr.as_string())};
    }

    return std::make_unique<FixedPegOracle>(std::move(pegPrice));
}

//-------------------------------------------------------------------------

}  // namespace pegfee::hook

//-------------------------------------------------------------------------
