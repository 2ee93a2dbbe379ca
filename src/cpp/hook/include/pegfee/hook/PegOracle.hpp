/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "pegfee/fixed/FixedPoint.hpp"

#include <pugixml.hpp>

#include <memory>

//-------------------------------------------------------------------------

namespace pegfee::hook
{

//-------------------------------------------------------------------------

struct PegOracle
{
    virtual ~PegOracle() noexcept = default;

    [[nodiscard]] virtual price_t pegPrice() const = 0;
};

//-------------------------------------------------------------------------

class FixedPegOracle : public PegOracle
{
public:
    explicit FixedPegOracle(price_t pegPrice) noexcept : m_pegPrice{std::move(pegPrice)} {}

    [[nodiscard]] price_t pegPrice() const override { return m_pegPrice; }

    /**
     * Reads <Peg price="1.0"/>. Throws std::invalid_argument on a missing or malformed price.
     */
    [[nodiscard]] static std::unique_ptr<FixedPegOracle> fromXML(pugi::xml_node node);

private:
    price_t m_pegPrice;
};

//-------------------------------------------------------------------------

}  // namespace pegfee::hook

//-------------------------------------------------------------------------
