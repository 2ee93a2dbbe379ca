/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "pegfee/fee/FeeEngine.hpp"

//-------------------------------------------------------------------------

namespace pegfee
{

struct FeeLogEvent
{
    uint64_t sequence;
    fee::PriceImpact direction;
    price_t poolPrice;
    price_t pegPrice;
    fee::FeeResult result;
};

}  // namespace pegfee

//-------------------------------------------------------------------------
