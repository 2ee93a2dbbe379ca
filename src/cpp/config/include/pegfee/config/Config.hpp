/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "pegfee/hook/PegFeeHook.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace pegfee::config
{

//-------------------------------------------------------------------------

/**
 * <PegFee>
 *     <FeeParameters baseFee="3000" minFee="500" maxFee="10000" deadzoneBps="25"
 *                    slopeToward="150" slopeAway="1200" arbTriggerBps="5000"/>
 *     <Peg price="1.0"/>
 * </PegFee>
 */
struct Nodes
{
    std::unique_ptr<pugi::xml_document> doc;
    pugi::xml_node root;
    pugi::xml_node feeParameters;
    pugi::xml_node peg;
};

[[nodiscard]] Nodes parseConfigFile(const fs::path& path);

[[nodiscard]] std::unique_ptr<hook::PegFeeHook> makePegFeeHook(const Nodes& nodes);

//-------------------------------------------------------------------------

}  // namespace pegfee::config

//-------------------------------------------------------------------------
