/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/config/Config.hpp"

//-------------------------------------------------------------------------

namespace pegfee::config
{

//-------------------------------------------------------------------------

Nodes parseConfigFile(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto doc = std::make_unique<pugi::xml_document>();
    pugi::xml_parse_result parseResult = doc->load_file(path.c_str());
    if (!parseResult) {
        throw std::invalid_argument{fmt::format(
            "{}: Could not parse '{}': {}", ctx, path.string(), parseResult.description())};
    }

    pugi::xml_node root = doc->child("PegFee");
    if (!root) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' has no <PegFee> root", ctx, path.string())};
    }

    pugi::xml_node feeParametersNode = root.child("FeeParameters");
    pugi::xml_node pegNode = root.child("Peg");
    if (!feeParametersNode || !pegNode) {
        throw std::invalid_argument{fmt::format(
            "{}: <PegFee> in '{}' requires <FeeParameters> and <Peg>", ctx, path.string())};
    }

    return {
        .doc = std::move(doc),
        .root = root,
        .feeParameters = feeParametersNode,
        .peg = pegNode
    };
}

//-------------------------------------------------------------------------

std::unique_ptr<hook::PegFeeHook> makePegFeeHook(const Nodes& nodes)
{
    return std::make_unique<hook::PegFeeHook>(
        fee::FeeEngine{fee::makeFeeParameters(nodes.feeParameters)},
        hook::FixedPegOracle::fromXML(nodes.peg));
}

//-------------------------------------------------------------------------

}  // namespace pegfee::config

//-------------------------------------------------------------------------
