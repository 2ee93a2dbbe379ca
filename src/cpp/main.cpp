/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/config/Config.hpp"
#include "pegfee/logging/FeeLogger.hpp"
#include "pegfee/serialization/msgpack_util.hpp"
#include "common.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <fstream>

//-------------------------------------------------------------------------

namespace
{

using namespace pegfee;

int run(
    const fs::path& configFile,
    const std::string& poolPrice,
    const std::string& sqrtPriceX96,
    fee::PriceImpact direction,
    const fs::path& logFile,
    const fs::path& dumpFile,
    bool debug)
{
    const auto nodes = config::parseConfigFile(configFile);
    auto feeHook = config::makePegFeeHook(nodes);
    feeHook->setDebug(debug);

    std::optional<logging::FeeLogger> logger;
    if (!logFile.empty()) {
        logger.emplace(logFile, feeHook->signals().feeLog);
    }

    const auto result = sqrtPriceX96.empty()
        ? feeHook->quote(fixed::parseWad(poolPrice), direction)
        : feeHook->beforeSwap(
            hook::PoolState{.sqrtPriceX96 = price_t{sqrtPriceX96}},
            hook::SwapParams{.zeroForOne = direction == fee::PriceImpact::DECREASE});

    if (!result) {
        fmt::print(stderr, "Quote rejected: {}\n", result.error());
        return 1;
    }

    const auto& diagnostics = result->result.diagnostics;
    fmt::print("fee           {} ({})\n", result->fee, fee::feeRate(result->fee));
    fmt::print("override fee  {:#x}\n", result->overrideFee);
    fmt::print("pool price    {}\n", fixed::formatWad(result->poolPrice));
    fmt::print("peg price     {} (sqrtPriceX96 {})\n",
        fixed::formatWad(result->pegPrice), result->pegSqrtPriceX96);
    fmt::print("direction     {} ({})\n", direction, diagnostics.toward ? "toward" : "away");
    fmt::print("deviation     {} bps, {}\n", diagnostics.devBps, diagnostics.zone);
    fmt::print("pct units     {}\n", diagnostics.pctUnits);
    fmt::print("unclamped     {}\n", diagnostics.unclampedFee);

    if (!dumpFile.empty()) {
        serialization::BinaryStream stream;
        msgpack::pack(stream, result->result);
        std::ofstream out{dumpFile, std::ios::binary};
        out.write(stream.data(), static_cast<std::streamsize>(stream.size()));
        if (!out) {
            fmt::print(stderr, "Could not write '{}'\n", dumpFile.string());
            return 1;
        }
    }

    return 0;
}

}  // namespace

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"pegfee v1.0"};

    fs::path configFile;
    app.add_option("-f,--config-file", configFile, "Fee config file")
        ->required()
        ->check(CLI::ExistingFile);

    CLI::Option_group* priceGroup = app.add_option_group("Price");

    std::string poolPrice;
    priceGroup->add_option("-p,--pool-price", poolPrice, "Pool price as a decimal, e.g. 1.0020");

    std::string sqrtPriceX96;
    priceGroup->add_option("-s,--sqrt-price-x96", sqrtPriceX96, "Pool price in its sqrt Q64.96 encoding")
        ->check([](const std::string& str) -> std::string {
            // At most 160 bits, which is never more than 49 decimal digits.
            if (str.empty() || str.size() > 49
                || !std::ranges::all_of(str, [](char c) { return '0' <= c && c <= '9'; })) {
                return fmt::format("'{}' is not a 160-bit unsigned integer", str);
            }
            return {};
        });

    priceGroup->require_option(1);

    std::string direction;
    app.add_option("-d,--direction", direction, "Price impact of the swap")
        ->required()
        ->check(CLI::IsMember({"up", "down"}));

    fs::path logFile;
    app.add_option("--log", logFile, "CSV log of the quote");

    fs::path dumpFile;
    app.add_option("--dump", dumpFile, "Write the fee result as msgpack");

    bool debug{};
    app.add_flag("--debug", debug, "Trace the fee derivation");

    CLI11_PARSE(app, argc, argv);

    try {
        return run(
            configFile,
            poolPrice,
            sqrtPriceX96,
            direction == "down"
                ? pegfee::fee::PriceImpact::DECREASE
                : pegfee::fee::PriceImpact::INCREASE,
            logFile,
            dumpFile,
            debug);
    }
    catch (const std::exception& e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }
}

//-------------------------------------------------------------------------
