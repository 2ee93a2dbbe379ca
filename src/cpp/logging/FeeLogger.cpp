/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/logging/FeeLogger.hpp"

//-------------------------------------------------------------------------

namespace pegfee::logging
{

//-------------------------------------------------------------------------

FeeLogger::FeeLogger(const fs::path& filepath, decltype(hook::HookSignals::feeLog)& signal)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "FeeLogger", std::make_shared<spdlog::sinks::basic_file_sink_st>(filepath.string(), true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace(s_header);
    m_logger->flush();

    m_feed = signal.connect([this](const FeeLogEvent& event) { log(event); });
}

//-------------------------------------------------------------------------

void FeeLogger::log(const FeeLogEvent& event)
{
    const auto& diagnostics = event.result.diagnostics;

    m_logger->trace(
        "{},{},{},{},{},{},{},{},{},{},{}",
        event.sequence,
        event.direction,
        fixed::formatWad(event.poolPrice),
        fixed::formatWad(event.pegPrice),
        diagnostics.devBps,
        diagnostics.zone,
        diagnostics.toward,
        diagnostics.pctUnits,
        diagnostics.unclampedFee,
        event.result.fee,
        fee::feeRate(event.result.fee));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace pegfee::logging

//-------------------------------------------------------------------------
