/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "pegfee/hook/PegFeeHook.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace pegfee::logging
{

//-------------------------------------------------------------------------

class FeeLogger
{
public:
    FeeLogger(const fs::path& filepath, decltype(hook::HookSignals::feeLog)& signal);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    static constexpr std::string_view s_header =
        "Seq,Direction,PoolPrice,PegPrice,DevBps,Zone,Toward,PctUnits,Unclamped,Fee,FeeRate";

private:
    void log(const FeeLogEvent& event);

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_feed;
};

//-------------------------------------------------------------------------

}  // namespace pegfee::logging

//-------------------------------------------------------------------------
