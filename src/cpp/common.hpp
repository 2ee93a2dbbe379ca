/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "pegfee/decimal/decimal.hpp"

#include <boost/signals2.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;

using namespace pegfee::literals;

//-------------------------------------------------------------------------

namespace pegfee
{

// Fee units are pips: hundredths of a basis point, 1'000'000 == 100%.
using fee_t = uint32_t;
using bps_t = uint32_t;

}  // namespace pegfee

//-------------------------------------------------------------------------

template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using UnsyncSignal = bs2::signal_type<SlotType, bs2::keywords::mutex_type<bs2::dummy_mutex>>::type;

//-------------------------------------------------------------------------
