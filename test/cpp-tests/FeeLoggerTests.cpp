/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "pegfee/logging/FeeLogger.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>
#include <vector>

//-------------------------------------------------------------------------

using namespace pegfee;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

std::vector<std::string> readLines(const fs::path& path)
{
    std::ifstream in{path};
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

//-------------------------------------------------------------------------

class FeeLoggerTest : public Test
{
protected:
    void SetUp() override
    {
        feeHook = std::make_unique<hook::PegFeeHook>(
            fee::FeeEngine{fee::FeeParameters{
                .baseFee = 3000,
                .minFee = 500,
                .maxFee = 10'000,
                .deadzoneBps = 25,
                .slopeToward = 150,
                .slopeAway = 1200,
                .arbTriggerBps = 5000}},
            std::make_unique<hook::FixedPegOracle>(fixed::kWad));
        logPath = fs::temp_directory_path()
            / fmt::format("{}.csv", UnitTest::GetInstance()->current_test_info()->name());
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(logPath, ec);
    }

    std::unique_ptr<hook::PegFeeHook> feeHook;
    fs::path logPath;
};

//-------------------------------------------------------------------------

TEST_F(FeeLoggerTest, WritesHeaderOnConstruction)
{
    logging::FeeLogger logger{logPath, feeHook->signals().feeLog};

    EXPECT_EQ(logger.filepath(), logPath);
    EXPECT_THAT(readLines(logPath), ElementsAre(std::string{logging::FeeLogger::s_header}));
}

//-------------------------------------------------------------------------

TEST_F(FeeLoggerTest, WritesOneRowPerQuote)
{
    logging::FeeLogger logger{logPath, feeHook->signals().feeLog};

    ASSERT_TRUE(feeHook->quote(fixed::parseWad("1.05"), fee::PriceImpact::DECREASE).has_value());
    ASSERT_TRUE(feeHook->quote(fixed::parseWad("0.95"), fee::PriceImpact::DECREASE).has_value());
    ASSERT_TRUE(feeHook->quote(fixed::parseWad("1.6"), fee::PriceImpact::INCREASE).has_value());
    ASSERT_FALSE(feeHook->quote(price_t{0}, fee::PriceImpact::INCREASE).has_value());

    const auto lines = readLines(logPath);
    ASSERT_THAT(lines, SizeIs(4));
    EXPECT_EQ(lines[0], logging::FeeLogger::s_header);
    EXPECT_THAT(lines[1], StartsWith("0,DECREASE,1.05,1.0,500,GRADUATED,true,4,2400,2400,"));
    EXPECT_THAT(lines[2], StartsWith("1,DECREASE,0.95,1.0,500,GRADUATED,false,4,7800,7800,"));
    EXPECT_THAT(lines[3], StartsWith("2,INCREASE,1.6,1.0,6000,ARBITRAGE,false,0,10000,10000,"));
}

//-------------------------------------------------------------------------

TEST_F(FeeLoggerTest, StopsLoggingWhenDestroyed)
{
    {
        logging::FeeLogger logger{logPath, feeHook->signals().feeLog};
        ASSERT_TRUE(feeHook->quote(fixed::kWad, fee::PriceImpact::INCREASE).has_value());
    }
    ASSERT_TRUE(feeHook->quote(fixed::kWad, fee::PriceImpact::INCREASE).has_value());

    const auto lines = readLines(logPath);
    ASSERT_THAT(lines, SizeIs(2));
    EXPECT_THAT(lines[1], StartsWith("0,INCREASE,1.0,1.0,0,DEADZONE,true,0,3000,3000,"));
    EXPECT_EQ(feeHook->quoteCount(), 2);
}

//-------------------------------------------------------------------------
