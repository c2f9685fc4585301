/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "derivsim/exchange/ExchangeConfig.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <pugixml.hpp>

#include <fstream>

//-------------------------------------------------------------------------

using namespace derivsim;
using namespace derivsim::exchange;
using namespace derivsim::literals;
using namespace testing;

//-------------------------------------------------------------------------

namespace
{

ExchangeConfig configFromString(const char* str)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_string(str);
    if (!result) {
        throw std::runtime_error{result.description()};
    }
    return makeExchangeConfig(doc.child("Exchange"));
}

}  // namespace

//-------------------------------------------------------------------------

TEST(ExchangeConfigTest, Defaults)
{
    const auto config = ExchangeConfig::defaults();

    EXPECT_EQ(config.markPrice, 50'000_dec);
    EXPECT_EQ(config.insuranceFund, 1'000'000_dec);
    EXPECT_EQ(config.defaultLeverage, 10_dec);
    EXPECT_EQ(config.riskLimits.maxUserPositions, 1);
    ASSERT_EQ(config.users.size(), 3);
    EXPECT_EQ(config.users[0].id, "bob");
    EXPECT_EQ(config.users[1].id, "eve");
    EXPECT_EQ(config.users[2].id, "alice");
}

//-------------------------------------------------------------------------

TEST(ExchangeConfigTest, FromXml)
{
    const auto config = configFromString(R"(
        <Exchange markPrice="42000" insuranceFund="500000" defaultLeverage="20"
                  adlEnabled="false" strictInvariants="true" bookDepth="5"
                  historyCapacity="50">
            <RiskLimits maxPositionSize="5" maxLeverage="50" minOrderSize="0.01"/>
            <MarginCalls warning="200" urgent="150" critical="110"/>
            <Users>
                <User id="u1" name="First" balance="25000"/>
                <User id="u2" balance="1000.5"/>
            </Users>
        </Exchange>
    )");

    EXPECT_EQ(config.markPrice, 42'000_dec);
    EXPECT_EQ(config.indexPrice, 42'000_dec);
    EXPECT_EQ(config.insuranceFund, 500'000_dec);
    EXPECT_EQ(config.defaultLeverage, 20_dec);
    EXPECT_FALSE(config.adlEnabled);
    EXPECT_TRUE(config.liquidationEnabled);
    EXPECT_TRUE(config.strictInvariants);
    EXPECT_EQ(config.bookDepth, 5);
    EXPECT_EQ(config.historyCapacity, 50);
    EXPECT_EQ(config.riskLimits.maxPositionSize, 5_dec);
    EXPECT_EQ(config.riskLimits.maxLeverage, 50_dec);
    EXPECT_EQ(config.riskLimits.minOrderSize, DEC(0.01));
    EXPECT_EQ(config.marginCalls.warning, 200_dec);
    EXPECT_EQ(config.marginCalls.critical, 110_dec);
    ASSERT_EQ(config.users.size(), 2);
    EXPECT_EQ(config.users[0].name, "First");
    EXPECT_EQ(config.users[1].name, "u2");
    EXPECT_EQ(config.users[1].balance, DEC(1000.5));
}

//-------------------------------------------------------------------------

struct InvalidConfigTest : TestWithParam<const char*> {};

INSTANTIATE_TEST_SUITE_P(
    ExchangeConfigTest,
    InvalidConfigTest,
    Values(
        R"(<Exchange markPrice="0"/>)",
        R"(<Exchange markPrice="abc"/>)",
        R"(<Exchange bookDepth="0"/>)",
        R"(<Exchange historyCapacity="0"/>)",
        R"(<Exchange defaultLeverage="200"/>)",
        R"(<Exchange><RiskLimits maxUserPositions="2"/></Exchange>)",
        R"(<Exchange><RiskLimits maxLeverage="0.5"/></Exchange>)",
        R"(<Exchange><Users><User id="a" balance="1"/><User id="a" balance="2"/></Users></Exchange>)",
        R"(<Exchange><Users><User balance="1"/></Users></Exchange>)",
        R"(<Exchange><Users><User id="a" balance="-1"/></Users></Exchange>)"));

TEST_P(InvalidConfigTest, Throws)
{
    EXPECT_THROW(static_cast<void>(configFromString(GetParam())), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(ExchangeConfigTest, LoadFromFile)
{
    const auto path = fs::temp_directory_path() / "derivsim-config-test.xml";
    {
        std::ofstream file{path};
        file << R"(<Exchange markPrice="60000"><Users><User id="x" balance="10"/></Users></Exchange>)";
    }

    const auto config = loadExchangeConfig(path);
    EXPECT_EQ(config.markPrice, 60'000_dec);
    ASSERT_EQ(config.users.size(), 1);

    fs::remove(path);
    EXPECT_THROW(static_cast<void>(loadExchangeConfig(path)), std::invalid_argument);
}

//-------------------------------------------------------------------------
