#include <gtest/gtest.h>
#include "SimTrace/Apdu/ApduExchange.h"
#include "Utils/Hex.h"

using namespace simtrace;

namespace
{
    etl::vector<uint8_t, buffer::APDU_RAW_MAX> bytes(const char* hex)
    {
        etl::vector<uint8_t, buffer::APDU_RAW_MAX> out;
        EXPECT_TRUE(utils::parseHex(hex, out));
        return out;
    }
}

TEST(ApduExchangeTests, ParsesTpduWithUnresolvedBody)
{
    auto exchange = ApduExchange::fromTpdu(bytes("A0A40000027F209F22"));
    ASSERT_TRUE(exchange.has_value());

    EXPECT_EQ(exchange->cla, 0xA0);
    EXPECT_EQ(exchange->ins, 0xA4);
    ASSERT_TRUE(exchange->p3.has_value());
    EXPECT_EQ(exchange->p3.value(), 0x02);
    EXPECT_TRUE(exchange->hasUnresolvedBody());
    EXPECT_EQ(exchange->body.size(), 2U);
    EXPECT_TRUE(exchange->hasResponse);
    EXPECT_EQ(exchange->getStatusWord(), 0x9F22);
}

TEST(ApduExchangeTests, RejectsShortTpdu)
{
    auto exchange = ApduExchange::fromTpdu(bytes("A0A4000002"));
    ASSERT_FALSE(exchange.has_value());
    ASSERT_TRUE(exchange.error().is<error::DecodeError>());
    EXPECT_EQ(exchange.error().get<error::DecodeError>(), error::DecodeError::TooShort);
}

TEST(ApduExchangeTests, ResolvesCase2BodyAsResponse)
{
    auto exchange = ApduExchange::fromTpdu(bytes("00B000000401020304 9000"));
    ASSERT_TRUE(exchange.has_value());

    exchange->resolveBody(ApduCase::Case2);
    EXPECT_FALSE(exchange->hasUnresolvedBody());
    EXPECT_TRUE(exchange->commandData.empty());
    EXPECT_EQ(exchange->responseData.size(), 4U);
}

TEST(ApduExchangeTests, ResolvesCase3BodyAsCommandData)
{
    auto exchange = ApduExchange::fromTpdu(bytes("00A40004027F10 9000"));
    ASSERT_TRUE(exchange.has_value());

    exchange->resolveBody(ApduCase::Case3);
    ASSERT_EQ(exchange->commandData.size(), 2U);
    EXPECT_EQ(exchange->commandData[0], 0x7F);
    EXPECT_TRUE(exchange->responseData.empty());
}

TEST(ApduExchangeTests, ParsesCase4CommandAndResponse)
{
    auto exchange = ApduExchange::fromCommandResponse(bytes("00A40004027F1000"), bytes("62038201789000"));
    ASSERT_TRUE(exchange.has_value());

    EXPECT_EQ(exchange->commandData.size(), 2U);
    EXPECT_EQ(exchange->responseData.size(), 5U);
    EXPECT_EQ(exchange->sw1, 0x90);
    EXPECT_TRUE(exchange->isSuccess());
}

TEST(ApduExchangeTests, RejectsLcMismatch)
{
    auto exchange = ApduExchange::fromCommandResponse(bytes("00A40004037F10"), bytes("9000"));
    ASSERT_FALSE(exchange.has_value());
    EXPECT_EQ(exchange.error().get<error::DecodeError>(), error::DecodeError::WrongLength);
}

TEST(ApduExchangeTests, CommandWithoutResponse)
{
    etl::vector<uint8_t, 2> none;
    auto exchange = ApduExchange::fromCommandResponse(bytes("80F2000000"), none);
    ASSERT_TRUE(exchange.has_value());
    EXPECT_FALSE(exchange->hasResponse);
    EXPECT_FALSE(exchange->isSuccess());
}

TEST(ApduExchangeTests, SuccessStatusWords)
{
    ApduExchange exchange(0x00, 0xB0, 0x00, 0x00);
    exchange.hasResponse = true;

    exchange.sw1 = 0x91;
    EXPECT_TRUE(exchange.isSuccess());
    exchange.sw1 = 0x61;
    EXPECT_TRUE(exchange.isSuccess());
    exchange.sw1 = 0x6A;
    exchange.sw2 = 0x82;
    EXPECT_FALSE(exchange.isSuccess());
}
