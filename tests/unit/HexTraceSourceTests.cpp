#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>

#include "SimTrace/Source/HexTraceSource.h"

using namespace simtrace;

namespace
{
    FILE* streamWith(const char* text)
    {
        FILE* stream = std::tmpfile();
        EXPECT_NE(stream, nullptr);
        if (stream != nullptr)
        {
            std::fputs(text, stream);
            std::rewind(stream);
        }
        return stream;
    }

    error::DecodeError decodeErrorOf(const char* line)
    {
        auto parsed = HexTraceSource::parseLine(line);
        EXPECT_FALSE(parsed.has_value()) << line;
        if (parsed.has_value() || !parsed.error().is<error::DecodeError>())
        {
            return error::DecodeError::Ok;
        }
        return parsed.error().get<error::DecodeError>();
    }
}

// ============================================================================
// Line format
// ============================================================================

TEST(HexTraceSourceTests, BlankAndCommentLinesCarryNoEvent)
{
    for (const char* line : {"", "   \t", "# select MF", "   # indented comment\n"})
    {
        auto parsed = HexTraceSource::parseLine(line);
        ASSERT_TRUE(parsed.has_value()) << line;
        EXPECT_FALSE(parsed.value().has_value()) << line;
    }
}

TEST(HexTraceSourceTests, ResetAndAtrLinesAreCardResets)
{
    for (const char* line : {"RESET", "reset\n", "ATR 3B9F96801F878031E073FE211B674A4C753034054BA9"})
    {
        auto parsed = HexTraceSource::parseLine(line);
        ASSERT_TRUE(parsed.has_value()) << line;
        ASSERT_TRUE(parsed.value().has_value()) << line;
        EXPECT_TRUE(etl::holds_alternative<CardReset>(parsed.value().value())) << line;
    }
}

TEST(HexTraceSourceTests, TpduLine)
{
    auto parsed = HexTraceSource::parseLine("A0A40000027F209F22  # select DF_GSM\n");
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(parsed.value().has_value());

    const ApduExchange& exchange = etl::get<ApduExchange>(parsed.value().value());
    EXPECT_EQ(exchange.cla, 0xA0);
    EXPECT_TRUE(exchange.hasUnresolvedBody());
    EXPECT_EQ(exchange.getStatusWord(), 0x9F22);
}

TEST(HexTraceSourceTests, CommandAndResponseLine)
{
    auto parsed = HexTraceSource::parseLine("00B0000004 010203049000");
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(parsed.value().has_value());

    const ApduExchange& exchange = etl::get<ApduExchange>(parsed.value().value());
    EXPECT_FALSE(exchange.hasUnresolvedBody());
    EXPECT_EQ(exchange.responseData.size(), 4U);
    EXPECT_EQ(exchange.getStatusWord(), 0x9000);
}

TEST(HexTraceSourceTests, MalformedLines)
{
    EXPECT_EQ(decodeErrorOf("00A4000402XY9000"), error::DecodeError::InvalidHex);
    EXPECT_EQ(decodeErrorOf("00A40004023F00 90G0"), error::DecodeError::InvalidHex);
    EXPECT_EQ(decodeErrorOf("ATR"), error::DecodeError::InvalidHex);
    EXPECT_EQ(decodeErrorOf("RESET now"), error::DecodeError::InvalidParameter);
    EXPECT_EQ(decodeErrorOf("00A4 0004 9000"), error::DecodeError::InvalidParameter);
    EXPECT_EQ(decodeErrorOf("00A49000"), error::DecodeError::TooShort);
}

// ============================================================================
// Stream reading
// ============================================================================

TEST(HexTraceSourceTests, ReadsEventsInOrder)
{
    FILE* stream = streamWith(
        "# capture\n"
        "RESET\n"
        "\n"
        "00A40004023F009000\n"
        "80F20000 9000");
    ASSERT_NE(stream, nullptr);

    HexTraceSource source(stream);
    ASSERT_TRUE(source.open().has_value());

    auto reset = source.readNext();
    ASSERT_TRUE(reset.has_value());
    EXPECT_TRUE(etl::holds_alternative<CardReset>(reset.value()));

    auto select = source.readNext();
    ASSERT_TRUE(select.has_value());
    ASSERT_TRUE(etl::holds_alternative<ApduExchange>(select.value()));
    EXPECT_EQ(etl::get<ApduExchange>(select.value()).ins, 0xA4);

    auto status = source.readNext();
    ASSERT_TRUE(status.has_value());
    ASSERT_TRUE(etl::holds_alternative<ApduExchange>(status.value()));
    EXPECT_EQ(etl::get<ApduExchange>(status.value()).ins, 0xF2);

    for (int i = 0; i < 2; ++i)
    {
        auto end = source.readNext();
        ASSERT_TRUE(end.has_value());
        EXPECT_TRUE(etl::holds_alternative<EndOfStream>(end.value()));
    }

    source.close();
    std::fclose(stream);
}

TEST(HexTraceSourceTests, MalformedLineStopsReading)
{
    FILE* stream = streamWith("00A40004023F009000\nnot hex\n");
    ASSERT_NE(stream, nullptr);

    HexTraceSource source(stream);
    ASSERT_TRUE(source.open().has_value());

    ASSERT_TRUE(source.readNext().has_value());

    auto broken = source.readNext();
    ASSERT_FALSE(broken.has_value());
    EXPECT_TRUE(broken.error().is<error::DecodeError>());

    std::fclose(stream);
}

TEST(HexTraceSourceTests, MissingFileFailsToOpen)
{
    HexTraceSource source(etl::string<256>("/nonexistent/trace.hex"));

    auto opened = source.open();
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().get<error::SourceError>(), error::SourceError::OpenFailed);

    auto event = source.readNext();
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().get<error::SourceError>(), error::SourceError::NotOpen);
}
