#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include "SimTrace/Source/GsmtapParser.h"
#include "SimTrace/Source/PcapFileSource.h"
#include "Utils/Hex.h"

using namespace simtrace;

namespace
{
    using Bytes = etl::vector<uint8_t, buffer::PACKET_MAX>;

    Bytes bytes(const char* hex)
    {
        Bytes out;
        EXPECT_TRUE(utils::parseHex(hex, out)) << hex;
        return out;
    }

    // GSMTAP v2, 16 byte header, type SIM, sub type APDU
    const char* const GSMTAP_SELECT_MF =
        "02040400 00000000 00000000 00000000"
        "00A40004023F00 9000";

    // GSMTAP v2, 16 byte header, type SIM, sub type ATR
    const char* const GSMTAP_ATR =
        "02040400 00000000 00000000 01000000"
        "3B9F96";

    // IPv4 127.0.0.1:1234 -> 127.0.0.1:53
    const char* const FRAME_DNS =
        "45000020 00000000 40110000 7F000001 7F000001"
        "04D20035 000C0000"
        "DEADBEEF";

    const char* const FRAME_ATR =
        "4500002F 00000000 40110000 7F000001 7F000001"
        "04D21279 001B0000"
        "02040400 00000000 00000000 01000000 3B9F96";

    const char* const FRAME_SELECT_MF =
        "45000035 00000000 40110000 7F000001 7F000001"
        "04D21279 00210000"
        "02040400 00000000 00000000 00000000 00A40004023F00 9000";

    class TemporaryFile
    {
    public:
        TemporaryFile()
        {
            std::snprintf(name, sizeof(name), "/tmp/simtrace_testXXXXXX");
            const int fd = mkstemp(name);
            EXPECT_GE(fd, 0);
            if (fd >= 0)
            {
                ::close(fd);
            }
        }

        ~TemporaryFile()
        {
            std::remove(name);
        }

        void write(const Bytes& content)
        {
            FILE* file = std::fopen(name, "wb");
            ASSERT_NE(file, nullptr);
            EXPECT_EQ(std::fwrite(content.data(), 1, content.size(), file), content.size());
            std::fclose(file);
        }

        etl::string<256> path() const
        {
            return etl::string<256>(name);
        }

    private:
        char name[64];
    };

    void appendRecord(Bytes& file, const Bytes& frame, bool bigEndian)
    {
        const uint32_t length = static_cast<uint32_t>(frame.size());

        for (int i = 0; i < 8; ++i)
        {
            file.push_back(0x00);
        }
        for (int copy = 0; copy < 2; ++copy)
        {
            for (int i = 0; i < 4; ++i)
            {
                const int shift = bigEndian ? (3 - i) * 8 : i * 8;
                file.push_back(static_cast<uint8_t>(length >> shift));
            }
        }
        file.insert(file.end(), frame.begin(), frame.end());
    }
}

// ============================================================================
// GSMTAP datagrams
// ============================================================================

TEST(GsmtapParserTests, DecodesApduDatagram)
{
    const Bytes datagram = bytes(GSMTAP_SELECT_MF);

    auto event = gsmtap::parse(datagram.data(), datagram.size());
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event.value().has_value());
    ASSERT_TRUE(etl::holds_alternative<ApduExchange>(event.value().value()));

    const ApduExchange& exchange = etl::get<ApduExchange>(event.value().value());
    EXPECT_EQ(exchange.ins, 0xA4);
    EXPECT_EQ(exchange.body.size(), 2U);
    EXPECT_EQ(exchange.getStatusWord(), 0x9000);
}

TEST(GsmtapParserTests, AtrDatagramIsCardReset)
{
    const Bytes datagram = bytes(GSMTAP_ATR);

    auto event = gsmtap::parse(datagram.data(), datagram.size());
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event.value().has_value());
    EXPECT_TRUE(etl::holds_alternative<CardReset>(event.value().value()));
}

TEST(GsmtapParserTests, IgnoresOtherTypesAndSubTypes)
{
    const Bytes um = bytes("02040100 00000000 00000000 00000000 0102");
    auto other = gsmtap::parse(um.data(), um.size());
    ASSERT_TRUE(other.has_value());
    EXPECT_FALSE(other.value().has_value());

    const Bytes pps = bytes("02040400 00000000 00000000 02000000 FF1096");
    auto ignored = gsmtap::parse(pps.data(), pps.size());
    ASSERT_TRUE(ignored.has_value());
    EXPECT_FALSE(ignored.value().has_value());
}

TEST(GsmtapParserTests, RejectsMalformedHeaders)
{
    const Bytes wrongVersion = bytes("03040400 00000000 00000000 00000000 00A40004023F009000");
    const Bytes shortHeader = bytes("02040400 00000000");
    const Bytes headerTooLong = bytes("02080400 00000000 00000000 00000000 00A4");

    for (const Bytes* datagram : {&wrongVersion, &shortHeader, &headerTooLong})
    {
        auto event = gsmtap::parse(datagram->data(), datagram->size());
        ASSERT_FALSE(event.has_value());
        ASSERT_TRUE(event.error().is<error::SourceError>());
        EXPECT_EQ(event.error().get<error::SourceError>(), error::SourceError::MalformedPacket);
    }
}

TEST(GsmtapParserTests, ShortApduIsDecodeError)
{
    const Bytes datagram = bytes("02040400 00000000 00000000 00000000 00A49000");

    auto event = gsmtap::parse(datagram.data(), datagram.size());
    ASSERT_FALSE(event.has_value());
    ASSERT_TRUE(event.error().is<error::DecodeError>());
    EXPECT_EQ(event.error().get<error::DecodeError>(), error::DecodeError::TooShort);
}

// ============================================================================
// Link layer framing
// ============================================================================

TEST(PcapFileSourceTests, ExtractsPayloadFromRawIpv4)
{
    const Bytes frame = bytes(
        "45000020 00000000 40110000 7F000001 7F000001"
        "04D21279 000C0000"
        "DEADBEEF");

    size_t offset = 0;
    size_t length = 0;
    ASSERT_TRUE(PcapFileSource::extractGsmtapPayload(101, frame.data(), frame.size(), offset, length));
    EXPECT_EQ(offset, 28U);
    EXPECT_EQ(length, 4U);
}

TEST(PcapFileSourceTests, ExtractsPayloadFromEthernet)
{
    const Bytes frame = bytes(
        "FFFFFFFFFFFF 000000000001 0800"
        "45000020 00000000 40110000 7F000001 7F000001"
        "12791279 000C0000"
        "DEADBEEF");

    size_t offset = 0;
    size_t length = 0;
    ASSERT_TRUE(PcapFileSource::extractGsmtapPayload(1, frame.data(), frame.size(), offset, length));
    EXPECT_EQ(offset, 42U);
    EXPECT_EQ(length, 4U);
}

TEST(PcapFileSourceTests, ExtractsPayloadBehindVlanTag)
{
    const Bytes frame = bytes(
        "FFFFFFFFFFFF 000000000001 8100 0064 0800"
        "45000020 00000000 40110000 7F000001 7F000001"
        "04D21279 000C0000"
        "DEADBEEF");

    size_t offset = 0;
    size_t length = 0;
    ASSERT_TRUE(PcapFileSource::extractGsmtapPayload(1, frame.data(), frame.size(), offset, length));
    EXPECT_EQ(offset, 46U);
}

TEST(PcapFileSourceTests, RejectsNonGsmtapFrames)
{
    size_t offset = 0;
    size_t length = 0;

    const Bytes otherPort = bytes(FRAME_DNS);
    EXPECT_FALSE(PcapFileSource::extractGsmtapPayload(101, otherPort.data(), otherPort.size(), offset, length));

    const Bytes tcp = bytes(
        "45000020 00000000 40060000 7F000001 7F000001"
        "04D21279 000C0000"
        "DEADBEEF");
    EXPECT_FALSE(PcapFileSource::extractGsmtapPayload(101, tcp.data(), tcp.size(), offset, length));

    const Bytes fragment = bytes(
        "45000020 00002000 40110000 7F000001 7F000001"
        "04D21279 000C0000"
        "DEADBEEF");
    EXPECT_FALSE(PcapFileSource::extractGsmtapPayload(101, fragment.data(), fragment.size(), offset, length));

    const Bytes truncated = bytes("45000020 00000000 40110000 7F000001");
    EXPECT_FALSE(PcapFileSource::extractGsmtapPayload(101, truncated.data(), truncated.size(), offset, length));

    EXPECT_FALSE(PcapFileSource::extractGsmtapPayload(9, otherPort.data(), otherPort.size(), offset, length));
}

// ============================================================================
// pcap files
// ============================================================================

TEST(PcapFileSourceTests, ReadsLittleEndianCapture)
{
    // Magic, version 2.4, zone, sigfigs, snaplen 65535, link type 101
    Bytes content = bytes("D4C3B2A1 02000400 00000000 00000000 FFFF0000 65000000");
    appendRecord(content, bytes(FRAME_DNS), false);
    appendRecord(content, bytes(FRAME_ATR), false);
    appendRecord(content, bytes(FRAME_SELECT_MF), false);

    TemporaryFile file;
    file.write(content);

    PcapFileSource source(file.path());
    ASSERT_TRUE(source.open().has_value());

    auto first = source.readNext();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(etl::holds_alternative<CardReset>(first.value()));

    auto second = source.readNext();
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(etl::holds_alternative<ApduExchange>(second.value()));
    EXPECT_EQ(etl::get<ApduExchange>(second.value()).ins, 0xA4);

    auto end = source.readNext();
    ASSERT_TRUE(end.has_value());
    EXPECT_TRUE(etl::holds_alternative<EndOfStream>(end.value()));

    auto again = source.readNext();
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(etl::holds_alternative<EndOfStream>(again.value()));

    source.close();
}

TEST(PcapFileSourceTests, ReadsBigEndianCapture)
{
    Bytes content = bytes("A1B2C3D4 00020004 00000000 00000000 0000FFFF 00000065");
    appendRecord(content, bytes(FRAME_SELECT_MF), true);

    TemporaryFile file;
    file.write(content);

    PcapFileSource source(file.path());
    ASSERT_TRUE(source.open().has_value());

    auto event = source.readNext();
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(etl::holds_alternative<ApduExchange>(event.value()));
}

TEST(PcapFileSourceTests, TruncatedLastPacketEndsStream)
{
    Bytes content = bytes("D4C3B2A1 02000400 00000000 00000000 FFFF0000 65000000");
    appendRecord(content, bytes(FRAME_SELECT_MF), false);
    content.resize(content.size() - 10);

    TemporaryFile file;
    file.write(content);

    PcapFileSource source(file.path());
    ASSERT_TRUE(source.open().has_value());

    auto event = source.readNext();
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(etl::holds_alternative<EndOfStream>(event.value()));
}

TEST(PcapFileSourceTests, OpenFailures)
{
    PcapFileSource missing(etl::string<256>("/nonexistent/simtrace.pcap"));
    auto notFound = missing.open();
    ASSERT_FALSE(notFound.has_value());
    EXPECT_EQ(notFound.error().get<error::SourceError>(), error::SourceError::OpenFailed);

    TemporaryFile shortFile;
    shortFile.write(bytes("D4C3B2A1 0200"));
    PcapFileSource truncated(shortFile.path());
    auto tooShort = truncated.open();
    ASSERT_FALSE(tooShort.has_value());
    EXPECT_EQ(tooShort.error().get<error::SourceError>(), error::SourceError::Truncated);

    TemporaryFile textFile;
    textFile.write(bytes("0A0D0D0A 00000000 00000000 00000000 00000000 00000000"));
    PcapFileSource pcapng(textFile.path());
    auto unsupported = pcapng.open();
    ASSERT_FALSE(unsupported.has_value());
    EXPECT_EQ(unsupported.error().get<error::SourceError>(), error::SourceError::UnsupportedFormat);
}

TEST(PcapFileSourceTests, UnreadableFileIsReadError)
{
    // A directory opens but every read on it fails
    char directory[] = "/tmp/simtrace-pcap-XXXXXX";
    ASSERT_NE(mkdtemp(directory), nullptr);

    PcapFileSource source(etl::string<256>(directory));
    auto opened = source.open();
    rmdir(directory);

    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().get<error::SourceError>(), error::SourceError::ReadFailed);
}

TEST(PcapFileSourceTests, ReadBeforeOpenFails)
{
    PcapFileSource source(etl::string<256>("/tmp/unused.pcap"));

    auto event = source.readNext();
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().get<error::SourceError>(), error::SourceError::NotOpen);
}
