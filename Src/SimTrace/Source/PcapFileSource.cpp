/**
 * @file PcapFileSource.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Replay of GSMTAP-SIM from a pcap capture file implementation
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Source/PcapFileSource.h"
#include "SimTrace/Source/GsmtapParser.h"
#include "Utils/Logging.h"

#include <cerrno>
#include <cstring>

using namespace simtrace;
using namespace simtrace::buffer;
using namespace error;

namespace
{
    constexpr uint32_t MAGIC_MICROSECONDS = 0xA1B2C3D4;
    constexpr uint32_t MAGIC_NANOSECONDS = 0xA1B23C4D;
    constexpr uint32_t MAGIC_MICROSECONDS_SWAPPED = 0xD4C3B2A1;
    constexpr uint32_t MAGIC_NANOSECONDS_SWAPPED = 0x4D3CB2A1;

    constexpr size_t FILE_HEADER_SIZE = 24;
    constexpr size_t RECORD_HEADER_SIZE = 16;

    constexpr uint32_t LINKTYPE_ETHERNET = 1;
    constexpr uint32_t LINKTYPE_RAW = 101;
    constexpr uint32_t LINKTYPE_LINUX_SLL = 113;
    constexpr uint32_t LINKTYPE_IPV4 = 228;
    constexpr uint32_t LINKTYPE_LINUX_SLL2 = 276;

    constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
    constexpr uint16_t ETHERTYPE_VLAN = 0x8100;
    constexpr uint8_t IP_PROTOCOL_UDP = 17;
    constexpr size_t UDP_HEADER_SIZE = 8;

    uint16_t readBigEndian16(const uint8_t* data)
    {
        return static_cast<uint16_t>((data[0] << 8) | data[1]);
    }

    uint32_t readLittleEndian32(const uint8_t* data)
    {
        return static_cast<uint32_t>(data[0])
            | (static_cast<uint32_t>(data[1]) << 8)
            | (static_cast<uint32_t>(data[2]) << 16)
            | (static_cast<uint32_t>(data[3]) << 24);
    }

    /**
     * @brief Locate the network layer behind the link layer header
     */
    bool findIpv4(uint32_t linkType, const uint8_t* frame, size_t length, size_t& offset)
    {
        switch (linkType)
        {
            case LINKTYPE_ETHERNET:
            {
                if (length < 14)
                {
                    return false;
                }
                size_t typeOffset = 12;
                uint16_t etherType = readBigEndian16(frame + typeOffset);
                while (etherType == ETHERTYPE_VLAN && length >= typeOffset + 6)
                {
                    typeOffset += 4;
                    etherType = readBigEndian16(frame + typeOffset);
                }
                offset = typeOffset + 2;
                return etherType == ETHERTYPE_IPV4;
            }

            case LINKTYPE_LINUX_SLL:
                if (length < 16)
                {
                    return false;
                }
                offset = 16;
                return readBigEndian16(frame + 14) == ETHERTYPE_IPV4;

            case LINKTYPE_LINUX_SLL2:
                if (length < 20)
                {
                    return false;
                }
                offset = 20;
                return readBigEndian16(frame) == ETHERTYPE_IPV4;

            case LINKTYPE_RAW:
            case LINKTYPE_IPV4:
                offset = 0;
                return true;

            default:
                return false;
        }
    }
}

// ==============================================================================
// Initialization and Teardown
// ==============================================================================

PcapFileSource::PcapFileSource(const etl::string<256>& path)
    : path(path)
    , file(nullptr)
    , swapped(false)
    , linkType(0)
    , packetCount(0)
    , exhausted(false)
{
}

PcapFileSource::~PcapFileSource()
{
    close();
}

// ==============================================================================
// Open and Close
// ==============================================================================

etl::expected<void, Error> PcapFileSource::open()
{
    if (file != nullptr)
    {
        return {};
    }

    FILE* handle = std::fopen(path.c_str(), "rb");
    if (handle == nullptr)
    {
        LOG_ERROR("Cannot open %s: %s", path.c_str(), std::strerror(errno));
        return etl::unexpected(Error::fromSource(SourceError::OpenFailed));
    }

    uint8_t header[FILE_HEADER_SIZE];
    if (std::fread(header, 1, sizeof(header), handle) != sizeof(header))
    {
        if (std::ferror(handle))
        {
            LOG_ERROR("%s: read failed: %s", path.c_str(), std::strerror(errno));
            std::fclose(handle);
            return etl::unexpected(Error::fromSource(SourceError::ReadFailed));
        }
        LOG_ERROR("%s: file header truncated", path.c_str());
        std::fclose(handle);
        return etl::unexpected(Error::fromSource(SourceError::Truncated));
    }

    const uint32_t magic = readLittleEndian32(header);
    if (magic == MAGIC_MICROSECONDS || magic == MAGIC_NANOSECONDS)
    {
        swapped = false;
    }
    else if (magic == MAGIC_MICROSECONDS_SWAPPED || magic == MAGIC_NANOSECONDS_SWAPPED)
    {
        swapped = true;
    }
    else
    {
        LOG_ERROR("%s: not a pcap file (magic %08X)", path.c_str(), static_cast<unsigned>(magic));
        std::fclose(handle);
        return etl::unexpected(Error::fromSource(SourceError::UnsupportedFormat));
    }

    file = handle;
    linkType = read32(header + 20);
    packetCount = 0;
    exhausted = false;

    LOG_INFO("Reading %s (link type %u)", path.c_str(), static_cast<unsigned>(linkType));
    return {};
}

void PcapFileSource::close()
{
    if (file != nullptr)
    {
        std::fclose(file);
        file = nullptr;
        LOG_DEBUG("%s closed after %u packets", path.c_str(), static_cast<unsigned>(packetCount));
    }
}

etl::expected<SourceEvent, Error> PcapFileSource::readFailed()
{
    LOG_ERROR("%s: read failed after %u packets: %s", path.c_str(),
              static_cast<unsigned>(packetCount), std::strerror(errno));
    return etl::unexpected(Error::fromSource(SourceError::ReadFailed));
}

uint32_t PcapFileSource::read32(const uint8_t* data) const
{
    const uint32_t value = readLittleEndian32(data);
    if (!swapped)
    {
        return value;
    }
    return ((value & 0x000000FF) << 24)
        | ((value & 0x0000FF00) << 8)
        | ((value & 0x00FF0000) >> 8)
        | ((value & 0xFF000000) >> 24);
}

// ==============================================================================
// Read
// ==============================================================================

etl::expected<SourceEvent, Error> PcapFileSource::readNext()
{
    if (exhausted)
    {
        return SourceEvent(EndOfStream());
    }

    if (file == nullptr)
    {
        return etl::unexpected(Error::fromSource(SourceError::NotOpen));
    }

    while (true)
    {
        uint8_t recordHeader[RECORD_HEADER_SIZE];
        const size_t headerRead = std::fread(recordHeader, 1, sizeof(recordHeader), file);
        if (headerRead != sizeof(recordHeader) && std::ferror(file))
        {
            return readFailed();
        }
        if (headerRead == 0)
        {
            exhausted = true;
            return SourceEvent(EndOfStream());
        }
        if (headerRead != sizeof(recordHeader))
        {
            LOG_WARN("%s: record header truncated after %u packets", path.c_str(), static_cast<unsigned>(packetCount));
            exhausted = true;
            return SourceEvent(EndOfStream());
        }

        const uint32_t capturedLength = read32(recordHeader + 8);
        ++packetCount;

        if (capturedLength > sizeof(frame))
        {
            LOG_WARN("%s: skipping packet %u of %u bytes", path.c_str(),
                     static_cast<unsigned>(packetCount), static_cast<unsigned>(capturedLength));
            if (std::fseek(file, static_cast<long>(capturedLength), SEEK_CUR) != 0)
            {
                if (std::ferror(file))
                {
                    return readFailed();
                }
                exhausted = true;
                return SourceEvent(EndOfStream());
            }
            continue;
        }

        if (std::fread(frame, 1, capturedLength, file) != capturedLength)
        {
            if (std::ferror(file))
            {
                return readFailed();
            }
            LOG_WARN("%s: packet %u truncated", path.c_str(), static_cast<unsigned>(packetCount));
            exhausted = true;
            return SourceEvent(EndOfStream());
        }

        size_t payloadOffset = 0;
        size_t payloadLength = 0;
        if (!extractGsmtapPayload(linkType, frame, capturedLength, payloadOffset, payloadLength))
        {
            continue;
        }

        auto event = gsmtap::parse(frame + payloadOffset, payloadLength);
        if (!event)
        {
            LOG_WARN("%s: skipping packet %u: %s", path.c_str(),
                     static_cast<unsigned>(packetCount), event.error().toString().c_str());
            continue;
        }

        if (event.value().has_value())
        {
            return event.value().value();
        }
    }
}

bool PcapFileSource::extractGsmtapPayload(
    uint32_t linkType,
    const uint8_t* frame,
    size_t length,
    size_t& payloadOffset,
    size_t& payloadLength)
{
    size_t ip = 0;
    if (!findIpv4(linkType, frame, length, ip) || length < ip + 20)
    {
        return false;
    }

    const uint8_t* header = frame + ip;
    if ((header[0] >> 4) != 4)
    {
        return false;
    }

    const size_t ihl = static_cast<size_t>(header[0] & 0x0F) * 4;
    const size_t totalLength = readBigEndian16(header + 2);
    const uint16_t fragment = readBigEndian16(header + 6);

    // More fragments flag or a fragment offset
    if ((fragment & 0x3FFF) != 0)
    {
        return false;
    }
    if (header[9] != IP_PROTOCOL_UDP || ihl < 20 || totalLength < ihl + UDP_HEADER_SIZE || length < ip + totalLength)
    {
        return false;
    }

    const uint8_t* udp = header + ihl;
    const uint16_t sourcePort = readBigEndian16(udp);
    const uint16_t destinationPort = readBigEndian16(udp + 2);
    const size_t udpLength = readBigEndian16(udp + 4);

    if (sourcePort != GSMTAP_UDP_PORT && destinationPort != GSMTAP_UDP_PORT)
    {
        return false;
    }
    if (udpLength < UDP_HEADER_SIZE || udpLength > totalLength - ihl)
    {
        return false;
    }

    payloadOffset = ip + ihl + UDP_HEADER_SIZE;
    payloadLength = udpLength - UDP_HEADER_SIZE;
    return true;
}
