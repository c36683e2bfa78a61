/**
 * @file PcapFileSource.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Replay of GSMTAP-SIM from a pcap capture file
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string.h>
#include <etl/expected.h>
#include <cstdio>
#include <cstdint>

#include "IApduSource.h"
#include "SimTrace/BufferSizes.h"

namespace simtrace
{
    /**
     * @brief Classic libpcap file reader
     *
     * Both byte orders, micro and nanosecond timestamps. Link types Ethernet
     * (with 802.1Q tags), Linux cooked capture v1/v2 and raw IPv4. Only UDP
     * datagrams from or to the GSMTAP port are decoded.
     */
    class PcapFileSource : public IApduSource
    {
    public:
        explicit PcapFileSource(const etl::string<256>& path);

        ~PcapFileSource() override;

        etl::string_view name() const override
        {
            return "gsmtap-pcap";
        }

        etl::expected<void, error::Error> open() override;

        void close() override;

        etl::expected<SourceEvent, error::Error> readNext() override;

        /**
         * @brief Locate the UDP payload of a GSMTAP datagram in a captured frame
         *
         * @param linkType pcap link type
         * @param frame Captured bytes
         * @param length Captured length
         * @param payloadOffset Offset of the UDP payload
         * @param payloadLength Length of the UDP payload
         * @return true Frame is an IPv4/UDP datagram from or to the GSMTAP port
         */
        static bool extractGsmtapPayload(
            uint32_t linkType,
            const uint8_t* frame,
            size_t length,
            size_t& payloadOffset,
            size_t& payloadLength);

    private:
        etl::expected<SourceEvent, error::Error> readFailed();

        uint32_t read32(const uint8_t* data) const;

        etl::string<256> path;
        FILE* file;
        bool swapped;
        uint32_t linkType;
        uint32_t packetCount;
        bool exhausted;
        uint8_t frame[buffer::PACKET_MAX];
    };

} // namespace simtrace
