/**
 * @file GsmtapParser.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief GSMTAP-SIM datagram decoding
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/optional.h>
#include <etl/expected.h>
#include <cstddef>
#include <cstdint>

#include "IApduSource.h"
#include "Error/Error.h"

namespace simtrace
{
    namespace gsmtap
    {
        constexpr uint8_t VERSION = 2;
        constexpr size_t HEADER_MIN = 16;
        constexpr uint8_t TYPE_SIM = 0x04;

        /**
         * @brief Sub types of GSMTAP_TYPE_SIM
         */
        enum class SimSubType : uint8_t
        {
            Apdu = 0,
            Atr = 1,
            PpsRequest = 2,
            PpsResponse = 3,
            TpduHeader = 4,
            TpduCommand = 5,
            TpduResponse = 6,
            TpduStatusWord = 7
        };

        /**
         * @brief Decode one GSMTAP datagram
         *
         * Header: version (2), header length in 32-bit words, type, timeslot,
         * ARFCN (2), signal level, SNR, frame number (4), sub type,
         * antenna, sub slot, reserved.
         *
         * @param data Datagram payload
         * @param length Payload length
         * @return nullopt for datagrams that carry no event (other types, PPS),
         * SourceError::MalformedPacket or a DecodeError for broken datagrams
         */
        etl::expected<etl::optional<SourceEvent>, error::Error> parse(const uint8_t* data, size_t length);

    } // namespace gsmtap

} // namespace simtrace
