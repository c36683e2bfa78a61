/**
 * @file BufferSizes.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Buffer size constants for the trace decoder
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace simtrace
{
    namespace buffer
    {
        // ========================================================================
        // ISO 7816-4 APDU Layer
        // ========================================================================

        /**
         * @brief Maximum APDU response data size (without status word)
         */
        constexpr size_t APDU_DATA_MAX = 256;

        /**
         * @brief Maximum short APDU command data size (Lc max)
         */
        constexpr size_t APDU_COMMAND_DATA_MAX = 255;

        /**
         * @brief Maximum raw APDU size as seen on the wire
         *
         * Calculation:
         * - Header: 5 bytes (CLA INS P1 P2 P3)
         * - Body: 256 bytes maximum
         * - Status: 2 bytes (SW1 SW2)
         * - Le: 1 byte (case 4 command APDU)
         * Total: 5 + 256 + 2 + 1 = 264 bytes
         */
        constexpr size_t APDU_RAW_MAX = 264;

        /**
         * @brief APDU header size
         *
         * CLA(1) + INS(1) + P1(1) + P2(1) = 4 bytes
         */
        constexpr size_t APDU_HEADER_SIZE = 4;

        /**
         * @brief T=0 TPDU header size (header plus P3)
         */
        constexpr size_t TPDU_HEADER_SIZE = 5;

        /**
         * @brief APDU status word size
         *
         * SW1(1) + SW2(1) = 2 bytes
         */
        constexpr size_t APDU_STATUS_SIZE = 2;

        // ========================================================================
        // Card Model
        // ========================================================================

        /**
         * @brief Number of logical channels (ETSI TS 102 221: 0..19)
         */
        constexpr uint8_t LOGICAL_CHANNELS_MAX = 20;

        /**
         * @brief Maximum number of nodes in the card file system tree
         */
        constexpr size_t FS_NODES_MAX = 160;

        /**
         * @brief Maximum length of a file or application name
         */
        constexpr size_t FILE_NAME_MAX = 24;

        /**
         * @brief Maximum AID length (RID 5 bytes + PIX up to 11 bytes)
         */
        constexpr size_t AID_MAX = 16;

        /**
         * @brief Maximum depth of a path (MF/DF/DF/DF/EF)
         */
        constexpr size_t PATH_DEPTH_MAX = 8;

        /**
         * @brief Maximum number of PINs remembered as verified per scope
         */
        constexpr size_t VERIFIED_PINS_MAX = 16;

        // ========================================================================
        // Command Registry / Records
        // ========================================================================

        /**
         * @brief Maximum number of registered command descriptors
         */
        constexpr size_t REGISTRY_MAX = 128;

        /**
         * @brief Maximum length of the path string column
         */
        constexpr size_t PATH_STRING_MAX = 96;

        /**
         * @brief Maximum length of the column id
         */
        constexpr size_t COLUMN_ID_MAX = 16;

        /**
         * @brief Maximum length of the processed description
         */
        constexpr size_t PROCESSED_MAX = 320;

        /**
         * @brief Maximum length of one formatted record line
         */
        constexpr size_t RECORD_LINE_MAX = 512;

        // ========================================================================
        // Capture Sources
        // ========================================================================

        /**
         * @brief Maximum UDP datagram / captured packet processed
         */
        constexpr size_t PACKET_MAX = 2048;

        /**
         * @brief Maximum line length of a hex trace file
         */
        constexpr size_t TRACE_LINE_MAX = 1200;

        /**
         * @brief GSMTAP UDP port (IANA)
         */
        constexpr uint16_t GSMTAP_UDP_PORT = 4729;

    } // namespace buffer

} // namespace simtrace
