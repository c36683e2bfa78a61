/**
 * @file ApduExchange.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Captured command/response APDU pair
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/optional.h>
#include <etl/expected.h>
#include <cstdint>

#include "SimTrace/BufferSizes.h"
#include "Error/Error.h"

namespace simtrace
{
    /**
     * @brief ISO 7816-3 command case
     *
     * Case 1: no data, Case 2: response data, Case 3: command data,
     * Case 4: command and response data.
     */
    enum class ApduCase : uint8_t
    {
        Unknown = 0,
        Case1,
        Case2,
        Case3,
        Case4
    };

    /**
     * @brief One command APDU and its (optional) paired response
     *
     * T=0 captures carry the bytes following the header without telling in
     * which direction they travelled; those are kept in @ref body until
     * resolveBody() is called with the command case.
     */
    class ApduExchange
    {
    public:
        uint8_t cla;
        uint8_t ins;
        uint8_t p1;
        uint8_t p2;
        etl::optional<uint8_t> p3;                                          // Lc or Le as transmitted
        etl::vector<uint8_t, buffer::APDU_COMMAND_DATA_MAX> commandData;
        etl::vector<uint8_t, buffer::APDU_DATA_MAX> responseData;
        etl::vector<uint8_t, buffer::APDU_DATA_MAX> body;                   // T=0 body, direction unresolved
        bool hasResponse;
        uint8_t sw1;
        uint8_t sw2;

        ApduExchange()
            : cla(0), ins(0), p1(0), p2(0), hasResponse(false), sw1(0), sw2(0) {}

        ApduExchange(uint8_t cla, uint8_t ins, uint8_t p1, uint8_t p2)
            : cla(cla), ins(ins), p1(p1), p2(p2), hasResponse(false), sw1(0), sw2(0) {}

        /**
         * @brief Parse a T=0 TPDU blob as captured by SIMtrace / GSMTAP
         *
         * Format: CLA INS P1 P2 P3 [body...] SW1 SW2
         *
         * @param raw Captured bytes
         * @return etl::expected<ApduExchange, error::Error> Exchange with unresolved body, or error
         */
        static etl::expected<ApduExchange, error::Error> fromTpdu(const etl::ivector<uint8_t>& raw);

        /**
         * @brief Parse an ISO 7816-4 short command APDU and its response
         *
         * Command format: CLA INS P1 P2 [Lc Data] [Le]
         * Response format: [Data...] SW1 SW2
         *
         * @param command Command APDU bytes
         * @param response Response bytes (may be empty when no response was captured)
         * @return etl::expected<ApduExchange, error::Error> Exchange or error
         */
        static etl::expected<ApduExchange, error::Error> fromCommandResponse(
            const etl::ivector<uint8_t>& command,
            const etl::ivector<uint8_t>& response);

        /**
         * @brief Attach a response (data + status word)
         */
        void setResponse(const etl::ivector<uint8_t>& data, uint8_t status1, uint8_t status2);

        /**
         * @brief Move the unresolved T=0 body to command or response data
         *
         * Case 2 moves it to the response, cases 3 and 4 to the command.
         * With an unknown case the body is treated as command data.
         *
         * @param apduCase Command case of the decoded command
         */
        void resolveBody(ApduCase apduCase);

        bool hasUnresolvedBody() const
        {
            return !body.empty();
        }

        uint16_t getStatusWord() const
        {
            return (static_cast<uint16_t>(sw1) << 8) | sw2;
        }

        /**
         * @brief Check if the card completed the command normally
         *
         * 90 00, 91 XX (proactive command pending), 92 XX (memory retries),
         * 61 XX and the GSM 9F XX (response bytes available) count as success.
         */
        bool isSuccess() const
        {
            return hasResponse && (sw1 == 0x90 || sw1 == 0x91 || sw1 == 0x92 || sw1 == 0x61 || sw1 == 0x9F);
        }
    };

} // namespace simtrace
