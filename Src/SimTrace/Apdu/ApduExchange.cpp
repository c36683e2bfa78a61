/**
 * @file ApduExchange.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Captured command/response APDU pair implementation
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/ApduExchange.h"

using namespace simtrace;
using namespace simtrace::buffer;

etl::expected<ApduExchange, error::Error> ApduExchange::fromTpdu(const etl::ivector<uint8_t>& raw)
{
    // CLA INS P1 P2 P3 + SW1 SW2 at least
    if (raw.size() < TPDU_HEADER_SIZE + APDU_STATUS_SIZE)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::TooShort));
    }

    const size_t bodyLength = raw.size() - TPDU_HEADER_SIZE - APDU_STATUS_SIZE;
    if (bodyLength > APDU_DATA_MAX)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
    }

    ApduExchange exchange(raw[0], raw[1], raw[2], raw[3]);
    exchange.p3 = raw[4];

    for (size_t i = TPDU_HEADER_SIZE; i < TPDU_HEADER_SIZE + bodyLength; ++i)
    {
        exchange.body.push_back(raw[i]);
    }

    exchange.hasResponse = true;
    exchange.sw1 = raw[raw.size() - 2];
    exchange.sw2 = raw[raw.size() - 1];

    return exchange;
}

etl::expected<ApduExchange, error::Error> ApduExchange::fromCommandResponse(
    const etl::ivector<uint8_t>& command,
    const etl::ivector<uint8_t>& response)
{
    if (command.size() < APDU_HEADER_SIZE)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::TooShort));
    }

    ApduExchange exchange(command[0], command[1], command[2], command[3]);

    // Case 1: header only
    // Case 2: header + Le
    // Case 3: header + Lc + data
    // Case 4: header + Lc + data + Le
    if (command.size() > APDU_HEADER_SIZE)
    {
        const uint8_t lengthByte = command[APDU_HEADER_SIZE];
        exchange.p3 = lengthByte;

        if (command.size() > APDU_HEADER_SIZE + 1)
        {
            if (lengthByte == 0x00)
            {
                // Extended length APDUs are not used by UICC file commands
                return etl::unexpected(error::Error::fromDecode(error::DecodeError::UnsupportedEncoding));
            }

            const size_t dataEnd = APDU_HEADER_SIZE + 1 + lengthByte;
            if (command.size() != dataEnd && command.size() != dataEnd + 1)
            {
                return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
            }

            for (size_t i = APDU_HEADER_SIZE + 1; i < dataEnd; ++i)
            {
                exchange.commandData.push_back(command[i]);
            }
        }
    }

    if (!response.empty())
    {
        if (response.size() < APDU_STATUS_SIZE || response.size() - APDU_STATUS_SIZE > APDU_DATA_MAX)
        {
            return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
        }

        exchange.responseData.clear();
        for (size_t i = 0; i < response.size() - APDU_STATUS_SIZE; ++i)
        {
            exchange.responseData.push_back(response[i]);
        }
        exchange.hasResponse = true;
        exchange.sw1 = response[response.size() - 2];
        exchange.sw2 = response[response.size() - 1];
    }

    return exchange;
}

void ApduExchange::setResponse(const etl::ivector<uint8_t>& data, uint8_t status1, uint8_t status2)
{
    responseData.clear();
    for (size_t i = 0; i < data.size() && !responseData.full(); ++i)
    {
        responseData.push_back(data[i]);
    }
    hasResponse = true;
    sw1 = status1;
    sw2 = status2;
}

void ApduExchange::resolveBody(ApduCase apduCase)
{
    if (body.empty())
    {
        return;
    }

    if (apduCase == ApduCase::Case2)
    {
        responseData.assign(body.begin(), body.end());
    }
    else
    {
        // Lc is at most 255, anything longer cannot be command data
        const size_t length = body.size() > APDU_COMMAND_DATA_MAX ? APDU_COMMAND_DATA_MAX : body.size();
        commandData.assign(body.begin(), body.begin() + length);
    }

    body.clear();
}
