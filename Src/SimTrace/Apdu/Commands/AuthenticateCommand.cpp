/**
 * @file AuthenticateCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Authentication commands implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/AuthenticateCommand.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

namespace
{
    constexpr uint8_t CONTEXT_GSM = 0x00;
    constexpr uint8_t CONTEXT_3G = 0x01;

    constexpr uint8_t TAG_SUCCESSFUL_3G = 0xDB;
    constexpr uint8_t TAG_SYNC_FAILURE = 0xDC;

    constexpr size_t RAND_SIZE = 16;
    constexpr size_t SRES_SIZE = 4;
    constexpr size_t KC_SIZE = 8;

    /**
     * @brief Read one length-value field
     *
     * @return false Field runs past the end of the data
     */
    bool readLv(const etl::ivector<uint8_t>& data, size_t& offset, etl::ivector<uint8_t>& out)
    {
        out.clear();
        if (offset >= data.size())
        {
            return false;
        }

        const size_t length = data[offset];
        if (offset + 1 + length > data.size() || length > out.capacity())
        {
            return false;
        }

        out.assign(data.begin() + offset + 1, data.begin() + offset + 1 + length);
        offset += 1 + length;
        return true;
    }

    void copyRange(const etl::ivector<uint8_t>& data, size_t start, size_t length, etl::ivector<uint8_t>& out)
    {
        out.assign(data.begin() + start, data.begin() + start + length);
    }
}

AuthenticateCommand::AuthenticateCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

void AuthenticateCommand::describeKeyReference()
{
    // P2 b8: 0 global, 1 specific reference data
    setColId("%s %02X", (exchange.p2 & 0x80) != 0 ? "SPEC" : "GLOB", static_cast<unsigned>(exchange.p2 & 0x1F));
}

void AuthenticateCommand::processOnChannel(RuntimeState& state)
{
    (void)state;

    describeKeyReference();

    if (!exchange.commandData.empty())
    {
        appendProcessedHex("challenge", exchange.commandData);
    }
    if (!exchange.responseData.empty())
    {
        appendProcessedHex("response", exchange.responseData);
    }
}

UsimAuthenticateCommand::UsimAuthenticateCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : AuthenticateCommand(descriptor, exchange, lchan)
    , context(CONTEXT_GSM)
{
}

etl::expected<void, error::Error> UsimAuthenticateCommand::parseFields()
{
    context = exchange.p2 & 0x07;

    if (exchange.commandData.empty())
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::MissingData));
    }

    etl::vector<uint8_t, buffer::APDU_DATA_MAX> field;
    size_t offset = 0;

    if (!readLv(exchange.commandData, offset, field))
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
    }

    if (context == CONTEXT_3G && !readLv(exchange.commandData, offset, field))
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
    }

    return {};
}

void UsimAuthenticateCommand::describe3gResponse()
{
    const etl::ivector<uint8_t>& response = exchange.responseData;
    etl::vector<uint8_t, buffer::APDU_DATA_MAX> field;
    size_t offset = 1;

    if (response[0] == TAG_SYNC_FAILURE)
    {
        if (readLv(response, offset, field))
        {
            appendProcessed("synchronisation failure");
            appendProcessedHex("AUTS", field);
        }
        return;
    }

    if (response[0] != TAG_SUCCESSFUL_3G)
    {
        appendProcessedHex("response", response);
        return;
    }

    const char* labels[] = {"RES", "CK", "IK", "Kc"};
    for (const char* label : labels)
    {
        if (!readLv(response, offset, field))
        {
            break;
        }
        appendProcessedHex(label, field);
    }
}

void UsimAuthenticateCommand::processOnChannel(RuntimeState& state)
{
    (void)state;

    describeKeyReference();

    etl::vector<uint8_t, buffer::APDU_DATA_MAX> field;
    size_t offset = 0;

    readLv(exchange.commandData, offset, field);
    appendProcessed(context == CONTEXT_3G ? "3G context" : (context == CONTEXT_GSM ? "GSM context" : "other context"));
    appendProcessedHex("RAND", field);

    if (context == CONTEXT_3G && readLv(exchange.commandData, offset, field))
    {
        appendProcessedHex("AUTN", field);
    }

    if (exchange.responseData.empty())
    {
        return;
    }

    if (context == CONTEXT_3G)
    {
        describe3gResponse();
        return;
    }

    offset = 0;
    if (context == CONTEXT_GSM && readLv(exchange.responseData, offset, field))
    {
        appendProcessedHex("SRES", field);
        if (readLv(exchange.responseData, offset, field))
        {
            appendProcessedHex("Kc", field);
        }
        return;
    }

    appendProcessedHex("response", exchange.responseData);
}

RunGsmAlgorithmCommand::RunGsmAlgorithmCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

etl::expected<void, error::Error> RunGsmAlgorithmCommand::parseFields()
{
    if (exchange.commandData.size() != RAND_SIZE)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
    }
    return {};
}

void RunGsmAlgorithmCommand::processOnChannel(RuntimeState& state)
{
    (void)state;

    appendProcessedHex("RAND", exchange.commandData);

    const etl::ivector<uint8_t>& response = exchange.responseData;
    if (response.size() == SRES_SIZE + KC_SIZE)
    {
        etl::vector<uint8_t, KC_SIZE> field;
        copyRange(response, 0, SRES_SIZE, field);
        appendProcessedHex("SRES", field);
        copyRange(response, SRES_SIZE, KC_SIZE, field);
        appendProcessedHex("Kc", field);
    }
    else if (!response.empty())
    {
        appendProcessedHex("response", response);
    }
}
