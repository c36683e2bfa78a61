/**
 * @file CatCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card Application Toolkit commands implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/CatCommand.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

namespace
{
    constexpr uint8_t INS_TERMINAL_PROFILE = 0x10;
    constexpr uint8_t INS_FETCH = 0x12;
    constexpr uint8_t INS_TERMINAL_RESPONSE = 0x14;
    constexpr uint8_t INS_ENVELOPE = 0xC2;

    constexpr uint8_t TAG_PROACTIVE_COMMAND = 0xD0;
    constexpr uint8_t TAG_COMMAND_DETAILS = 0x01;
    constexpr uint8_t TAG_RESULT = 0x03;

    /**
     * @brief Read a simple tag and a BER length (1 or 2 bytes)
     *
     * @return false Header runs past the end of the data
     */
    bool readTagLength(const etl::ivector<uint8_t>& data, size_t& offset, uint8_t& tag, size_t& length)
    {
        if (offset + 2 > data.size())
        {
            return false;
        }

        tag = data[offset];
        length = data[offset + 1];
        offset += 2;

        if (length == 0x81)
        {
            if (offset >= data.size())
            {
                return false;
            }
            length = data[offset++];
        }

        return offset + length <= data.size();
    }
}

CatCommand::CatCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

const char* CatCommand::envelopeName(uint8_t tag)
{
    switch (tag)
    {
        case 0xD1:
            return "SMS-PP download";
        case 0xD2:
            return "cell broadcast download";
        case 0xD3:
            return "menu selection";
        case 0xD4:
            return "call control";
        case 0xD5:
            return "MO short message control";
        case 0xD6:
            return "event download";
        case 0xD7:
            return "timer expiration";
        case 0xD9:
            return "USSD download";
        case 0xDA:
            return "MMS transfer status";
        default:
            return "unknown envelope";
    }
}

const char* CatCommand::proactiveCommandName(uint8_t type)
{
    switch (type)
    {
        case 0x01:
            return "REFRESH";
        case 0x02:
            return "MORE TIME";
        case 0x03:
            return "POLL INTERVAL";
        case 0x04:
            return "POLLING OFF";
        case 0x05:
            return "SET UP EVENT LIST";
        case 0x10:
            return "SET UP CALL";
        case 0x11:
            return "SEND SS";
        case 0x12:
            return "SEND USSD";
        case 0x13:
            return "SEND SHORT MESSAGE";
        case 0x14:
            return "SEND DTMF";
        case 0x15:
            return "LAUNCH BROWSER";
        case 0x20:
            return "PLAY TONE";
        case 0x21:
            return "DISPLAY TEXT";
        case 0x22:
            return "GET INKEY";
        case 0x23:
            return "GET INPUT";
        case 0x24:
            return "SELECT ITEM";
        case 0x25:
            return "SET UP MENU";
        case 0x26:
            return "PROVIDE LOCAL INFORMATION";
        case 0x27:
            return "TIMER MANAGEMENT";
        case 0x28:
            return "SET UP IDLE MODE TEXT";
        case 0x30:
            return "PERFORM CARD APDU";
        case 0x31:
            return "POWER ON CARD";
        case 0x32:
            return "POWER OFF CARD";
        case 0x33:
            return "GET READER STATUS";
        case 0x34:
            return "RUN AT COMMAND";
        case 0x35:
            return "LANGUAGE NOTIFICATION";
        case 0x40:
            return "OPEN CHANNEL";
        case 0x41:
            return "CLOSE CHANNEL";
        case 0x42:
            return "RECEIVE DATA";
        case 0x43:
            return "SEND DATA";
        case 0x44:
            return "GET CHANNEL STATUS";
        default:
            return "unknown proactive command";
    }
}

void CatCommand::describeCommandDetails(const etl::ivector<uint8_t>& data, size_t offset)
{
    uint8_t tag = 0;
    size_t length = 0;

    if (!readTagLength(data, offset, tag, length) || (tag & 0x7F) != TAG_COMMAND_DETAILS || length != 3)
    {
        appendProcessed("no command details");
        return;
    }

    const uint8_t number = data[offset];
    const uint8_t type = data[offset + 1];
    const uint8_t qualifier = data[offset + 2];
    offset += length;

    setColId("%02X", static_cast<unsigned>(type));
    appendProcessed("%s (number %u, qualifier %02X)", proactiveCommandName(type),
                    static_cast<unsigned>(number), static_cast<unsigned>(qualifier));

    if (exchange.ins != INS_TERMINAL_RESPONSE)
    {
        return;
    }

    while (readTagLength(data, offset, tag, length))
    {
        if ((tag & 0x7F) == TAG_RESULT && length >= 1)
        {
            if (data[offset] == 0x00)
            {
                appendProcessed("performed successfully");
            }
            else
            {
                appendProcessed("general result %02X", static_cast<unsigned>(data[offset]));
            }
            return;
        }
        offset += length;
    }
}

void CatCommand::processOnChannel(RuntimeState& state)
{
    (void)state;

    switch (exchange.ins)
    {
        case INS_TERMINAL_PROFILE:
            appendProcessed("%u bytes", static_cast<unsigned>(exchange.commandData.size()));
            appendProcessedHex("profile", exchange.commandData);
            break;

        case INS_ENVELOPE:
            if (exchange.commandData.empty())
            {
                appendProcessed("empty envelope");
                break;
            }
            setColId("%02X", static_cast<unsigned>(exchange.commandData[0]));
            appendProcessed("%s", envelopeName(exchange.commandData[0]));
            if (!exchange.responseData.empty())
            {
                appendProcessedHex("response", exchange.responseData);
            }
            break;

        case INS_FETCH:
        {
            const etl::ivector<uint8_t>& response = exchange.responseData;
            uint8_t tag = 0;
            size_t length = 0;
            size_t offset = 0;
            if (response.empty())
            {
                break;
            }
            if (!readTagLength(response, offset, tag, length) || tag != TAG_PROACTIVE_COMMAND)
            {
                appendProcessedHex("response", response);
                break;
            }
            describeCommandDetails(response, offset);
            break;
        }

        case INS_TERMINAL_RESPONSE:
            describeCommandDetails(exchange.commandData, 0);
            break;

        default:
            break;
    }
}
