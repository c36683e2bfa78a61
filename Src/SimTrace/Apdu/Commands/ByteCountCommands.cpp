/**
 * @file ByteCountCommands.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief GET CHALLENGE and GET RESPONSE implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/ByteCountCommands.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

GetChallengeCommand::GetChallengeCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

void GetChallengeCommand::processOnChannel(RuntimeState& state)
{
    (void)state;

    appendProcessed("%u bytes", static_cast<unsigned>(exchange.responseData.size()));
    if (!exchange.responseData.empty())
    {
        appendProcessedHex("challenge", exchange.responseData);
    }
}

GetResponseCommand::GetResponseCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

void GetResponseCommand::processOnChannel(RuntimeState& state)
{
    (void)state;

    const unsigned requested = exchange.p3.has_value() && exchange.p3.value() != 0 ? exchange.p3.value() : 256;
    appendProcessed("%u of %u bytes", static_cast<unsigned>(exchange.responseData.size()), requested);
    if (!exchange.responseData.empty())
    {
        appendProcessedHex("data", exchange.responseData);
    }
}
