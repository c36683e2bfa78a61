/**
 * @file GetIdentityCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief GET IDENTITY implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/GetIdentityCommand.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

GetIdentityCommand::GetIdentityCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

void GetIdentityCommand::processOnChannel(RuntimeState& state)
{
    (void)state;

    const uint8_t context = exchange.p2 & 0x07;
    if (context == 0x01)
    {
        setColId("SUCI");
        appendProcessed("SUCI context");
    }
    else
    {
        setColId("CTX %u", static_cast<unsigned>(context));
        appendProcessed("identity context %u", static_cast<unsigned>(context));
    }

    if (!exchange.commandData.empty())
    {
        appendProcessedHex("data", exchange.commandData);
    }
    if (!exchange.responseData.empty())
    {
        appendProcessedHex("identity", exchange.responseData);
    }
}
