/**
 * @file UnknownCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Fallback interpreter implementation
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/UnknownCommand.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

UnknownCommand::UnknownCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

const CommandDescriptor& UnknownCommand::descriptor()
{
    static const CommandDescriptor unknown = {
        {0x00, 0x00, 0x00},
        "UNKNOWN",
        ApduCase::Unknown,
        CommandKind::Unrecognized,
        &makeCommand<UnknownCommand>
    };
    return unknown;
}

void UnknownCommand::processOnChannel(RuntimeState& state)
{
    (void)state;

    setColId("%02X%02X", exchange.cla, exchange.ins);
    appendProcessed("unrecognized command CLA=%02X INS=%02X P1=%02X P2=%02X",
                    exchange.cla, exchange.ins, exchange.p1, exchange.p2);

    if (!exchange.commandData.empty())
    {
        appendProcessedHex("data", exchange.commandData);
    }
    if (!exchange.responseData.empty())
    {
        appendProcessedHex("response", exchange.responseData);
    }
}
