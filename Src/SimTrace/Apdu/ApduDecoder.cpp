/**
 * @file ApduDecoder.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief APDU decoder implementation
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/ApduDecoder.h"
#include "SimTrace/Apdu/Commands/UnknownCommand.h"
#include "Utils/Logging.h"

using namespace simtrace;

ApduDecoder::ApduDecoder(const CommandRegistry& registry)
    : registry(registry)
{
}

uint8_t ApduDecoder::logicalChannelFromCla(uint8_t cla)
{
    if (cla == 0xA0)
    {
        return 0;
    }

    if ((cla & 0x40) == 0)
    {
        return cla & 0x03;
    }

    return static_cast<uint8_t>(4 + (cla & 0x0F));
}

std::unique_ptr<ApduCommand> ApduDecoder::decode(const ApduExchange& exchange) const
{
    return decode(exchange, logicalChannelFromCla(exchange.cla));
}

std::unique_ptr<ApduCommand> ApduDecoder::decode(const ApduExchange& exchange, uint8_t logicalChannel) const
{
    auto descriptor = registry.lookup(exchange.cla, exchange.ins);
    if (!descriptor.has_value())
    {
        LOG_DEBUG("No command registered for CLA=%02X INS=%02X", exchange.cla, exchange.ins);

        ApduExchange resolved = exchange;
        resolved.resolveBody(ApduCase::Unknown);
        return UnknownCommand::descriptor().create(UnknownCommand::descriptor(), resolved, logicalChannel);
    }

    ApduExchange resolved = exchange;
    resolved.resolveBody(descriptor->apduCase);

    std::unique_ptr<ApduCommand> command = descriptor->create(descriptor.value(), resolved, logicalChannel);
    command->parse();
    return command;
}
