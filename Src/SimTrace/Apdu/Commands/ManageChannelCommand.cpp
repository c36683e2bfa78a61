/**
 * @file ManageChannelCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MANAGE CHANNEL implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/ManageChannelCommand.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

ManageChannelCommand::ManageChannelCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

etl::expected<void, error::Error> ManageChannelCommand::parseFields()
{
    if (exchange.p1 != 0x00 && exchange.p1 != 0x80)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
    }

    if (exchange.p2 >= buffer::LOGICAL_CHANNELS_MAX || (!isOpen() && exchange.p2 == 0))
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
    }

    return {};
}

void ManageChannelCommand::processOnChannel(RuntimeState& state)
{
    uint8_t channel = exchange.p2;
    if (isOpen() && channel == 0)
    {
        // Assigned by the card
        if (exchange.responseData.size() == 1)
        {
            channel = exchange.responseData[0];
        }
        else if (cardAccepted())
        {
            appendProcessed("open channel, no channel number in response");
            return;
        }
    }

    setColId("CH %u", static_cast<unsigned>(channel));

    if (!cardAccepted())
    {
        appendProcessed(isOpen() ? "open channel rejected" : "close channel %u rejected", static_cast<unsigned>(channel));
        return;
    }

    auto result = isOpen() ? state.openChannel(channel, lchan) : state.closeChannel(channel);
    if (!result)
    {
        appendProcessed("%s channel %u failed (%s)", isOpen() ? "open" : "close",
                        static_cast<unsigned>(channel), result.error().toString().c_str());
        return;
    }

    if (isOpen())
    {
        setPath(state, state.currentNode(channel));
        appendProcessed("channel %u opened", static_cast<unsigned>(channel));
    }
    else
    {
        appendProcessed("channel %u closed", static_cast<unsigned>(channel));
    }
}
