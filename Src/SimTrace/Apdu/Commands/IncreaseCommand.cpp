/**
 * @file IncreaseCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief INCREASE implementation
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/IncreaseCommand.h"
#include "SimTrace/Apdu/Commands/FileAccess.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

namespace
{
    uint32_t readValue(const uint8_t* data, size_t length)
    {
        uint32_t value = 0;
        for (size_t i = 0; i < length; ++i)
        {
            value = (value << 8) | data[i];
        }
        return value;
    }
}

IncreaseCommand::IncreaseCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
    , increment(0)
{
}

etl::expected<void, error::Error> IncreaseCommand::parseFields()
{
    const etl::ivector<uint8_t>& data = exchange.commandData;
    if (data.empty() || data.size() > 4)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
    }

    increment = readValue(data.data(), data.size());
    return {};
}

void IncreaseCommand::processOnChannel(RuntimeState& state)
{
    auto ef = file_access::resolveEf(state, lchan, 0, cardAccepted());
    if (ef)
    {
        const FileNode& node = state.fileSystem().node(ef.value());
        setColId("%04X", static_cast<unsigned>(node.fid));
        if (node.type != FileType::CyclicEf)
        {
            appendProcessed("%s is a %s", node.name.c_str(), file_access::fileTypeName(node.type));
        }
    }
    else
    {
        appendProcessed("no EF selected");
    }

    appendProcessed("increase by %lu", static_cast<unsigned long>(increment));

    const etl::ivector<uint8_t>& response = exchange.responseData;
    if (cardAccepted() && !response.empty() && (response.size() % 2) == 0 && response.size() <= 8)
    {
        appendProcessed("new value %lu", static_cast<unsigned long>(readValue(response.data(), response.size() / 2)));
    }

    // The increased value is written to record 1
    if (ef && cardAccepted())
    {
        state.setRecordPointer(lchan, 1);
    }
}
