/**
 * @file BinaryCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief READ BINARY / UPDATE BINARY implementation
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/BinaryCommand.h"
#include "SimTrace/Apdu/Commands/FileAccess.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

BinaryCommand::BinaryCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
    , sfi(0)
    , offset(0)
{
}

etl::expected<void, error::Error> BinaryCommand::parseFields()
{
    if ((exchange.p1 & 0x80) != 0)
    {
        // b7-b6 must be 0 with SFI addressing
        if ((exchange.p1 & 0x60) != 0)
        {
            return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
        }
        sfi = exchange.p1 & 0x1F;
        offset = exchange.p2;
    }
    else
    {
        sfi = 0;
        offset = static_cast<uint16_t>(((exchange.p1 & 0x7F) << 8) | exchange.p2);
    }

    if (isUpdate() && exchange.commandData.empty())
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::MissingData));
    }

    return {};
}

void BinaryCommand::processOnChannel(RuntimeState& state)
{
    auto ef = file_access::resolveEf(state, lchan, sfi, cardAccepted());
    if (ef)
    {
        const FileNode& node = state.fileSystem().node(ef.value());
        setPath(state, ef.value());
        setColId("%04X", static_cast<unsigned>(node.fid));
        if (node.type != FileType::TransparentEf)
        {
            appendProcessed("%s is a %s", node.name.c_str(), file_access::fileTypeName(node.type));
        }
    }
    else if (sfi != 0)
    {
        setColId("SFI %02X", static_cast<unsigned>(sfi));
        appendProcessed("SFI %02X not found in current DF", static_cast<unsigned>(sfi));
    }
    else
    {
        appendProcessed("no EF selected");
    }

    if (isUpdate())
    {
        appendProcessed("offset %u, %u bytes", static_cast<unsigned>(offset),
                        static_cast<unsigned>(exchange.commandData.size()));
        appendProcessedHex("data", exchange.commandData);
        return;
    }

    const unsigned expected = exchange.p3.has_value() && exchange.p3.value() != 0 ? exchange.p3.value() : 256;
    if (exchange.responseData.empty())
    {
        appendProcessed("offset %u, %u bytes expected", static_cast<unsigned>(offset), expected);
        return;
    }

    appendProcessed("offset %u, %u bytes", static_cast<unsigned>(offset),
                    static_cast<unsigned>(exchange.responseData.size()));
    appendProcessedHex("data", exchange.responseData);
}
