/**
 * @file FileLifecycleCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief File life cycle commands implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/FileLifecycleCommand.h"
#include "SimTrace/Apdu/Commands/FileAccess.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

FileLifecycleCommand::FileLifecycleCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

etl::expected<void, error::Error> FileLifecycleCommand::parseFields()
{
    if (exchange.commandData.empty())
    {
        return {};
    }

    if (exchange.p1 != 0x00 && exchange.p1 != 0x08 && exchange.p1 != 0x09)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
    }

    if (!file_access::collectPath(exchange.commandData, path) || (exchange.p1 == 0x00 && path.size() != 1))
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
    }

    return {};
}

void FileLifecycleCommand::processOnChannel(RuntimeState& state)
{
    const bool sim = exchange.cla == 0xA0;
    const char* done = isActivation() ? (sim ? "rehabilitated" : "activated")
                                      : (sim ? "invalidated" : "deactivated");

    if (!cardAccepted())
    {
        return;
    }

    etl::expected<NodeId, error::Error> target = state.currentNode(lchan);
    if (!path.empty())
    {
        if (exchange.p1 == 0x08)
        {
            target = state.selectAbsolute(lchan, path);
        }
        else if (exchange.p1 == 0x09)
        {
            target = state.selectRelative(lchan, path);
        }
        else
        {
            target = state.selectByFileId(lchan, path[0]);
        }
    }

    if (!target)
    {
        setColId("%04X", static_cast<unsigned>(path.back()));
        appendProcessed("lookup of %04X failed (%s)", static_cast<unsigned>(path.back()),
                        target.error().toString().c_str());
        return;
    }

    FileNode& node = state.fileSystem().node(target.value());
    node.lifeCycle = isActivation() ? LifeCycle::Activated : LifeCycle::Deactivated;

    setPath(state, target.value());
    setColId("%04X", static_cast<unsigned>(node.fid));
    appendProcessed("%s %s", node.name.c_str(), done);
}
