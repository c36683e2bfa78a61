/**
 * @file StatusCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief STATUS implementation
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/StatusCommand.h"

using namespace simtrace;

StatusCommand::StatusCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
{
}

void StatusCommand::processOnChannel(RuntimeState& state)
{
    const NodeId df = state.currentDf(lchan);
    const FileNode& node = state.fileSystem().node(df);

    setColId("%04X", static_cast<unsigned>(node.fid));
    setPath(state, df);

    // P1: indication of the terminal's application state
    switch (exchange.p1)
    {
        case 0x01:
            appendProcessed("application initialized");
            break;
        case 0x02:
            appendProcessed("application terminating");
            break;
        default:
            break;
    }

    auto application = state.applicationContext(lchan);
    if (application.has_value())
    {
        appendProcessed("current DF %s, application %s", node.name.c_str(), application->name.c_str());
    }
    else
    {
        appendProcessed("current DF %s, no application", node.name.c_str());
    }
}
