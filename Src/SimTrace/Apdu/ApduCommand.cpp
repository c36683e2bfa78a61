/**
 * @file ApduCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Command interpreter base implementation
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/ApduCommand.h"
#include "SimTrace/Apdu/CommandRegistry.h"
#include "SimTrace/Apdu/StatusWord.h"
#include "Utils/Hex.h"
#include "Utils/Logging.h"

#include <cstdarg>
#include <cstdio>

using namespace simtrace;
using namespace simtrace::buffer;

ApduCommand::ApduCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : exchange(exchange)
    , lchan(lchan)
    , commandName(descriptor.name)
    , commandKind(descriptor.kind)
    , degraded(false)
{
    columnId.assign("-");
    columnSw.assign("----");
}

void ApduCommand::parse()
{
    auto parsed = parseFields();
    if (!parsed)
    {
        degraded = true;
        appendProcessed("malformed %.*s command (%s)",
                        static_cast<int>(name().size()), name().data(),
                        parsed.error().toString().c_str());
        LOG_DEBUG("%.*s: %s", static_cast<int>(name().size()), name().data(), parsed.error().toString().c_str());
    }
}

void ApduCommand::process(RuntimeState& state)
{
    if (exchange.hasResponse)
    {
        columnSw.clear();
        utils::appendHex(columnSw, &exchange.sw1, 1);
        utils::appendHex(columnSw, &exchange.sw2, 1);
    }

    if (!state.isValidChannel(lchan))
    {
        degraded = true;
        appendProcessed("invalid logical channel %u", static_cast<unsigned>(lchan));
        return;
    }

    // Unrecognized and degraded commands leave the channel table alone
    if (!state.isOpen(lchan) && !degraded && commandKind != CommandKind::Unrecognized)
    {
        // Capture started after the MANAGE CHANNEL, or it was lost
        LOG_DEBUG("Command on channel %u which was never opened, assuming MF", static_cast<unsigned>(lchan));
        auto opened = state.openChannel(lchan, 0);
        if (!opened)
        {
            LOG_WARN("Cannot open channel %u: %s", static_cast<unsigned>(lchan), opened.error().toString().c_str());
        }
    }

    setPath(state, state.currentNode(lchan));

    if (!degraded)
    {
        processOnChannel(state);
    }

    if (exchange.hasResponse && !exchange.isSuccess())
    {
        etl::string<64> meaning;
        describeStatusWord(exchange.sw1, exchange.sw2, meaning);
        appendProcessed("%s", meaning.c_str());
    }
}

void ApduCommand::setPath(const RuntimeState& state, NodeId node)
{
    state.pathString(node, pathStr);
}

void ApduCommand::setColId(const char* format, ...)
{
    char buffer[COLUMN_ID_MAX + 1];

    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    columnId.assign(buffer);
}

void ApduCommand::appendProcessed(const char* format, ...)
{
    char buffer[PROCESSED_MAX + 1];

    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    if (!processedText.empty())
    {
        processedText.append("; ");
    }
    processedText.append(buffer);
}

void ApduCommand::appendProcessedHex(const char* label, const etl::ivector<uint8_t>& data)
{
    etl::string<PROCESSED_MAX> hex;
    utils::appendHex(hex, data);
    appendProcessed("%s=%s", label, hex.c_str());
}
