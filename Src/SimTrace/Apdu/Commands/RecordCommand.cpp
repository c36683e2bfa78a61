/**
 * @file RecordCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief READ RECORD / UPDATE RECORD implementation
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/RecordCommand.h"
#include "SimTrace/Apdu/Commands/FileAccess.h"
#include "SimTrace/Apdu/CommandRegistry.h"

using namespace simtrace;

namespace
{
    const char* modeName(RecordMode mode)
    {
        switch (mode)
        {
            case RecordMode::Next:
                return "next";
            case RecordMode::Previous:
                return "previous";
            case RecordMode::Absolute:
                return "absolute";
            default:
                return "?";
        }
    }
}

RecordCommand::RecordCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
    , sfi(0)
    , mode(RecordMode::Absolute)
{
}

etl::expected<void, error::Error> RecordCommand::parseFields()
{
    sfi = exchange.p2 >> 3;
    if (sfi == 0x1F)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
    }

    const uint8_t modeBits = exchange.p2 & 0x07;
    if (modeBits != 0x02 && modeBits != 0x03 && modeBits != 0x04)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
    }
    mode = static_cast<RecordMode>(modeBits);

    if (isUpdate() && exchange.commandData.empty())
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::MissingData));
    }

    return {};
}

void RecordCommand::processOnChannel(RuntimeState& state)
{
    auto ef = file_access::resolveEf(state, lchan, sfi, cardAccepted());
    if (!ef)
    {
        if (sfi != 0)
        {
            setColId("SFI %02X", static_cast<unsigned>(sfi));
            appendProcessed("SFI %02X not found in current DF", static_cast<unsigned>(sfi));
        }
        else
        {
            appendProcessed("no EF selected");
        }
    }
    else
    {
        const FileNode& node = state.fileSystem().node(ef.value());
        setPath(state, ef.value());
        if (!node.isRecordBased())
        {
            appendProcessed("%s is a %s", node.name.c_str(), file_access::fileTypeName(node.type));
        }
    }

    // Read after SFI resolution: selecting another EF clears the pointer
    const uint8_t pointer = state.recordPointer(lchan);
    uint8_t record = 0;

    switch (mode)
    {
        case RecordMode::Absolute:
            record = exchange.p1 != 0 ? exchange.p1 : pointer;
            break;
        case RecordMode::Next:
            record = static_cast<uint8_t>(pointer + 1);
            break;
        case RecordMode::Previous:
            if (isUpdate())
            {
                // Cyclic update: the oldest record becomes record 1
                record = 1;
            }
            else
            {
                record = pointer > 1 ? static_cast<uint8_t>(pointer - 1) : 0;
            }
            break;
    }

    if (ef && cardAccepted() && mode != RecordMode::Absolute && record != 0)
    {
        state.setRecordPointer(lchan, record);
    }

    if (ef)
    {
        const uint16_t fid = state.fileSystem().node(ef.value()).fid;
        if (record != 0)
        {
            setColId("%04X#%u", static_cast<unsigned>(fid), static_cast<unsigned>(record));
        }
        else
        {
            setColId("%04X", static_cast<unsigned>(fid));
        }
    }

    if (record != 0)
    {
        appendProcessed("record %u (%s)", static_cast<unsigned>(record), modeName(mode));
    }
    else
    {
        appendProcessed("record ? (%s)", modeName(mode));
    }

    const etl::ivector<uint8_t>& data = isUpdate() ? exchange.commandData : exchange.responseData;
    if (!data.empty())
    {
        appendProcessedHex("data", data);
    }
}
