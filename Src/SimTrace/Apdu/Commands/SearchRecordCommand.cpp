/**
 * @file SearchRecordCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief SEARCH RECORD / SEEK implementation
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/SearchRecordCommand.h"
#include "SimTrace/Apdu/Commands/FileAccess.h"
#include "SimTrace/Apdu/CommandRegistry.h"

#include <cstdio>

using namespace simtrace;

SearchRecordCommand::SearchRecordCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
    , sfi(0)
{
}

etl::expected<void, error::Error> SearchRecordCommand::parseFields()
{
    if (exchange.commandData.empty())
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::MissingData));
    }

    if (isSimSeek())
    {
        if ((exchange.p2 >> 4) > 1 || (exchange.p2 & 0x0F) > 3)
        {
            return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
        }
        sfi = 0;
        pattern.assign(exchange.commandData.begin(), exchange.commandData.end());
        return {};
    }

    sfi = exchange.p2 >> 3;
    const uint8_t type = exchange.p2 & 0x07;
    if (sfi == 0x1F || type < 0x04)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
    }

    // Enhanced search: 2 bytes search indication before the pattern
    size_t start = 0;
    if (type == 0x06)
    {
        if (exchange.commandData.size() < 3)
        {
            return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
        }
        start = 2;
    }
    pattern.assign(exchange.commandData.begin() + start, exchange.commandData.end());

    return {};
}

void SearchRecordCommand::processOnChannel(RuntimeState& state)
{
    auto ef = file_access::resolveEf(state, lchan, sfi, cardAccepted());
    if (ef)
    {
        setPath(state, ef.value());
        setColId("%04X", static_cast<unsigned>(state.fileSystem().node(ef.value()).fid));
    }
    else
    {
        appendProcessed(sfi != 0 ? "SFI not found in current DF" : "no EF selected");
    }

    appendProcessedHex("pattern", pattern);

    if (isSimSeek())
    {
        // Type 2 returns the record number and moves the record pointer there
        if ((exchange.p2 >> 4) == 1 && exchange.responseData.size() == 1 && cardAccepted())
        {
            state.setRecordPointer(lchan, exchange.responseData[0]);
            appendProcessed("found record %u", static_cast<unsigned>(exchange.responseData[0]));
        }
        return;
    }

    if (!exchange.hasResponse || !cardAccepted())
    {
        return;
    }

    if (exchange.responseData.empty())
    {
        appendProcessed("no matching record");
        return;
    }

    etl::string<buffer::PROCESSED_MAX> records;
    char number[8];
    for (size_t i = 0; i < exchange.responseData.size(); ++i)
    {
        std::snprintf(number, sizeof(number), i == 0 ? "%u" : ",%u", static_cast<unsigned>(exchange.responseData[i]));
        records.append(number);
    }
    appendProcessed("matching records %s", records.c_str());
}
