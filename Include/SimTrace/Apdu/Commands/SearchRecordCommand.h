/**
 * @file SearchRecordCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief SEARCH RECORD (UICC) / SEEK (SIM)
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "../ApduCommand.h"
#include <etl/vector.h>

namespace simtrace
{
    /**
     * @brief SEARCH RECORD / SEEK (A2)
     *
     * UICC: P1 start record, P2 b8-b4 SFI and b3-b1 search type; the
     * response lists the matching records.
     * SIM (CLA A0): P2 b8-b5 type, b4-b1 mode; a type 2 seek returns the
     * matching record number and sets the record pointer.
     */
    class SearchRecordCommand : public ApduCommand
    {
    public:
        SearchRecordCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;

    private:
        bool isSimSeek() const
        {
            return exchange.cla == 0xA0;
        }

        uint8_t sfi;
        etl::vector<uint8_t, buffer::APDU_COMMAND_DATA_MAX> pattern;
    };

} // namespace simtrace
