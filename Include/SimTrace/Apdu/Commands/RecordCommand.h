/**
 * @file RecordCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief READ RECORD / UPDATE RECORD
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "../ApduCommand.h"

namespace simtrace
{
    /**
     * @brief Record addressing mode (P2 b3-b1)
     */
    enum class RecordMode : uint8_t
    {
        Next = 0x02,
        Previous = 0x03,
        Absolute = 0x04
    };

    /**
     * @brief READ RECORD (B2) and UPDATE RECORD (DC)
     *
     * Next and previous mode move the record pointer of the logical channel;
     * absolute mode leaves it untouched.
     */
    class RecordCommand : public ApduCommand
    {
    public:
        RecordCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;

    private:
        bool isUpdate() const
        {
            return exchange.ins == 0xDC;
        }

        uint8_t sfi;
        RecordMode mode;
    };

} // namespace simtrace
