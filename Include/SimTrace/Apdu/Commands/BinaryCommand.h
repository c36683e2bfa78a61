/**
 * @file BinaryCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief READ BINARY / UPDATE BINARY
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
     * @brief READ BINARY (B0) and UPDATE BINARY (D6)
     *
     * With bit 8 of P1 set, P1 b5-b1 carry an SFI and P2 the offset;
     * otherwise P1 b7-b1 and P2 form a 15-bit offset.
     */
    class BinaryCommand : public ApduCommand
    {
    public:
        BinaryCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;

    private:
        bool isUpdate() const
        {
            return exchange.ins == 0xD6;
        }

        uint8_t sfi;
        uint16_t offset;
    };

} // namespace simtrace
