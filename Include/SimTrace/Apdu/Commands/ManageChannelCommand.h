/**
 * @file ManageChannelCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief MANAGE CHANNEL (ETSI TS 102 221 §11.1.17)
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "../ApduCommand.h"

namespace simtrace
{
    /**
     * @brief MANAGE CHANNEL (70)
     *
     * P1 00 opens, 80 closes the channel in P2. Opening with P2 = 00 lets the
     * card assign the channel number, returned as one response byte.
     */
    class ManageChannelCommand : public ApduCommand
    {
    public:
        ManageChannelCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;

    private:
        bool isOpen() const
        {
            return exchange.p1 == 0x00;
        }
    };

} // namespace simtrace
