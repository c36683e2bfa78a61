/**
 * @file GetIdentityCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief GET IDENTITY (3GPP TS 31.102 §7.5)
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
     * @brief GET IDENTITY (78), P2 b3-b1 identity context (001 = SUCI)
     */
    class GetIdentityCommand : public ApduCommand
    {
    public:
        GetIdentityCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        void processOnChannel(RuntimeState& state) override;
    };

} // namespace simtrace
