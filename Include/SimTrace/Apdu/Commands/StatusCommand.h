/**
 * @file StatusCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief STATUS (ETSI TS 102 221 §11.1.2)
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
     * @brief STATUS interpreter, renders the current DF and application
     */
    class StatusCommand : public ApduCommand
    {
    public:
        StatusCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        void processOnChannel(RuntimeState& state) override;
    };

} // namespace simtrace
