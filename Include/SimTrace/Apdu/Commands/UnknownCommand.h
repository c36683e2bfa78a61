/**
 * @file UnknownCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Fallback interpreter for unregistered commands
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
     * @brief Interpreter for a (CLA, INS) pair without registry entry
     *
     * Never mutates the runtime state.
     */
    class UnknownCommand : public ApduCommand
    {
    public:
        UnknownCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

        /**
         * @brief Descriptor used by the decoder when lookup fails
         */
        static const CommandDescriptor& descriptor();

    protected:
        void processOnChannel(RuntimeState& state) override;
    };

} // namespace simtrace
