/**
 * @file ByteCountCommands.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief GET CHALLENGE and GET RESPONSE
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
     * @brief GET CHALLENGE (84)
     */
    class GetChallengeCommand : public ApduCommand
    {
    public:
        GetChallengeCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        void processOnChannel(RuntimeState& state) override;
    };

    /**
     * @brief GET RESPONSE (C0) not folded into the preceding command
     */
    class GetResponseCommand : public ApduCommand
    {
    public:
        GetResponseCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        void processOnChannel(RuntimeState& state) override;
    };

} // namespace simtrace
