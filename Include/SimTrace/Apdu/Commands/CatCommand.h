/**
 * @file CatCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card Application Toolkit commands (ETSI TS 102 223)
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
     * @brief TERMINAL PROFILE (10), FETCH (12), TERMINAL RESPONSE (14) and ENVELOPE (C2)
     *
     * Names the envelope type and the proactive command type from their
     * BER-TLV encoding. The runtime state is not changed.
     */
    class CatCommand : public ApduCommand
    {
    public:
        CatCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

        static const char* envelopeName(uint8_t tag);

        static const char* proactiveCommandName(uint8_t type);

    protected:
        void processOnChannel(RuntimeState& state) override;

    private:
        void describeCommandDetails(const etl::ivector<uint8_t>& data, size_t offset);
    };

} // namespace simtrace
