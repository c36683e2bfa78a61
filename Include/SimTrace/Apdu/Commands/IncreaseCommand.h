/**
 * @file IncreaseCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief INCREASE
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
     * @brief INCREASE (32) on a cyclic EF
     *
     * The response holds the new record value followed by the added value.
     */
    class IncreaseCommand : public ApduCommand
    {
    public:
        IncreaseCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;

    private:
        uint32_t increment;
    };

} // namespace simtrace
