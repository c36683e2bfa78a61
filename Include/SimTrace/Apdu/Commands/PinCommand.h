/**
 * @file PinCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief PIN / CHV management commands
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "../ApduCommand.h"
#include <etl/string.h>

namespace simtrace
{
    /**
     * @brief VERIFY (20), CHANGE (24), DISABLE (26), ENABLE (28) and UNBLOCK (2C) PIN
     *
     * P2 is the key reference. PIN blocks are 8 bytes, ASCII digits padded
     * with FF; CHANGE and UNBLOCK carry two blocks. A command without data
     * queries the retry counter. A successful command marks the PIN as
     * verified in the runtime state, a 63CX answer clears it.
     */
    class PinCommand : public ApduCommand
    {
    public:
        PinCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;

    private:
        static constexpr size_t PIN_BLOCK_SIZE = 8;

        static bool decodePinBlock(const uint8_t* block, etl::istring& out);

        void describeKey(etl::istring& out) const;

        uint8_t keyReference;
        etl::string<PIN_BLOCK_SIZE> firstPin;
        etl::string<PIN_BLOCK_SIZE> secondPin;
    };

} // namespace simtrace
