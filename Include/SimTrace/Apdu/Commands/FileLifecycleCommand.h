/**
 * @file FileLifecycleCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief DEACTIVATE / ACTIVATE FILE, INVALIDATE / REHABILITATE
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "../ApduCommand.h"
#include <etl/vector.h>

namespace simtrace
{
    /**
     * @brief File life cycle commands (04 deactivate/invalidate, 44 activate/rehabilitate)
     *
     * Without data the current EF is addressed. With data the file is
     * selected first, using the SELECT addressing of P1.
     */
    class FileLifecycleCommand : public ApduCommand
    {
    public:
        FileLifecycleCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;

    private:
        bool isActivation() const
        {
            return exchange.ins == 0x44;
        }

        etl::vector<uint16_t, buffer::PATH_DEPTH_MAX> path;
    };

} // namespace simtrace
