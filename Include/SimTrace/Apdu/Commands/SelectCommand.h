/**
 * @file SelectCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief SELECT FILE (ETSI TS 102 221 §11.1.1, 3GPP TS 51.011 §9.2.1)
 * @version 0.1
 * @date 2026-03-05
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
     * @brief SELECT selection mode (P1)
     */
    enum class SelectMode : uint8_t
    {
        ByFileId = 0x00,
        ChildDf = 0x01,
        ChildEf = 0x02,
        ParentDf = 0x03,
        ByDfName = 0x04,
        PathFromMf = 0x08,
        PathFromCurrentDf = 0x09
    };

    /**
     * @brief SELECT interpreter
     *
     * Moves the cursor of the logical channel when the target exists in the
     * card model and the card did not reject the command. Otherwise the
     * cursor stays where it was and the record states the failure.
     */
    class SelectCommand : public ApduCommand
    {
    public:
        SelectCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;

    private:
        etl::expected<NodeId, error::Error> resolve(RuntimeState& state);

        void describeTarget(etl::istring& out) const;

        SelectMode mode;
        uint16_t fid;
        etl::vector<uint16_t, buffer::PATH_DEPTH_MAX> path;
        etl::vector<uint8_t, buffer::AID_MAX> aid;
    };

} // namespace simtrace
