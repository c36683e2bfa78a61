/**
 * @file RuntimeState.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Reconstructed card state (cursor per logical channel)
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/array.h>
#include <etl/vector.h>
#include <etl/string.h>
#include <etl/optional.h>
#include <etl/expected.h>
#include <cstdint>

#include "FileSystem.h"
#include "SimTrace/BufferSizes.h"
#include "Error/Error.h"

namespace simtrace
{
    /**
     * @brief Application selected on a logical channel
     */
    struct ApplicationDescriptor
    {
        etl::string<buffer::FILE_NAME_MAX> name;
        etl::vector<uint8_t, buffer::AID_MAX> aid;
        NodeId adf;
    };

    /**
     * @brief State of one logical channel
     */
    struct ChannelState
    {
        bool open;
        NodeId selectedFile;                                            // cursor
        NodeId selectedAdf;                                             // INVALID_NODE when no ADF selected
        uint8_t recordPointer;                                          // 0 when undefined
        etl::vector<uint8_t, buffer::VERIFIED_PINS_MAX> verifiedLocalPins;

        ChannelState()
            : open(false)
            , selectedFile(0)
            , selectedAdf(INVALID_NODE)
            , recordPointer(0)
        {
        }
    };

    /**
     * @brief Mutable card model shared by all command interpreters
     *
     * Owns a copy of the file system tree and one ChannelState per logical
     * channel. Every selection either moves the cursor to an existing node
     * or fails with a CardModelError and leaves the channel untouched.
     *
     * After construction and after reset() only the basic channel (0) is
     * open, with its cursor on the MF.
     */
    class RuntimeState
    {
    public:
        /**
         * @brief Construct with a root-only tree
         */
        RuntimeState();

        /**
         * @brief Construct with a copy of a populated tree
         */
        explicit RuntimeState(const FileSystem& fileSystem);

        /**
         * @brief Card reset: all channels back to the MF, non-basic channels
         * closed, verification state cleared
         */
        void reset();

        /**
         * @brief Move one channel back to the MF and forget its application
         */
        void reset(uint8_t channel);

        bool isValidChannel(uint8_t channel) const
        {
            return channel < buffer::LOGICAL_CHANNELS_MAX;
        }

        bool isOpen(uint8_t channel) const;

        /**
         * @brief Open a logical channel
         *
         * A channel opened from the basic channel starts at the MF; a channel
         * opened from another channel inherits that channel's selection
         * (ETSI TS 102 221 §11.1.17).
         *
         * @param channel Channel to open (1..19)
         * @param origin Channel the MANAGE CHANNEL command was sent on
         */
        etl::expected<void, error::Error> openChannel(uint8_t channel, uint8_t origin);

        etl::expected<void, error::Error> closeChannel(uint8_t channel);

        NodeId currentNode(uint8_t channel) const;

        /**
         * @brief Current directory: the cursor if it is a DF, else its parent
         */
        NodeId currentDf(uint8_t channel) const;

        /**
         * @brief Select a direct child of the current DF
         */
        etl::expected<NodeId, error::Error> selectChild(uint8_t channel, uint16_t fid);

        /**
         * @brief Select by file identifier (SELECT P1 = 00)
         *
         * Search order: MF (3F00), current ADF (7FFF), the current DF itself,
         * children of the current DF, the parent DF, DFs that are siblings
         * of the current DF.
         */
        etl::expected<NodeId, error::Error> selectByFileId(uint8_t channel, uint16_t fid);

        etl::expected<NodeId, error::Error> selectParent(uint8_t channel);

        /**
         * @brief Select by path from the MF (SELECT P1 = 08)
         *
         * A leading 3F00 is optional. A leading 7FFF starts at the current ADF.
         */
        etl::expected<NodeId, error::Error> selectAbsolute(uint8_t channel, const etl::ivector<uint16_t>& path);

        /**
         * @brief Select by path from the current DF (SELECT P1 = 09)
         */
        etl::expected<NodeId, error::Error> selectRelative(uint8_t channel, const etl::ivector<uint16_t>& path);

        /**
         * @brief Select an ADF by (possibly truncated) AID
         */
        etl::expected<NodeId, error::Error> selectApplication(uint8_t channel, const etl::ivector<uint8_t>& aid);

        /**
         * @brief Make the EF with the given SFI in the current DF the current EF
         */
        etl::expected<NodeId, error::Error> selectBySfi(uint8_t channel, uint8_t sfi);

        etl::optional<ApplicationDescriptor> applicationContext(uint8_t channel) const;

        uint8_t recordPointer(uint8_t channel) const;

        void setRecordPointer(uint8_t channel, uint8_t record);

        /**
         * @brief Remember a successful PIN verification
         *
         * Key references 01..08 (and CHV1/CHV2 of a SIM) are card wide,
         * references 80 and above are local to the selected application.
         */
        void markPinVerified(uint8_t channel, uint8_t keyReference);

        void clearPinVerified(uint8_t channel, uint8_t keyReference);

        bool isPinVerified(uint8_t channel, uint8_t keyReference) const;

        void pathString(NodeId id, etl::istring& out) const
        {
            fs.pathString(id, out);
        }

        const FileSystem& fileSystem() const
        {
            return fs;
        }

        FileSystem& fileSystem()
        {
            return fs;
        }

    private:
        static bool isLocalKeyReference(uint8_t keyReference)
        {
            return keyReference >= 0x80;
        }

        etl::expected<void, error::Error> checkChannel(uint8_t channel) const;

        etl::expected<NodeId, error::Error> walkPath(NodeId start, const uint16_t* fids, size_t count) const;

        void moveCursor(uint8_t channel, NodeId target);

        FileSystem fs;
        etl::array<ChannelState, buffer::LOGICAL_CHANNELS_MAX> channels;
        etl::vector<uint8_t, buffer::VERIFIED_PINS_MAX> verifiedGlobalPins;
    };

} // namespace simtrace
