/**
 * @file ApduCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Base class of all command interpreters
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/expected.h>
#include <cstdint>

#include "ApduExchange.h"
#include "SimTrace/BufferSizes.h"
#include "SimTrace/Card/RuntimeState.h"
#include "Error/Error.h"

namespace simtrace
{
    /**
     * @brief Output filter class of a command
     */
    enum class CommandKind : uint8_t
    {
        Other,
        Select,
        Status,
        Unrecognized
    };

    struct CommandDescriptor;

    /**
     * @brief Interpreter for one captured exchange
     *
     * Constructed by the ApduDecoder for exactly one exchange. parse() splits
     * the raw bytes into fields, process() applies the effect on the
     * RuntimeState and fills the record columns. An interpreter whose fields
     * could not be parsed is degraded: it is still processed and printed
     * but does not touch the runtime state.
     */
    class ApduCommand
    {
    public:
        ApduCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

        virtual ~ApduCommand() = default;

        /**
         * @brief Parse command specific fields
         *
         * Called once by the decoder. A parse failure marks the command
         * degraded and is rendered into the processed text.
         */
        void parse();

        /**
         * @brief Apply the command on the runtime state and fill the record
         *
         * @param state Runtime state (mutable)
         */
        void process(RuntimeState& state);

        etl::string_view name() const
        {
            return commandName;
        }

        CommandKind kind() const
        {
            return commandKind;
        }

        uint8_t logicalChannel() const
        {
            return lchan;
        }

        bool isDegraded() const
        {
            return degraded;
        }

        const ApduExchange& getExchange() const
        {
            return exchange;
        }

        const etl::istring& pathString() const
        {
            return pathStr;
        }

        const etl::istring& colId() const
        {
            return columnId;
        }

        const etl::istring& colSw() const
        {
            return columnSw;
        }

        const etl::istring& processed() const
        {
            return processedText;
        }

    protected:
        /**
         * @brief Split parameters and data into named fields
         *
         * @return etl::expected<void, error::Error> void when the encoding is valid, DecodeError otherwise
         */
        virtual etl::expected<void, error::Error> parseFields()
        {
            return {};
        }

        /**
         * @brief Command specific processing step
         *
         * The path column is preset to the channel's current file before the
         * call; commands that operate on another file call setPath().
         */
        virtual void processOnChannel(RuntimeState& state) = 0;

        void setPath(const RuntimeState& state, NodeId node);

        /**
         * @brief True unless the card answered with an error status word
         *
         * An exchange captured without response counts as accepted.
         */
        bool cardAccepted() const
        {
            return !exchange.hasResponse || exchange.isSuccess();
        }

        void setColId(const char* format, ...);

        /**
         * @brief Append printf-formatted text to the processed column
         *
         * Fragments are separated by "; ".
         */
        void appendProcessed(const char* format, ...);

        /**
         * @brief Append bytes in hex to the processed column
         */
        void appendProcessedHex(const char* label, const etl::ivector<uint8_t>& data);

        ApduExchange exchange;
        uint8_t lchan;

    private:
        const char* commandName;
        CommandKind commandKind;
        bool degraded;
        etl::string<buffer::PATH_STRING_MAX> pathStr;
        etl::string<buffer::COLUMN_ID_MAX> columnId;
        etl::string<8> columnSw;
        etl::string<buffer::PROCESSED_MAX> processedText;
    };

} // namespace simtrace
