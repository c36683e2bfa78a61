/**
 * @file ITraceSink.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Output boundary of the trace loop
 * @version 0.1
 * @date 2026-03-09
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string.h>
#include <cstdio>

#include "SimTrace/Apdu/ApduCommand.h"

namespace simtrace
{
    /**
     * @brief Receives every processed command that passed the output filters
     */
    class ITraceSink
    {
    public:
        virtual ~ITraceSink() = default;

        virtual void emit(const ApduCommand& command) = 0;
    };

    /**
     * @brief Render one record in the console layout
     *
     * Channel, name, path, column id, status word and processed text on one
     * line, without separator or newline.
     *
     * @param command Processed command
     * @param out Destination, cleared first; truncated when too short
     */
    void formatRecord(const ApduCommand& command, etl::istring& out);

    /**
     * @brief Prints records to a stdio stream followed by a separator line
     */
    class ConsoleTraceSink : public ITraceSink
    {
    public:
        explicit ConsoleTraceSink(FILE* stream);

        void emit(const ApduCommand& command) override;

    private:
        FILE* stream;
    };

} // namespace simtrace
