/**
 * @file ConsoleTraceSink.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Console record output
 * @version 0.1
 * @date 2026-03-09
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Trace/ITraceSink.h"
#include "SimTrace/BufferSizes.h"

using namespace simtrace;
using namespace simtrace::buffer;

namespace
{
    constexpr const char* SEPARATOR = "===============================";
}

namespace simtrace
{
    void formatRecord(const ApduCommand& command, etl::istring& out)
    {
        char line[RECORD_LINE_MAX + 1];

        std::snprintf(line, sizeof(line), "%02u %-16.*s %-35s %-8s %s %s",
                      static_cast<unsigned>(command.logicalChannel()),
                      static_cast<int>(command.name().size()), command.name().data(),
                      command.pathString().c_str(),
                      command.colId().c_str(),
                      command.colSw().c_str(),
                      command.processed().c_str());

        out.assign(line);
    }
}

ConsoleTraceSink::ConsoleTraceSink(FILE* stream)
    : stream(stream)
{
}

void ConsoleTraceSink::emit(const ApduCommand& command)
{
    etl::string<RECORD_LINE_MAX> line;
    formatRecord(command, line);

    std::fprintf(stream, "%s\n%s\n", line.c_str(), SEPARATOR);
    std::fflush(stream);
}
