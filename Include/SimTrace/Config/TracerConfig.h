/**
 * @file TracerConfig.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Command line configuration of the simtrace tool
 * @version 0.1
 * @date 2026-03-10
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string.h>
#include <etl/expected.h>
#include <cstdint>
#include <cstdio>

#include "SimTrace/BufferSizes.h"
#include "SimTrace/Trace/Tracer.h"
#include "Error/Error.h"

namespace simtrace
{
    enum class SourceKind : uint8_t
    {
        GsmtapUdp,
        GsmtapPcap,
        HexFile
    };

    struct TracerConfig
    {
        SourceKind source;
        etl::string<64> bindIp;
        uint16_t bindPort;
        etl::string<256> file;
        TracerOptions options;
        bool verbose;

        TracerConfig()
            : source(SourceKind::GsmtapUdp)
            , bindIp("127.0.0.1")
            , bindPort(buffer::GSMTAP_UDP_PORT)
            , verbose(false)
        {
        }
    };

    /**
     * @brief Parse the command line
     *
     * @code
     * simtrace [--no-suppress-select] [--no-suppress-status]
     *          [--no-combine-get-response] [-v] <source> [source options]
     *
     *   gsmtap-udp  [-i BIND_IP] [-p BIND_PORT]
     *   gsmtap-pcap -f FILE
     *   hex-file    -f FILE
     * @endcode
     *
     * Global options must precede the source name, source options follow
     * it. Uses getopt_long and resets its scanner state on every call.
     *
     * @param argc Argument count
     * @param argv Arguments, argv[0] is the program name
     * @return etl::expected<TracerConfig, error::Error> Configuration or ConfigError
     * (HelpRequested for -h/--help)
     */
    etl::expected<TracerConfig, error::Error> parseCommandLine(int argc, char* const argv[]);

    void printUsage(FILE* stream, const char* program);

} // namespace simtrace
