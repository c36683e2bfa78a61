/**
 * @file TracerConfig.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Command line parsing
 * @version 0.1
 * @date 2026-03-10
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Config/TracerConfig.h"
#include "Utils/Logging.h"

#include <getopt.h>
#include <cstdlib>
#include <cstring>

using namespace simtrace;
using namespace error;

namespace
{
    // Long-only options
    enum : int
    {
        OPTION_NO_SUPPRESS_SELECT = 0x100,
        OPTION_NO_SUPPRESS_STATUS,
        OPTION_NO_COMBINE_GET_RESPONSE
    };

    // '+': stop at the source name, ':': report a missing value as ':'
    constexpr const char* GLOBAL_SHORT_OPTIONS = "+:hv";
    constexpr const char* UDP_SHORT_OPTIONS = "+:hi:p:";
    constexpr const char* FILE_SHORT_OPTIONS = "+:hf:";

    const struct option GLOBAL_LONG_OPTIONS[] = {
        {"help",                    no_argument, nullptr, 'h'},
        {"verbose",                 no_argument, nullptr, 'v'},
        {"no-suppress-select",      no_argument, nullptr, OPTION_NO_SUPPRESS_SELECT},
        {"no-suppress-status",      no_argument, nullptr, OPTION_NO_SUPPRESS_STATUS},
        {"no-combine-get-response", no_argument, nullptr, OPTION_NO_COMBINE_GET_RESPONSE},
        {nullptr, 0, nullptr, 0}
    };

    const struct option UDP_LONG_OPTIONS[] = {
        {"help",      no_argument,       nullptr, 'h'},
        {"bind-ip",   required_argument, nullptr, 'i'},
        {"bind-port", required_argument, nullptr, 'p'},
        {nullptr, 0, nullptr, 0}
    };

    const struct option FILE_LONG_OPTIONS[] = {
        {"help", no_argument,       nullptr, 'h'},
        {"file", required_argument, nullptr, 'f'},
        {nullptr, 0, nullptr, 0}
    };

    etl::expected<uint16_t, Error> parsePort(const char* text)
    {
        char* end = nullptr;
        const unsigned long value = std::strtoul(text, &end, 10);
        if (end == text || *end != '\0' || value == 0 || value > 0xFFFF)
        {
            return etl::unexpected(Error::fromConfig(ConfigError::InvalidValue));
        }
        return static_cast<uint16_t>(value);
    }

    /**
     * @brief Map the getopt error returns
     */
    Error optionError(int opt, char* const argv[])
    {
        const char* argument = optind > 0 ? argv[optind - 1] : "";
        if (opt == ':')
        {
            LOG_ERROR("Option '%s' requires a value", argument);
            return Error::fromConfig(ConfigError::MissingArgument);
        }
        LOG_ERROR("Unknown option '%s'", argument);
        return Error::fromConfig(ConfigError::UnknownOption);
    }

    etl::expected<void, Error> parseSourceOptions(int argc, char* const argv[], TracerConfig& config)
    {
        const bool udp = config.source == SourceKind::GsmtapUdp;
        const char* shortOptions = udp ? UDP_SHORT_OPTIONS : FILE_SHORT_OPTIONS;
        const struct option* longOptions = udp ? UDP_LONG_OPTIONS : FILE_LONG_OPTIONS;

        // argv[0] is the source name; optind 0 restarts the scanner
        optind = 0;
        int opt;
        while ((opt = getopt_long(argc, argv, shortOptions, longOptions, nullptr)) != -1)
        {
            switch (opt)
            {
                case 'h':
                    return etl::unexpected(Error::fromConfig(ConfigError::HelpRequested));

                case 'i':
                    if (std::strlen(optarg) > config.bindIp.max_size())
                    {
                        LOG_ERROR("Bind address '%s' too long", optarg);
                        return etl::unexpected(Error::fromConfig(ConfigError::InvalidValue));
                    }
                    config.bindIp.assign(optarg);
                    break;

                case 'p':
                {
                    auto port = parsePort(optarg);
                    if (!port)
                    {
                        LOG_ERROR("Invalid port '%s'", optarg);
                        return etl::unexpected(port.error());
                    }
                    config.bindPort = port.value();
                    break;
                }

                case 'f':
                    if (std::strlen(optarg) > config.file.max_size())
                    {
                        LOG_ERROR("File name '%s' too long", optarg);
                        return etl::unexpected(Error::fromConfig(ConfigError::InvalidValue));
                    }
                    config.file.assign(optarg);
                    break;

                default:
                    return etl::unexpected(optionError(opt, argv));
            }
        }

        if (optind < argc)
        {
            LOG_ERROR("Unexpected argument '%s'", argv[optind]);
            return etl::unexpected(Error::fromConfig(ConfigError::UnknownOption));
        }

        return {};
    }
}

namespace simtrace
{
    etl::expected<TracerConfig, Error> parseCommandLine(int argc, char* const argv[])
    {
        TracerConfig config;

        opterr = 0;
        optind = 0;

        int opt;
        while ((opt = getopt_long(argc, argv, GLOBAL_SHORT_OPTIONS, GLOBAL_LONG_OPTIONS, nullptr)) != -1)
        {
            switch (opt)
            {
                case 'h':
                    return etl::unexpected(Error::fromConfig(ConfigError::HelpRequested));
                case 'v':
                    config.verbose = true;
                    break;
                case OPTION_NO_SUPPRESS_SELECT:
                    config.options.suppressSelect = false;
                    break;
                case OPTION_NO_SUPPRESS_STATUS:
                    config.options.suppressStatus = false;
                    break;
                case OPTION_NO_COMBINE_GET_RESPONSE:
                    config.options.combineGetResponse = false;
                    break;
                default:
                    return etl::unexpected(optionError(opt, argv));
            }
        }

        if (optind >= argc)
        {
            return etl::unexpected(Error::fromConfig(ConfigError::MissingSource));
        }

        const int sourceIndex = optind;
        const char* source = argv[sourceIndex];
        if (std::strcmp(source, "gsmtap-udp") == 0)
        {
            config.source = SourceKind::GsmtapUdp;
        }
        else if (std::strcmp(source, "gsmtap-pcap") == 0)
        {
            config.source = SourceKind::GsmtapPcap;
        }
        else if (std::strcmp(source, "hex-file") == 0)
        {
            config.source = SourceKind::HexFile;
        }
        else
        {
            LOG_ERROR("Unknown source '%s'", source);
            return etl::unexpected(Error::fromConfig(ConfigError::UnknownSource));
        }

        auto parsed = parseSourceOptions(argc - sourceIndex, argv + sourceIndex, config);
        if (!parsed)
        {
            return etl::unexpected(parsed.error());
        }

        if (config.source != SourceKind::GsmtapUdp && config.file.empty())
        {
            LOG_ERROR("Source %s requires -f FILE", source);
            return etl::unexpected(Error::fromConfig(ConfigError::MissingArgument));
        }

        return config;
    }

    void printUsage(FILE* stream, const char* program)
    {
        std::fprintf(stream,
            "Usage: %s [options] <source> [source options]\n"
            "\n"
            "Options:\n"
            "  --no-suppress-select       print SELECT commands\n"
            "  --no-suppress-status       print STATUS commands\n"
            "  --no-combine-get-response  do not merge GET RESPONSE into the preceding command\n"
            "  -v, --verbose              debug logging\n"
            "  -h, --help                 this text\n"
            "\n"
            "Sources:\n"
            "  gsmtap-udp  [-i BIND_IP] [-p BIND_PORT]   live GSMTAP-SIM (default 127.0.0.1:%u)\n"
            "  gsmtap-pcap -f FILE                       GSMTAP-SIM from a pcap file\n"
            "  hex-file    -f FILE                       hex trace, one exchange per line\n",
            program,
            static_cast<unsigned>(buffer::GSMTAP_UDP_PORT));
    }

} // namespace simtrace
