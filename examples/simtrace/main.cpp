/**
 * @file main.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief simtrace - Decodes a live or recorded SIM card APDU trace
 * @version 0.1
 * @date 2026-03-10
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <cstdio>
#include <cstdlib>
#include <memory>

#include "SimTrace/Apdu/ApduDecoder.h"
#include "SimTrace/Apdu/CommandRegistry.h"
#include "SimTrace/Apdu/CommandSets.h"
#include "SimTrace/Card/CardProfile.h"
#include "SimTrace/Card/FileSystem.h"
#include "SimTrace/Card/RuntimeState.h"
#include "SimTrace/Config/TracerConfig.h"
#include "SimTrace/Source/GsmtapUdpSource.h"
#include "SimTrace/Source/HexTraceSource.h"
#include "SimTrace/Source/PcapFileSource.h"
#include "SimTrace/Trace/ITraceSink.h"
#include "SimTrace/Trace/Tracer.h"
#include "Utils/Logging.h"

using namespace simtrace;
using namespace error;

std::unique_ptr<IApduSource> createSource(const TracerConfig& config)
{
    switch (config.source)
    {
        case SourceKind::GsmtapPcap:
            return std::unique_ptr<IApduSource>(new PcapFileSource(config.file));
        case SourceKind::HexFile:
            return std::unique_ptr<IApduSource>(new HexTraceSource(config.file));
        case SourceKind::GsmtapUdp:
        default:
            return std::unique_ptr<IApduSource>(new GsmtapUdpSource(config.bindIp, config.bindPort));
    }
}

int main(int argc, char* argv[])
{
    auto config = parseCommandLine(argc, argv);
    if (!config.has_value())
    {
        const bool help = config.error().is<ConfigError>()
            && config.error().get<ConfigError>() == ConfigError::HelpRequested;
        printUsage(help ? stdout : stderr, argv[0]);
        return help ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    Logger::setLevel(config->verbose ? LogLevel::Debug : LogLevel::Info);

    // Card model
    static FileSystem fileSystem;
    const CardProfile& profile = CardProfile::uiccSimUsimIsim();
    auto populated = profile.populate(fileSystem);
    if (!populated.has_value())
    {
        LOG_ERROR("Failed to build card model: %s", populated.error().toString().c_str());
        return EXIT_FAILURE;
    }
    LOG_DEBUG("Card model %.*s with %u nodes",
              static_cast<int>(profile.name().size()), profile.name().data(),
              static_cast<unsigned>(fileSystem.size()));

    static RuntimeState state(fileSystem);

    // Command set
    static CommandRegistry registry("default");
    auto built = buildDefaultRegistry(registry);
    if (!built.has_value())
    {
        LOG_ERROR("Failed to build command registry: %s", built.error().toString().c_str());
        return EXIT_FAILURE;
    }
    ApduDecoder decoder(registry);

    // Capture source
    std::unique_ptr<IApduSource> source = createSource(config.value());
    auto opened = source->open();
    if (!opened.has_value())
    {
        LOG_ERROR("Cannot open source %.*s: %s",
                  static_cast<int>(source->name().size()), source->name().data(),
                  opened.error().toString().c_str());
        return EXIT_FAILURE;
    }

    ConsoleTraceSink sink(stdout);
    Tracer tracer(*source, decoder, state, sink, config->options);

    auto result = tracer.run();
    source->close();

    if (!result.has_value())
    {
        LOG_ERROR("Trace aborted: %s", result.error().toString().c_str());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
