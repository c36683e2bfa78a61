/**
 * @file CommandSets.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Command set tables
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/CommandSets.h"
#include "SimTrace/Apdu/Commands/SelectCommand.h"
#include "SimTrace/Apdu/Commands/StatusCommand.h"
#include "SimTrace/Apdu/Commands/BinaryCommand.h"
#include "SimTrace/Apdu/Commands/RecordCommand.h"
#include "SimTrace/Apdu/Commands/SearchRecordCommand.h"
#include "SimTrace/Apdu/Commands/IncreaseCommand.h"
#include "SimTrace/Apdu/Commands/PinCommand.h"
#include "SimTrace/Apdu/Commands/FileLifecycleCommand.h"
#include "SimTrace/Apdu/Commands/AuthenticateCommand.h"
#include "SimTrace/Apdu/Commands/ByteCountCommands.h"
#include "SimTrace/Apdu/Commands/ManageChannelCommand.h"
#include "SimTrace/Apdu/Commands/CatCommand.h"
#include "SimTrace/Apdu/Commands/GetIdentityCommand.h"
#include "Utils/Logging.h"

using namespace simtrace;

namespace
{
    // CLA families
    constexpr uint8_t SIM_CLA = 0xA0;
    constexpr uint8_t SIM_MASK = 0xFF;
    constexpr uint8_t ISO_FIRST_CLA = 0x00;        // 0X: channels 0-3
    constexpr uint8_t ISO_FIRST_MASK = 0xF0;
    constexpr uint8_t ISO_FURTHER_CLA = 0x40;      // 4X-7X: channels 4-19
    constexpr uint8_t ISO_FURTHER_MASK = 0xC0;
    constexpr uint8_t PROP_FIRST_CLA = 0x80;       // 8X: channels 0-3
    constexpr uint8_t PROP_FIRST_MASK = 0xF0;
    constexpr uint8_t PROP_FURTHER_CLA = 0xC0;     // CX-FX: channels 4-19
    constexpr uint8_t PROP_FURTHER_MASK = 0xC0;

    constexpr ApduCase C1 = ApduCase::Case1;
    constexpr ApduCase C2 = ApduCase::Case2;
    constexpr ApduCase C3 = ApduCase::Case3;
    constexpr ApduCase C4 = ApduCase::Case4;

    constexpr CommandKind SELECT = CommandKind::Select;
    constexpr CommandKind STATUS = CommandKind::Status;
    constexpr CommandKind OTHER = CommandKind::Other;

    /**
     * @brief Table row without CLA; expanded for every CLA family of a set
     */
    struct CommandSpec
    {
        uint8_t ins;
        const char* name;
        ApduCase apduCase;
        CommandKind kind;
        CommandFactory create;
    };

    struct ClaFamily
    {
        uint8_t cla;
        uint8_t mask;
    };

    const CommandSpec SIM_COMMANDS[] = {
        {0xA4, "SELECT",               C3, SELECT, &makeCommand<SelectCommand>},
        {0xF2, "STATUS",               C2, STATUS, &makeCommand<StatusCommand>},
        {0xB0, "READ BINARY",          C2, OTHER,  &makeCommand<BinaryCommand>},
        {0xD6, "UPDATE BINARY",        C3, OTHER,  &makeCommand<BinaryCommand>},
        {0xB2, "READ RECORD",          C2, OTHER,  &makeCommand<RecordCommand>},
        {0xDC, "UPDATE RECORD",        C3, OTHER,  &makeCommand<RecordCommand>},
        {0xA2, "SEEK",                 C3, OTHER,  &makeCommand<SearchRecordCommand>},
        {0x32, "INCREASE",             C4, OTHER,  &makeCommand<IncreaseCommand>},
        {0x20, "VERIFY CHV",           C3, OTHER,  &makeCommand<PinCommand>},
        {0x24, "CHANGE CHV",           C3, OTHER,  &makeCommand<PinCommand>},
        {0x26, "DISABLE CHV",          C3, OTHER,  &makeCommand<PinCommand>},
        {0x28, "ENABLE CHV",           C3, OTHER,  &makeCommand<PinCommand>},
        {0x2C, "UNBLOCK CHV",          C3, OTHER,  &makeCommand<PinCommand>},
        {0x04, "INVALIDATE",           C1, OTHER,  &makeCommand<FileLifecycleCommand>},
        {0x44, "REHABILITATE",         C1, OTHER,  &makeCommand<FileLifecycleCommand>},
        {0x88, "RUN GSM ALGORITHM",    C4, OTHER,  &makeCommand<RunGsmAlgorithmCommand>},
        {0xC0, "GET RESPONSE",         C2, OTHER,  &makeCommand<GetResponseCommand>},
        {0x10, "TERMINAL PROFILE",     C3, OTHER,  &makeCommand<CatCommand>},
        {0x12, "FETCH",                C2, OTHER,  &makeCommand<CatCommand>},
        {0x14, "TERMINAL RESPONSE",    C3, OTHER,  &makeCommand<CatCommand>},
        {0xC2, "ENVELOPE",             C4, OTHER,  &makeCommand<CatCommand>},
    };

    const CommandSpec UICC_ISO_COMMANDS[] = {
        {0xA4, "SELECT",               C4, SELECT, &makeCommand<SelectCommand>},
        {0xB0, "READ BINARY",          C2, OTHER,  &makeCommand<BinaryCommand>},
        {0xD6, "UPDATE BINARY",        C3, OTHER,  &makeCommand<BinaryCommand>},
        {0xB2, "READ RECORD",          C2, OTHER,  &makeCommand<RecordCommand>},
        {0xDC, "UPDATE RECORD",        C3, OTHER,  &makeCommand<RecordCommand>},
        {0xA2, "SEARCH RECORD",        C4, OTHER,  &makeCommand<SearchRecordCommand>},
        {0x20, "VERIFY PIN",           C3, OTHER,  &makeCommand<PinCommand>},
        {0x24, "CHANGE PIN",           C3, OTHER,  &makeCommand<PinCommand>},
        {0x26, "DISABLE PIN",          C3, OTHER,  &makeCommand<PinCommand>},
        {0x28, "ENABLE PIN",           C3, OTHER,  &makeCommand<PinCommand>},
        {0x2C, "UNBLOCK PIN",          C3, OTHER,  &makeCommand<PinCommand>},
        {0x04, "DEACTIVATE FILE",      C3, OTHER,  &makeCommand<FileLifecycleCommand>},
        {0x44, "ACTIVATE FILE",        C3, OTHER,  &makeCommand<FileLifecycleCommand>},
        {0x88, "AUTHENTICATE",         C4, OTHER,  &makeCommand<AuthenticateCommand>},
        {0x84, "GET CHALLENGE",        C2, OTHER,  &makeCommand<GetChallengeCommand>},
        {0xC0, "GET RESPONSE",         C2, OTHER,  &makeCommand<GetResponseCommand>},
        {0x70, "MANAGE CHANNEL",       C2, OTHER,  &makeCommand<ManageChannelCommand>},
    };

    const CommandSpec UICC_PROPRIETARY_COMMANDS[] = {
        {0xF2, "STATUS",               C2, STATUS, &makeCommand<StatusCommand>},
        {0x32, "INCREASE",             C4, OTHER,  &makeCommand<IncreaseCommand>},
        {0x10, "TERMINAL PROFILE",     C3, OTHER,  &makeCommand<CatCommand>},
        {0x12, "FETCH",                C2, OTHER,  &makeCommand<CatCommand>},
        {0x14, "TERMINAL RESPONSE",    C3, OTHER,  &makeCommand<CatCommand>},
        {0xC2, "ENVELOPE",             C4, OTHER,  &makeCommand<CatCommand>},
    };

    const CommandSpec USIM_ISO_COMMANDS[] = {
        {0x88, "AUTHENTICATE",         C4, OTHER,  &makeCommand<UsimAuthenticateCommand>},
    };

    const CommandSpec USIM_PROPRIETARY_COMMANDS[] = {
        {0x78, "GET IDENTITY",         C4, OTHER,  &makeCommand<GetIdentityCommand>},
    };

    const ClaFamily SIM_FAMILIES[] = {
        {SIM_CLA, SIM_MASK},
    };

    const ClaFamily ISO_FAMILIES[] = {
        {ISO_FIRST_CLA, ISO_FIRST_MASK},
        {ISO_FURTHER_CLA, ISO_FURTHER_MASK},
    };

    const ClaFamily PROPRIETARY_FAMILIES[] = {
        {PROP_FIRST_CLA, PROP_FIRST_MASK},
        {PROP_FURTHER_CLA, PROP_FURTHER_MASK},
    };

    template <size_t N, size_t M>
    etl::expected<void, error::Error> registerTable(
        CommandRegistry& registry,
        const ClaFamily (&families)[N],
        const CommandSpec (&commands)[M])
    {
        for (const ClaFamily& family : families)
        {
            for (const CommandSpec& command : commands)
            {
                const CommandDescriptor descriptor = {
                    {family.cla, family.mask, command.ins},
                    command.name,
                    command.apduCase,
                    command.kind,
                    command.create
                };

                auto registered = registry.registerCommand(descriptor);
                if (!registered)
                {
                    return registered;
                }
            }
        }
        return {};
    }
}

namespace simtrace
{
    etl::expected<void, error::Error> registerSimCommands(CommandRegistry& registry)
    {
        return registerTable(registry, SIM_FAMILIES, SIM_COMMANDS);
    }

    etl::expected<void, error::Error> registerUiccCommands(CommandRegistry& registry)
    {
        auto registered = registerTable(registry, ISO_FAMILIES, UICC_ISO_COMMANDS);
        if (!registered)
        {
            return registered;
        }
        return registerTable(registry, PROPRIETARY_FAMILIES, UICC_PROPRIETARY_COMMANDS);
    }

    etl::expected<void, error::Error> registerUsimCommands(CommandRegistry& registry)
    {
        auto registered = registerTable(registry, ISO_FAMILIES, USIM_ISO_COMMANDS);
        if (!registered)
        {
            return registered;
        }
        return registerTable(registry, PROPRIETARY_FAMILIES, USIM_PROPRIETARY_COMMANDS);
    }

    etl::expected<void, error::Error> buildDefaultRegistry(CommandRegistry& registry)
    {
        CommandRegistry sim("SIM");
        CommandRegistry uicc("UICC");
        CommandRegistry usim("USIM");

        auto built = registerSimCommands(sim);
        if (built)
        {
            built = registerUiccCommands(uicc);
        }
        if (built)
        {
            built = registerUsimCommands(usim);
        }
        if (built)
        {
            built = registry.merge(sim);
        }
        if (built)
        {
            built = registry.merge(uicc);
        }
        if (built)
        {
            built = registry.merge(usim);
        }

        if (!built)
        {
            LOG_ERROR("Building command registry failed: %s", built.error().toString().c_str());
            return built;
        }

        LOG_DEBUG("Command registry: %u entries", static_cast<unsigned>(registry.size()));
        return {};
    }
}
