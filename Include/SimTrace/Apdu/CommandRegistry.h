/**
 * @file CommandRegistry.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Lookup table from (CLA, INS) to command interpreter
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/string_view.h>
#include <etl/optional.h>
#include <etl/expected.h>
#include <memory>
#include <cstdint>

#include "ApduExchange.h"
#include "ApduCommand.h"
#include "SimTrace/BufferSizes.h"
#include "Error/Error.h"

namespace simtrace
{
    /**
     * @brief Registry key: a command matches when (cla & claMask) == cla and INS is equal
     */
    struct CommandKey
    {
        uint8_t cla;
        uint8_t claMask;
        uint8_t ins;

        bool matches(uint8_t commandCla, uint8_t commandIns) const
        {
            return (commandCla & claMask) == cla && commandIns == ins;
        }

        bool operator==(const CommandKey& other) const
        {
            return cla == other.cla && claMask == other.claMask && ins == other.ins;
        }

        bool operator!=(const CommandKey& other) const
        {
            return !(*this == other);
        }
    };

    using CommandFactory = std::unique_ptr<ApduCommand> (*)(
        const CommandDescriptor& descriptor,
        const ApduExchange& exchange,
        uint8_t lchan);

    /**
     * @brief Registry entry
     */
    struct CommandDescriptor
    {
        CommandKey key;
        const char* name;
        ApduCase apduCase;
        CommandKind kind;
        CommandFactory create;
    };

    /**
     * @brief Creates an interpreter of type T for a descriptor
     */
    template <typename T>
    std::unique_ptr<ApduCommand> makeCommand(
        const CommandDescriptor& descriptor,
        const ApduExchange& exchange,
        uint8_t lchan)
    {
        return std::unique_ptr<ApduCommand>(new T(descriptor, exchange, lchan));
    }

    /**
     * @brief Ordered set of command descriptors
     *
     * Registering a descriptor whose key equals an existing one replaces it;
     * the new entry becomes the most recent. lookup() scans from the most
     * recent entry, so when several (masked) keys match a command, the last
     * registered one wins.
     */
    class CommandRegistry
    {
    public:
        explicit CommandRegistry(etl::string_view name);

        etl::string_view name() const
        {
            return registryName;
        }

        size_t size() const
        {
            return entries.size();
        }

        /**
         * @brief Add a descriptor, overriding an equal key
         *
         * @return etl::expected<void, error::Error> RegistryError::Full or InvalidDescriptor on failure
         */
        etl::expected<void, error::Error> registerCommand(const CommandDescriptor& descriptor);

        /**
         * @brief Register all entries of another registry in their order
         */
        etl::expected<void, error::Error> merge(const CommandRegistry& other);

        etl::optional<CommandDescriptor> lookup(uint8_t cla, uint8_t ins) const;

    private:
        etl::string_view registryName;
        etl::vector<CommandDescriptor, buffer::REGISTRY_MAX> entries;
    };

} // namespace simtrace
