/**
 * @file CommandRegistry.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Command registry implementation
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/CommandRegistry.h"
#include "Utils/Logging.h"

using namespace simtrace;

CommandRegistry::CommandRegistry(etl::string_view name)
    : registryName(name)
    , entries()
{
}

etl::expected<void, error::Error> CommandRegistry::registerCommand(const CommandDescriptor& descriptor)
{
    if (descriptor.create == nullptr || descriptor.name == nullptr || (descriptor.key.cla & ~descriptor.key.claMask) != 0)
    {
        return etl::unexpected(error::Error::fromRegistry(error::RegistryError::InvalidDescriptor));
    }

    for (auto it = entries.begin(); it != entries.end(); ++it)
    {
        if (it->key == descriptor.key)
        {
            LOG_DEBUG("%.*s: %s overrides %s (CLA %02X/%02X INS %02X)",
                      static_cast<int>(registryName.size()), registryName.data(),
                      descriptor.name, it->name,
                      descriptor.key.cla, descriptor.key.claMask, descriptor.key.ins);
            entries.erase(it);
            break;
        }
    }

    if (entries.full())
    {
        return etl::unexpected(error::Error::fromRegistry(error::RegistryError::Full));
    }

    entries.push_back(descriptor);
    return {};
}

etl::expected<void, error::Error> CommandRegistry::merge(const CommandRegistry& other)
{
    for (const CommandDescriptor& descriptor : other.entries)
    {
        auto registered = registerCommand(descriptor);
        if (!registered)
        {
            return registered;
        }
    }
    return {};
}

etl::optional<CommandDescriptor> CommandRegistry::lookup(uint8_t cla, uint8_t ins) const
{
    for (size_t i = entries.size(); i > 0; --i)
    {
        if (entries[i - 1].key.matches(cla, ins))
        {
            return entries[i - 1];
        }
    }
    return etl::nullopt;
}
