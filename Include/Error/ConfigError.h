/**
 * @file ConfigError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines command line configuration error codes
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class ConfigError : uint8_t {
        Ok = 0,
        HelpRequested,
        UnknownOption,
        MissingArgument,
        InvalidValue,
        MissingSource,
        UnknownSource
    };

} // namespace error
