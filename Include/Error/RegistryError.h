/**
 * @file RegistryError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines command registry error codes
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class RegistryError : uint8_t {
        Ok = 0,
        Full,
        InvalidDescriptor
    };

} // namespace error
