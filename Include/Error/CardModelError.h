/**
 * @file CardModelError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines card model (file system / runtime state) error codes
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class CardModelError : uint8_t {
        Ok = 0,
        FileNotFound,
        NotADirectory,
        NoParent,
        ApplicationNotFound,
        NoApplicationSelected,
        InvalidChannel,
        ChannelNotOpen,
        InvalidPath,
        DuplicateFile,
        CapacityExceeded
    };

} // namespace error
