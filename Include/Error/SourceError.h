/**
 * @file SourceError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines APDU source error codes
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    /**
     * @brief Errors raised by capture sources (sockets, capture files)
     * 
     * Any of these terminates the trace loop.
     */
    enum class SourceError : uint8_t {
        Ok = 0,
        NotOpen,
        OpenFailed,
        SocketError,
        BindFailed,
        ReadFailed,
        Truncated,
        UnsupportedFormat,
        MalformedPacket
    };

} // namespace error
