/**
 * @file DecodeError.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Defines APDU decoding error codes
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class DecodeError : uint8_t {
        Ok = 0,
        TooShort,
        WrongLength,
        InvalidHex,
        MissingData,
        InvalidParameter,
        UnsupportedEncoding
    };

} // namespace error
