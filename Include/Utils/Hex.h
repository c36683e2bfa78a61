/**
 * @file Hex.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Hexadecimal formatting and parsing helpers
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/vector.h>
#include <cstdint>
#include <cstddef>

namespace utils {

    /**
     * @brief Append bytes as upper-case hex without separators
     * 
     * Output is cut at the string capacity; a trailing ".." marks the cut.
     * 
     * @param out Destination string
     * @param data Bytes to format
     * @param length Number of bytes
     */
    void appendHex(etl::istring& out, const uint8_t* data, size_t length);

    void appendHex(etl::istring& out, const etl::ivector<uint8_t>& data);

    /**
     * @brief Parse a hex string into bytes
     * 
     * Whitespace and ':' separators are ignored.
     * 
     * @param text Hex text
     * @param out Destination vector (cleared first)
     * @return true Parsed completely
     * @return false Odd digit count, invalid character or capacity exceeded
     */
    bool parseHex(etl::string_view text, etl::ivector<uint8_t>& out);

    /**
     * @brief Read a big-endian 16-bit value
     */
    inline uint16_t readUint16(const uint8_t* data)
    {
        return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
    }

} // namespace utils
