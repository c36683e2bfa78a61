/**
 * @file StatusWord.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Status word (SW1 SW2) interpretation
 * @version 0.1
 * @date 2026-03-03
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/string.h>
#include <cstdint>

namespace simtrace
{
    /**
     * @brief Append the meaning of a status word to a string
     * 
     * Covers ETSI TS 102 221 §10.2 and the 3GPP TS 51.011 specific
     * 98XX / 9FXX codes. Unknown codes are rendered as "unknown status".
     * 
     * @param sw1 First status byte
     * @param sw2 Second status byte
     * @param out Destination string
     */
    void describeStatusWord(uint8_t sw1, uint8_t sw2, etl::istring& out);

    /**
     * @brief Retry counter of a 63CX status word
     * 
     * @return int Remaining retries, or -1 if the status word is no 63CX
     */
    inline int retriesFromStatusWord(uint8_t sw1, uint8_t sw2)
    {
        if (sw1 == 0x63 && (sw2 & 0xF0) == 0xC0)
        {
            return sw2 & 0x0F;
        }
        return -1;
    }

} // namespace simtrace
