/**
 * @file StatusWord.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Status word interpretation implementation
 * @version 0.1
 * @date 2026-03-03
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "SimTrace/Apdu/StatusWord.h"
#include <cstdio>

namespace
{
    struct StatusWordEntry
    {
        uint16_t statusWord;
        const char* text;
    };

    // Fully specified status words
    constexpr StatusWordEntry STATUS_WORDS[] = {
        {0x9000, "normal ending of the command"},
        {0x9300, "toolkit busy"},
        {0x6200, "warning, NV memory unchanged"},
        {0x6281, "part of returned data may be corrupted"},
        {0x6282, "end of file/record reached before reading Le bytes"},
        {0x6283, "selected file invalidated"},
        {0x6285, "selected file in termination state"},
        {0x62F1, "more data available"},
        {0x62F2, "more data available and proactive command pending"},
        {0x62F3, "response data available"},
        {0x63F1, "more data expected"},
        {0x63F2, "more data expected and proactive command pending"},
        {0x6400, "execution error, NV memory unchanged"},
        {0x6500, "execution error, NV memory changed"},
        {0x6581, "memory problem"},
        {0x6700, "wrong length"},
        {0x6800, "function in CLA not supported"},
        {0x6881, "logical channel not supported"},
        {0x6882, "secure messaging not supported"},
        {0x6900, "command not allowed"},
        {0x6981, "command incompatible with file structure"},
        {0x6982, "security status not satisfied"},
        {0x6983, "authentication/PIN method blocked"},
        {0x6984, "referenced data invalidated"},
        {0x6985, "conditions of use not satisfied"},
        {0x6986, "command not allowed (no EF selected)"},
        {0x6989, "secure channel security not satisfied"},
        {0x6A80, "incorrect parameters in the data field"},
        {0x6A81, "function not supported"},
        {0x6A82, "file not found"},
        {0x6A83, "record not found"},
        {0x6A84, "not enough memory space"},
        {0x6A86, "incorrect parameters P1 to P2"},
        {0x6A87, "Lc inconsistent with P1 to P2"},
        {0x6A88, "referenced data not found"},
        {0x6B00, "wrong parameter(s) P1-P2"},
        {0x6D00, "instruction code not supported or invalid"},
        {0x6E00, "class not supported"},
        {0x6F00, "technical problem, no precise diagnosis"},
        {0x9802, "no CHV initialized"},
        {0x9804, "access condition not fulfilled"},
        {0x9808, "in contradiction with CHV status"},
        {0x9810, "in contradiction with invalidation status"},
        {0x9840, "CHV blocked"},
        {0x9850, "increase cannot be performed, max value reached"},
        {0x9862, "authentication error, incorrect MAC"},
        {0x9863, "security session or association expired"},
        {0x9864, "minimum UICC suspension time is too long"},
    };
}

namespace simtrace
{
    void describeStatusWord(uint8_t sw1, uint8_t sw2, etl::istring& out)
    {
        const uint16_t statusWord = static_cast<uint16_t>((sw1 << 8) | sw2);
        for (const auto& entry : STATUS_WORDS)
        {
            if (entry.statusWord == statusWord)
            {
                out.append(entry.text);
                return;
            }
        }

        // Status words carrying a parameter in SW2
        char buffer[64];
        switch (sw1)
        {
            case 0x61:
                std::snprintf(buffer, sizeof(buffer), "%u response bytes available", static_cast<unsigned>(sw2));
                break;
            case 0x6C:
                std::snprintf(buffer, sizeof(buffer), "wrong Le, %u bytes available", static_cast<unsigned>(sw2));
                break;
            case 0x91:
                std::snprintf(buffer, sizeof(buffer), "normal ending, proactive command pending (%u bytes)", static_cast<unsigned>(sw2));
                break;
            case 0x92:
                std::snprintf(buffer, sizeof(buffer), "normal ending after %u internal retries", static_cast<unsigned>(sw2 & 0x0F));
                break;
            case 0x9F:
                std::snprintf(buffer, sizeof(buffer), "%u response bytes available", static_cast<unsigned>(sw2));
                break;
            case 0x67:
                std::snprintf(buffer, sizeof(buffer), "incorrect parameter P3");
                break;
            case 0x63:
                if ((sw2 & 0xF0) == 0xC0)
                {
                    std::snprintf(buffer, sizeof(buffer), "verification failed, %u retries left", static_cast<unsigned>(sw2 & 0x0F));
                    break;
                }
                std::snprintf(buffer, sizeof(buffer), "warning, NV memory changed");
                break;
            case 0x6F:
                std::snprintf(buffer, sizeof(buffer), "technical problem");
                break;
            default:
                std::snprintf(buffer, sizeof(buffer), "unknown status");
                break;
        }
        out.append(buffer);
    }

} // namespace simtrace
