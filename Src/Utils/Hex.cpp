/**
 * @file Hex.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Hexadecimal helpers implementation
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Utils/Hex.h"

namespace
{
    constexpr const char HEX_DIGITS[] = "0123456789ABCDEF";

    int nibbleValue(char c)
    {
        if (c >= '0' && c <= '9')
        {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f')
        {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F')
        {
            return c - 'A' + 10;
        }
        return -1;
    }
}

namespace utils {

    void appendHex(etl::istring& out, const uint8_t* data, size_t length)
    {
        for (size_t i = 0; i < length; ++i)
        {
            if (out.available() < 2)
            {
                if (out.size() >= 2)
                {
                    out[out.size() - 2] = '.';
                    out[out.size() - 1] = '.';
                }
                return;
            }
            out.push_back(HEX_DIGITS[(data[i] >> 4) & 0x0F]);
            out.push_back(HEX_DIGITS[data[i] & 0x0F]);
        }
    }

    void appendHex(etl::istring& out, const etl::ivector<uint8_t>& data)
    {
        appendHex(out, data.data(), data.size());
    }

    bool parseHex(etl::string_view text, etl::ivector<uint8_t>& out)
    {
        out.clear();

        int high = -1;
        for (size_t i = 0; i < text.size(); ++i)
        {
            const char c = text[i];
            if (c == ' ' || c == '\t' || c == ':' || c == '\r' || c == '\n')
            {
                continue;
            }

            const int value = nibbleValue(c);
            if (value < 0)
            {
                return false;
            }

            if (high < 0)
            {
                high = value;
                continue;
            }

            if (out.full())
            {
                return false;
            }
            out.push_back(static_cast<uint8_t>((high << 4) | value));
            high = -1;
        }

        return high < 0;
    }

} // namespace utils
