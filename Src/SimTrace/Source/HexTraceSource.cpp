/**
 * @file HexTraceSource.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Replay of a plain text hex trace implementation
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Source/HexTraceSource.h"
#include "SimTrace/BufferSizes.h"
#include "Utils/Hex.h"
#include "Utils/Logging.h"

#include <etl/vector.h>
#include <cerrno>
#include <cstring>

using namespace simtrace;
using namespace simtrace::buffer;
using namespace error;

namespace
{
    constexpr size_t TOKENS_MAX = 3;

    bool isBlank(char c)
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    bool equalsIgnoreCase(etl::string_view token, const char* keyword)
    {
        const size_t length = std::strlen(keyword);
        if (token.size() != length)
        {
            return false;
        }
        for (size_t i = 0; i < length; ++i)
        {
            char c = token[i];
            if (c >= 'a' && c <= 'z')
            {
                c = static_cast<char>(c - 'a' + 'A');
            }
            if (c != keyword[i])
            {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief Split a line on blanks; tokens beyond the capacity are counted but dropped
     */
    size_t splitTokens(etl::string_view line, etl::vector<etl::string_view, TOKENS_MAX>& tokens)
    {
        size_t count = 0;
        size_t i = 0;
        while (i < line.size())
        {
            while (i < line.size() && isBlank(line[i]))
            {
                ++i;
            }
            if (i >= line.size() || line[i] == '#')
            {
                break;
            }

            const size_t start = i;
            while (i < line.size() && !isBlank(line[i]) && line[i] != '#')
            {
                ++i;
            }

            if (!tokens.full())
            {
                tokens.push_back(line.substr(start, i - start));
            }
            ++count;
        }
        return count;
    }
}

// ==============================================================================
// Initialization and Teardown
// ==============================================================================

HexTraceSource::HexTraceSource(const etl::string<256>& path)
    : path(path)
    , stream(nullptr)
    , ownsStream(true)
    , lineNumber(0)
    , exhausted(false)
{
}

HexTraceSource::HexTraceSource(FILE* stream)
    : path("<stream>")
    , stream(stream)
    , ownsStream(false)
    , lineNumber(0)
    , exhausted(false)
{
}

HexTraceSource::~HexTraceSource()
{
    close();
}

// ==============================================================================
// Open and Close
// ==============================================================================

etl::expected<void, Error> HexTraceSource::open()
{
    if (stream != nullptr)
    {
        return {};
    }

    stream = std::fopen(path.c_str(), "r");
    if (stream == nullptr)
    {
        LOG_ERROR("Cannot open %s: %s", path.c_str(), std::strerror(errno));
        return etl::unexpected(Error::fromSource(SourceError::OpenFailed));
    }

    lineNumber = 0;
    exhausted = false;
    LOG_INFO("Reading %s", path.c_str());
    return {};
}

void HexTraceSource::close()
{
    if (stream != nullptr && ownsStream)
    {
        std::fclose(stream);
        LOG_DEBUG("%s closed after %u lines", path.c_str(), static_cast<unsigned>(lineNumber));
    }
    if (ownsStream)
    {
        stream = nullptr;
    }
}

// ==============================================================================
// Read
// ==============================================================================

etl::expected<SourceEvent, Error> HexTraceSource::readNext()
{
    if (exhausted)
    {
        return SourceEvent(EndOfStream());
    }

    if (stream == nullptr)
    {
        return etl::unexpected(Error::fromSource(SourceError::NotOpen));
    }

    char line[TRACE_LINE_MAX + 1];
    while (std::fgets(line, sizeof(line), stream) != nullptr)
    {
        ++lineNumber;

        const size_t length = std::strlen(line);
        if (length == TRACE_LINE_MAX && line[length - 1] != '\n')
        {
            LOG_ERROR("%s:%u: line too long", path.c_str(), static_cast<unsigned>(lineNumber));
            return etl::unexpected(Error::fromDecode(DecodeError::WrongLength));
        }

        auto event = parseLine(etl::string_view(line, length));
        if (!event)
        {
            LOG_ERROR("%s:%u: %s", path.c_str(), static_cast<unsigned>(lineNumber), event.error().toString().c_str());
            return etl::unexpected(event.error());
        }

        if (event.value().has_value())
        {
            return event.value().value();
        }
    }

    if (std::ferror(stream))
    {
        LOG_ERROR("%s: read failed", path.c_str());
        return etl::unexpected(Error::fromSource(SourceError::ReadFailed));
    }

    exhausted = true;
    return SourceEvent(EndOfStream());
}

etl::expected<etl::optional<SourceEvent>, Error> HexTraceSource::parseLine(etl::string_view line)
{
    etl::vector<etl::string_view, TOKENS_MAX> tokens;
    const size_t count = splitTokens(line, tokens);

    if (count == 0)
    {
        return etl::optional<SourceEvent>();
    }

    if (equalsIgnoreCase(tokens[0], "RESET"))
    {
        if (count != 1)
        {
            return etl::unexpected(Error::fromDecode(DecodeError::InvalidParameter));
        }
        return etl::optional<SourceEvent>(SourceEvent(CardReset()));
    }

    if (equalsIgnoreCase(tokens[0], "ATR"))
    {
        etl::vector<uint8_t, APDU_DATA_MAX> atr;
        if (count != 2 || !utils::parseHex(tokens[1], atr) || atr.empty())
        {
            return etl::unexpected(Error::fromDecode(DecodeError::InvalidHex));
        }
        return etl::optional<SourceEvent>(SourceEvent(CardReset()));
    }

    if (count > 2)
    {
        return etl::unexpected(Error::fromDecode(DecodeError::InvalidParameter));
    }

    etl::vector<uint8_t, APDU_RAW_MAX> command;
    if (!utils::parseHex(tokens[0], command))
    {
        return etl::unexpected(Error::fromDecode(DecodeError::InvalidHex));
    }

    etl::expected<ApduExchange, Error> exchange = etl::unexpected(Error::fromDecode(DecodeError::TooShort));
    if (count == 1)
    {
        exchange = ApduExchange::fromTpdu(command);
    }
    else
    {
        etl::vector<uint8_t, APDU_RAW_MAX> response;
        if (!utils::parseHex(tokens[1], response))
        {
            return etl::unexpected(Error::fromDecode(DecodeError::InvalidHex));
        }
        exchange = ApduExchange::fromCommandResponse(command, response);
    }

    if (!exchange)
    {
        return etl::unexpected(exchange.error());
    }
    return etl::optional<SourceEvent>(SourceEvent(exchange.value()));
}
