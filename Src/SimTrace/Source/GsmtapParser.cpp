/**
 * @file GsmtapParser.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief GSMTAP-SIM datagram decoding implementation
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Source/GsmtapParser.h"
#include "SimTrace/BufferSizes.h"
#include "Utils/Logging.h"

#include <etl/vector.h>

namespace simtrace
{
    namespace gsmtap
    {
        namespace
        {
            constexpr size_t OFFSET_VERSION = 0;
            constexpr size_t OFFSET_HEADER_LENGTH = 1;
            constexpr size_t OFFSET_TYPE = 2;
            constexpr size_t OFFSET_SUB_TYPE = 12;
        }

        etl::expected<etl::optional<SourceEvent>, error::Error> parse(const uint8_t* data, size_t length)
        {
            if (length < HEADER_MIN || data[OFFSET_VERSION] != VERSION)
            {
                return etl::unexpected(error::Error::fromSource(error::SourceError::MalformedPacket));
            }

            const size_t headerLength = static_cast<size_t>(data[OFFSET_HEADER_LENGTH]) * 4;
            if (headerLength < HEADER_MIN || headerLength > length)
            {
                return etl::unexpected(error::Error::fromSource(error::SourceError::MalformedPacket));
            }

            if (data[OFFSET_TYPE] != TYPE_SIM)
            {
                return etl::optional<SourceEvent>();
            }

            const uint8_t* body = data + headerLength;
            const size_t bodyLength = length - headerLength;

            switch (static_cast<SimSubType>(data[OFFSET_SUB_TYPE]))
            {
                case SimSubType::Apdu:
                {
                    if (bodyLength > buffer::APDU_RAW_MAX)
                    {
                        return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
                    }

                    etl::vector<uint8_t, buffer::APDU_RAW_MAX> raw(body, body + bodyLength);
                    auto exchange = ApduExchange::fromTpdu(raw);
                    if (!exchange)
                    {
                        return etl::unexpected(exchange.error());
                    }
                    return etl::optional<SourceEvent>(SourceEvent(exchange.value()));
                }

                case SimSubType::Atr:
                    return etl::optional<SourceEvent>(SourceEvent(CardReset()));

                default:
                    LOG_DEBUG("Ignoring GSMTAP SIM sub type %u", static_cast<unsigned>(data[OFFSET_SUB_TYPE]));
                    return etl::optional<SourceEvent>();
            }
        }

    } // namespace gsmtap

} // namespace simtrace
