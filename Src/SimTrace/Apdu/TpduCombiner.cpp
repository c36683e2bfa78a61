/**
 * @file TpduCombiner.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief T=0 transport folding implementation
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/TpduCombiner.h"
#include "SimTrace/Apdu/ApduDecoder.h"
#include "Utils/Logging.h"

using namespace simtrace;

namespace
{
    constexpr uint8_t INS_GET_RESPONSE = 0xC0;

    bool sameChannel(uint8_t claA, uint8_t claB)
    {
        return ApduDecoder::logicalChannelFromCla(claA) == ApduDecoder::logicalChannelFromCla(claB);
    }

    bool sameHeader(const ApduExchange& a, const ApduExchange& b)
    {
        return a.cla == b.cla && a.ins == b.ins && a.p1 == b.p1 && a.p2 == b.p2;
    }
}

void TpduCombiner::push(const ApduExchange& exchange, Output& out)
{
    out.clear();

    if (pending.has_value())
    {
        const ApduExchange& held = pending.value();

        if (awaitsGetResponse(held) && exchange.ins == INS_GET_RESPONSE && sameChannel(held.cla, exchange.cla))
        {
            // GET RESPONSE data is still an unresolved T=0 body when captured as TPDU
            const etl::ivector<uint8_t>& data = exchange.body.empty() ? exchange.responseData : exchange.body;

            ApduExchange merged = held;
            merged.setResponse(data, exchange.sw1, exchange.sw2);
            pending.reset();

            out.push_back(merged);
            return;
        }

        if (awaitsReissue(held) && sameHeader(held, exchange))
        {
            LOG_DEBUG("Exchange %02X %02X answered %02X%02X replaced by its re-issue",
                      held.cla, held.ins, held.sw1, held.sw2);
            pending.reset();
        }
        else
        {
            out.push_back(held);
            pending.reset();
        }
    }

    if ((awaitsGetResponse(exchange) && exchange.ins != INS_GET_RESPONSE) || awaitsReissue(exchange))
    {
        pending = exchange;
        return;
    }

    out.push_back(exchange);
}

void TpduCombiner::flush(Output& out)
{
    out.clear();
    if (pending.has_value())
    {
        out.push_back(pending.value());
        pending.reset();
    }
}

void TpduCombiner::discard()
{
    if (pending.has_value())
    {
        LOG_DEBUG("Discarding exchange %02X %02X held for T=0 pairing", pending->cla, pending->ins);
        pending.reset();
    }
}
