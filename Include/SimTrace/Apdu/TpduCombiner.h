/**
 * @file TpduCombiner.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Folds T=0 transport exchanges into complete APDUs
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/optional.h>

#include "ApduExchange.h"

namespace simtrace
{
    /**
     * @brief T=0 transport folding (ETSI TS 102 221 §7.3.1.1)
     *
     * - A command answered with 61XX (or 9FXX on a SIM) is held until the
     *   next exchange. A GET RESPONSE on the same logical channel is merged
     *   into it: response data and status word are taken from the GET RESPONSE.
     * - A command answered with 6CXX is held as well. When the next exchange
     *   repeats its header with the corrected length, it replaces the held one.
     *
     * Any other next exchange releases the held exchange unchanged, so no
     * exchange is ever dropped and arrival order is kept.
     */
    class TpduCombiner
    {
    public:
        using Output = etl::vector<ApduExchange, 2>;

        /**
         * @brief Feed one exchange
         *
         * @param exchange Captured exchange
         * @param out Exchanges ready for decoding, in order (cleared first)
         */
        void push(const ApduExchange& exchange, Output& out);

        /**
         * @brief Release a held exchange (end of stream)
         */
        void flush(Output& out);

        /**
         * @brief Drop a held exchange (card reset)
         */
        void discard();

        bool hasPending() const
        {
            return pending.has_value();
        }

    private:
        static bool awaitsGetResponse(const ApduExchange& exchange)
        {
            return exchange.hasResponse && (exchange.sw1 == 0x61 || exchange.sw1 == 0x9F);
        }

        static bool awaitsReissue(const ApduExchange& exchange)
        {
            return exchange.hasResponse && exchange.sw1 == 0x6C;
        }

        etl::optional<ApduExchange> pending;
    };

} // namespace simtrace
