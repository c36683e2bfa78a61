/**
 * @file Tracer.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Trace loop: source, decoder, runtime state and sink
 * @version 0.1
 * @date 2026-03-09
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <cstdint>

#include "ITraceSink.h"
#include "SimTrace/Apdu/ApduDecoder.h"
#include "SimTrace/Apdu/TpduCombiner.h"
#include "SimTrace/Card/RuntimeState.h"
#include "SimTrace/Source/IApduSource.h"
#include "Error/Error.h"

namespace simtrace
{
    /**
     * @brief Output filters and transport options
     */
    struct TracerOptions
    {
        bool suppressSelect;
        bool suppressStatus;
        bool combineGetResponse;

        TracerOptions()
            : suppressSelect(true)
            , suppressStatus(true)
            , combineGetResponse(true)
        {
        }
    };

    struct TracerStatistics
    {
        uint32_t exchanges;
        uint32_t resets;
        uint32_t emitted;
        uint32_t suppressed;
        uint32_t unrecognized;
        uint32_t degraded;

        TracerStatistics()
            : exchanges(0), resets(0), emitted(0), suppressed(0), unrecognized(0), degraded(0) {}
    };

    /**
     * @brief Pulls events from a source and applies them in arrival order
     *
     * Running until the source reports EndOfStream or fails. A CardReset
     * drops a half-received T=0 pairing and resets the runtime state.
     * Per-exchange problems end up in the record text; only source errors
     * stop the loop.
     */
    class Tracer
    {
    public:
        enum class State : uint8_t
        {
            Running,
            Terminated
        };

        Tracer(IApduSource& source,
               const ApduDecoder& decoder,
               RuntimeState& state,
               ITraceSink& sink,
               const TracerOptions& options = TracerOptions());

        /**
         * @brief Run until end of stream
         *
         * @return etl::expected<void, error::Error> void on end of stream, the source error otherwise
         */
        etl::expected<void, error::Error> run();

        /**
         * @brief Pull and handle exactly one event
         *
         * @return etl::expected<void, error::Error> void while running or after
         * end of stream, the source error otherwise
         */
        etl::expected<void, error::Error> step();

        State getState() const
        {
            return state;
        }

        const TracerStatistics& statistics() const
        {
            return stats;
        }

    private:
        void handleReset();

        void handleEndOfStream();

        void handleExchange(const ApduExchange& exchange);

        void processExchange(const ApduExchange& exchange);

        bool isSuppressed(const ApduCommand& command) const;

        IApduSource& source;
        const ApduDecoder& decoder;
        RuntimeState& runtime;
        ITraceSink& sink;
        TracerOptions options;
        TpduCombiner combiner;
        State state;
        TracerStatistics stats;
    };

} // namespace simtrace
