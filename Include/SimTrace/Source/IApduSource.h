/**
 * @file IApduSource.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Pull interface of a capture source
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/variant.h>
#include <etl/expected.h>
#include <etl/string_view.h>

#include "SimTrace/Apdu/ApduExchange.h"
#include "Error/Error.h"

namespace simtrace
{
    /**
     * @brief The card was power cycled (ATR seen); affects all logical channels
     */
    struct CardReset
    {
    };

    /**
     * @brief The source is exhausted
     */
    struct EndOfStream
    {
    };

    using SourceEvent = etl::variant<ApduExchange, CardReset, EndOfStream>;

    /**
     * @brief Capture source interface
     *
     * readNext() blocks only on the underlying I/O and may be called again
     * after EndOfStream, which it then keeps returning.
     */
    class IApduSource
    {
    public:
        virtual ~IApduSource() = default;

        virtual etl::string_view name() const = 0;

        /**
         * @brief Acquire the underlying resource (socket, file)
         *
         * @return etl::expected<void, error::Error> void on success, SourceError on failure
         */
        virtual etl::expected<void, error::Error> open() = 0;

        virtual void close() = 0;

        /**
         * @brief Read the next event
         *
         * @return etl::expected<SourceEvent, error::Error> Event, or a fatal source error
         */
        virtual etl::expected<SourceEvent, error::Error> readNext() = 0;
    };

} // namespace simtrace
