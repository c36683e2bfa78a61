/**
 * @file HexTraceSource.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Replay of a plain text hex trace
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/optional.h>
#include <etl/expected.h>
#include <cstdio>

#include "IApduSource.h"

namespace simtrace
{
    /**
     * @brief One exchange per line
     *
     * @code
     * # comment
     * RESET
     * ATR 3B9F96801F878031E073FE211B674A4C753034054BA9
     * A0A40000027F209F22                   <- T=0 TPDU: header, body, SW
     * 00A40004027F10 622C820278218302...9000  <- command APDU, response + SW
     * @endcode
     */
    class HexTraceSource : public IApduSource
    {
    public:
        explicit HexTraceSource(const etl::string<256>& path);

        /**
         * @brief Read from an already open stream (not closed by the source)
         */
        explicit HexTraceSource(FILE* stream);

        ~HexTraceSource() override;

        etl::string_view name() const override
        {
            return "hex-file";
        }

        etl::expected<void, error::Error> open() override;

        void close() override;

        etl::expected<SourceEvent, error::Error> readNext() override;

        /**
         * @brief Parse one line
         *
         * @return nullopt for blank and comment lines, DecodeError for malformed lines
         */
        static etl::expected<etl::optional<SourceEvent>, error::Error> parseLine(etl::string_view line);

    private:
        etl::string<256> path;
        FILE* stream;
        bool ownsStream;
        uint32_t lineNumber;
        bool exhausted;
    };

} // namespace simtrace
