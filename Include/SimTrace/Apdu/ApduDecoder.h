/**
 * @file ApduDecoder.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Classifies exchanges and instantiates their interpreters
 * @version 0.1
 * @date 2026-03-07
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <memory>
#include <cstdint>

#include "ApduExchange.h"
#include "ApduCommand.h"
#include "CommandRegistry.h"

namespace simtrace
{
    /**
     * @brief APDU decoder
     *
     * Looks up the registry by (CLA, INS), resolves the direction of a T=0
     * body from the command case, constructs the interpreter and lets it
     * parse its fields. Decoding never fails: an unregistered command yields
     * an UnknownCommand and a parse failure a degraded interpreter.
     */
    class ApduDecoder
    {
    public:
        explicit ApduDecoder(const CommandRegistry& registry);

        /**
         * @brief Decode on the logical channel encoded in CLA
         */
        std::unique_ptr<ApduCommand> decode(const ApduExchange& exchange) const;

        /**
         * @brief Decode on an explicit logical channel
         */
        std::unique_ptr<ApduCommand> decode(const ApduExchange& exchange, uint8_t logicalChannel) const;

        /**
         * @brief Logical channel of a class byte
         *
         * First interindustry class (b7 = 0): b2-b1. Further interindustry
         * class (b7 = 1): 4 + b4-b1. The GSM class A0 is always channel 0.
         */
        static uint8_t logicalChannelFromCla(uint8_t cla);

    private:
        const CommandRegistry& registry;
    };

} // namespace simtrace
