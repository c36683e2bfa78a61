/**
 * @file CommandSets.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Command sets of the supported card specifications
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>

#include "CommandRegistry.h"
#include "Error/Error.h"

namespace simtrace
{
    /**
     * @brief 3GPP TS 51.011 (SIM), CLA A0
     */
    etl::expected<void, error::Error> registerSimCommands(CommandRegistry& registry);

    /**
     * @brief ETSI TS 102 221 (UICC), CLA 0X/4X-7X and 8X/CX-FX
     */
    etl::expected<void, error::Error> registerUiccCommands(CommandRegistry& registry);

    /**
     * @brief 3GPP TS 31.102 (USIM); overrides the UICC AUTHENTICATE
     */
    etl::expected<void, error::Error> registerUsimCommands(CommandRegistry& registry);

    /**
     * @brief Merge SIM, UICC and USIM sets in this order
     *
     * @param registry Destination, usually empty
     */
    etl::expected<void, error::Error> buildDefaultRegistry(CommandRegistry& registry);

} // namespace simtrace
