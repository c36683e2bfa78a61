/**
 * @file GsmtapUdpSource.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Live GSMTAP-SIM capture on a UDP port
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string.h>

#include "IApduSource.h"

namespace simtrace
{
    /**
     * @brief Receives GSMTAP datagrams (e.g. from osmo-simtrace2 or osmo-qcdiag)
     *
     * Datagrams that are no SIM traffic or cannot be decoded are skipped with
     * a warning. Socket errors are fatal.
     */
    class GsmtapUdpSource : public IApduSource
    {
    public:
        GsmtapUdpSource(const etl::string<64>& bindIp, uint16_t bindPort);

        ~GsmtapUdpSource() override;

        etl::string_view name() const override
        {
            return "gsmtap-udp";
        }

        etl::expected<void, error::Error> open() override;

        void close() override;

        etl::expected<SourceEvent, error::Error> readNext() override;

    private:
        etl::string<64> bindIp;
        uint16_t bindPort;
        int socketFd;
    };

} // namespace simtrace
