/**
 * @file AuthenticateCommand.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief AUTHENTICATE (UICC, USIM) and RUN GSM ALGORITHM (SIM)
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "../ApduCommand.h"

namespace simtrace
{
    /**
     * @brief Generic AUTHENTICATE (88) of ETSI TS 102 221
     *
     * Renders the challenge and the response without interpreting the
     * security context. No cryptographic validation is performed.
     */
    class AuthenticateCommand : public ApduCommand
    {
    public:
        AuthenticateCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        void processOnChannel(RuntimeState& state) override;

        void describeKeyReference();
    };

    /**
     * @brief AUTHENTICATE of 3GPP TS 31.102 §7.1
     *
     * P2 b3-b1 select the context: 000 GSM (RAND / SRES, Kc) and 001 3G
     * (RAND, AUTN / RES, CK, IK, Kc or AUTS on synchronisation failure).
     */
    class UsimAuthenticateCommand : public AuthenticateCommand
    {
    public:
        UsimAuthenticateCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;

    private:
        void describe3gResponse();

        uint8_t context;
    };

    /**
     * @brief RUN GSM ALGORITHM of 3GPP TS 51.011 §9.2.16
     *
     * Command data: RAND (16). Response: SRES (4) and Kc (8).
     */
    class RunGsmAlgorithmCommand : public ApduCommand
    {
    public:
        RunGsmAlgorithmCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan);

    protected:
        etl::expected<void, error::Error> parseFields() override;

        void processOnChannel(RuntimeState& state) override;
    };

} // namespace simtrace
