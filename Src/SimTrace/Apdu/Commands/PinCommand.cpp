/**
 * @file PinCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief PIN / CHV management implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/PinCommand.h"
#include "SimTrace/Apdu/CommandRegistry.h"
#include "SimTrace/Apdu/StatusWord.h"

#include <cstdio>

using namespace simtrace;

namespace
{
    constexpr uint8_t INS_VERIFY = 0x20;
    constexpr uint8_t INS_CHANGE = 0x24;
    constexpr uint8_t INS_DISABLE = 0x26;
    constexpr uint8_t INS_ENABLE = 0x28;
    constexpr uint8_t INS_UNBLOCK = 0x2C;
}

PinCommand::PinCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
    , keyReference(0)
{
}

bool PinCommand::decodePinBlock(const uint8_t* block, etl::istring& out)
{
    out.clear();
    for (size_t i = 0; i < PIN_BLOCK_SIZE; ++i)
    {
        if (block[i] == 0xFF)
        {
            break;
        }
        if (block[i] < 0x20 || block[i] > 0x7E)
        {
            out.clear();
            return false;
        }
        out.push_back(static_cast<char>(block[i]));
    }
    return true;
}

etl::expected<void, error::Error> PinCommand::parseFields()
{
    keyReference = exchange.p2;

    const etl::ivector<uint8_t>& data = exchange.commandData;
    size_t expected = PIN_BLOCK_SIZE;
    bool mayBeEmpty = false;

    switch (exchange.ins)
    {
        case INS_VERIFY:
            mayBeEmpty = true;
            break;
        case INS_CHANGE:
            expected = 2 * PIN_BLOCK_SIZE;
            break;
        case INS_UNBLOCK:
            expected = 2 * PIN_BLOCK_SIZE;
            mayBeEmpty = true;
            break;
        default:
            break;
    }

    if (data.empty() && mayBeEmpty)
    {
        return {};
    }

    if (data.size() != expected)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
    }

    if (!decodePinBlock(data.data(), firstPin))
    {
        firstPin.assign("<binary>");
    }
    if (expected == 2 * PIN_BLOCK_SIZE && !decodePinBlock(data.data() + PIN_BLOCK_SIZE, secondPin))
    {
        secondPin.assign("<binary>");
    }

    return {};
}

void PinCommand::describeKey(etl::istring& out) const
{
    char text[16];

    if (exchange.cla == 0xA0)
    {
        // UNBLOCK CHV uses 00 for CHV1
        const unsigned chv = keyReference == 0x00 ? 1 : keyReference;
        std::snprintf(text, sizeof(text), "CHV%u", chv);
    }
    else if (keyReference >= 0x01 && keyReference <= 0x08)
    {
        std::snprintf(text, sizeof(text), "PIN%u", static_cast<unsigned>(keyReference));
    }
    else if (keyReference >= 0x0A && keyReference <= 0x0E)
    {
        std::snprintf(text, sizeof(text), "ADM%u", static_cast<unsigned>(keyReference - 0x09));
    }
    else if (keyReference == 0x11)
    {
        std::snprintf(text, sizeof(text), "UPIN");
    }
    else if (keyReference >= 0x81 && keyReference <= 0x88)
    {
        std::snprintf(text, sizeof(text), "PIN2.%u", static_cast<unsigned>(keyReference - 0x80));
    }
    else if (keyReference >= 0x8A && keyReference <= 0x8E)
    {
        std::snprintf(text, sizeof(text), "ADM%u", static_cast<unsigned>(keyReference - 0x84));
    }
    else
    {
        std::snprintf(text, sizeof(text), "KEY%02X", static_cast<unsigned>(keyReference));
    }

    out.assign(text);
}

void PinCommand::processOnChannel(RuntimeState& state)
{
    etl::string<16> key;
    describeKey(key);
    setColId("%s", key.c_str());

    const bool query = exchange.commandData.empty();

    if (!query)
    {
        switch (exchange.ins)
        {
            case INS_CHANGE:
                appendProcessed("old=%s new=%s", firstPin.c_str(), secondPin.c_str());
                break;
            case INS_UNBLOCK:
                appendProcessed("unblock=%s new=%s", firstPin.c_str(), secondPin.c_str());
                break;
            default:
                appendProcessed("pin=%s", firstPin.c_str());
                break;
        }
    }

    if (!exchange.hasResponse)
    {
        return;
    }

    const int retries = retriesFromStatusWord(exchange.sw1, exchange.sw2);

    if (exchange.isSuccess())
    {
        state.markPinVerified(lchan, keyReference);
        switch (exchange.ins)
        {
            case INS_DISABLE:
                appendProcessed("%s disabled", key.c_str());
                break;
            case INS_ENABLE:
                appendProcessed("%s enabled", key.c_str());
                break;
            case INS_UNBLOCK:
                appendProcessed(query ? "%s not blocked" : "%s unblocked", key.c_str());
                break;
            case INS_CHANGE:
                appendProcessed("%s changed", key.c_str());
                break;
            default:
                appendProcessed(query ? "%s already verified" : "%s verified", key.c_str());
                break;
        }
    }
    else if (retries >= 0)
    {
        if (!query)
        {
            state.clearPinVerified(lchan, keyReference);
        }
        appendProcessed("%s not verified, %d retries left", key.c_str(), retries);
    }
}
