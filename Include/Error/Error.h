/**
 * @file Error.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "SourceError.h"
#include "DecodeError.h"
#include "CardModelError.h"
#include "RegistryError.h"
#include "ConfigError.h"

#include <etl/variant.h>
#include <etl/string_view.h>
#include <etl/string.h>

#include <type_traits>

namespace error {

    enum class ErrorLayer : uint8_t {
        Source,
        Decode,
        CardModel,
        Registry,
        Config
    };


    class Error {
        public:

            using ErrorVariant = etl::variant<
                SourceError,
                DecodeError,
                CardModelError,
                RegistryError,
                ConfigError
            >;

            Error(ErrorLayer layer, ErrorVariant errorCode)
                : layer(layer), errorCode(errorCode) {}

            static Error fromSource(SourceError err) {
                return Error{ErrorLayer::Source, err};
            }

            static Error fromDecode(DecodeError err) {
                return Error{ErrorLayer::Decode, err};
            }

            static Error fromCardModel(CardModelError err) {
                return Error{ErrorLayer::CardModel, err};
            }

            static Error fromRegistry(RegistryError err) {
                return Error{ErrorLayer::Registry, err};
            }

            static Error fromConfig(ConfigError err) {
                return Error{ErrorLayer::Config, err};
            }

            template<typename T>
            bool is() const {
                return etl::holds_alternative<T>(errorCode);
            }

            template<typename T>
            T get() const {
                return etl::get<T>(errorCode);
            }

            ErrorLayer getLayer() const {
                return layer;
            }

            etl::string_view layerName(ErrorLayer layer) const {
                switch (layer) {
                    case ErrorLayer::Source:
                        return "Source";
                    case ErrorLayer::Decode:
                        return "Decode";
                    case ErrorLayer::CardModel:
                        return "CardModel";
                    case ErrorLayer::Registry:
                        return "Registry";
                    case ErrorLayer::Config:
                        return "Config";
                    default:
                        return "Unknown";
                }
            }

            etl::string_view nameOf(SourceError err) const {
                switch (err) {
                    case SourceError::Ok:
                        return "Ok";
                    case SourceError::NotOpen:
                        return "NotOpen";
                    case SourceError::OpenFailed:
                        return "OpenFailed";
                    case SourceError::SocketError:
                        return "SocketError";
                    case SourceError::BindFailed:
                        return "BindFailed";
                    case SourceError::ReadFailed:
                        return "ReadFailed";
                    case SourceError::Truncated:
                        return "Truncated";
                    case SourceError::UnsupportedFormat:
                        return "UnsupportedFormat";
                    case SourceError::MalformedPacket:
                        return "MalformedPacket";
                    default:
                        return "UndefinedSourceError";
                }
            }

            etl::string_view nameOf(DecodeError err) const {
                switch (err) {
                    case DecodeError::Ok:
                        return "Ok";
                    case DecodeError::TooShort:
                        return "TooShort";
                    case DecodeError::WrongLength:
                        return "WrongLength";
                    case DecodeError::InvalidHex:
                        return "InvalidHex";
                    case DecodeError::MissingData:
                        return "MissingData";
                    case DecodeError::InvalidParameter:
                        return "InvalidParameter";
                    case DecodeError::UnsupportedEncoding:
                        return "UnsupportedEncoding";
                    default:
                        return "UndefinedDecodeError";
                }
            }

            etl::string_view nameOf(CardModelError err) const {
                switch (err) {
                    case CardModelError::Ok:
                        return "Ok";
                    case CardModelError::FileNotFound:
                        return "FileNotFound";
                    case CardModelError::NotADirectory:
                        return "NotADirectory";
                    case CardModelError::NoParent:
                        return "NoParent";
                    case CardModelError::ApplicationNotFound:
                        return "ApplicationNotFound";
                    case CardModelError::NoApplicationSelected:
                        return "NoApplicationSelected";
                    case CardModelError::InvalidChannel:
                        return "InvalidChannel";
                    case CardModelError::ChannelNotOpen:
                        return "ChannelNotOpen";
                    case CardModelError::InvalidPath:
                        return "InvalidPath";
                    case CardModelError::DuplicateFile:
                        return "DuplicateFile";
                    case CardModelError::CapacityExceeded:
                        return "CapacityExceeded";
                    default:
                        return "UndefinedCardModelError";
                }
            }

            etl::string_view nameOf(RegistryError err) const {
                switch (err) {
                    case RegistryError::Ok:
                        return "Ok";
                    case RegistryError::Full:
                        return "Full";
                    case RegistryError::InvalidDescriptor:
                        return "InvalidDescriptor";
                    default:
                        return "UndefinedRegistryError";
                }
            }

            etl::string_view nameOf(ConfigError err) const {
                switch (err) {
                    case ConfigError::Ok:
                        return "Ok";
                    case ConfigError::HelpRequested:
                        return "HelpRequested";
                    case ConfigError::UnknownOption:
                        return "UnknownOption";
                    case ConfigError::MissingArgument:
                        return "MissingArgument";
                    case ConfigError::InvalidValue:
                        return "InvalidValue";
                    case ConfigError::MissingSource:
                        return "MissingSource";
                    case ConfigError::UnknownSource:
                        return "UnknownSource";
                    default:
                        return "UndefinedConfigError";
                }
            }

            etl::string<160> toString() const {
                etl::string<160> result;
                auto layer_name = layerName(layer);
                result.assign(layer_name.begin(), layer_name.end());
                result.append(" Error: ");

                auto error_name = etl::visit([this](auto&& arg) -> etl::string_view {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SourceError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, DecodeError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, CardModelError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, RegistryError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, ConfigError>) {
                            return nameOf(arg);
                        } else {
                            return "Unknown Error Type";
                        }
                    }, errorCode);

                result.append(error_name.begin(), error_name.end());
                return result;
            }

        private:
            ErrorLayer   layer;
            ErrorVariant errorCode;

    };

} // namespace error
