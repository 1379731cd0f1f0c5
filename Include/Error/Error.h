/**
 * @file Error.h
 * @author ShadowCard developers
 * @brief
 * @version 0.2
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "CardError.h"
#include "StorageError.h"
#include "EmulationError.h"

#include <type_traits>

#include <etl/variant.h>
#include <etl/string_view.h>
#include <etl/string.h>

namespace error {

    enum class ErrorLayer : uint8_t {
        Card,
        Storage,
        Emulation
    };


    class Error {
        public:

            using ErrorVariant = etl::variant<
                CardError,
                StorageError,
                EmulationError
            >;

            Error(ErrorLayer layer, ErrorVariant errorCode)
                : layer(layer), errorCode(errorCode) {}

            static Error fromCard(CardError err) {
                return Error{ErrorLayer::Card, err};
            }

            static Error fromStorage(StorageError err) {
                return Error{ErrorLayer::Storage, err};
            }

            static Error fromEmulation(EmulationError err) {
                return Error{ErrorLayer::Emulation, err};
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
                    case ErrorLayer::Card:
                        return "Card";
                    case ErrorLayer::Storage:
                        return "Storage";
                    case ErrorLayer::Emulation:
                        return "Emulation";
                    default:
                        return "Unknown";
                }
            }

            etl::string_view nameOf(CardError err) const {
                switch (err) {
                    case CardError::Ok:
                        return "Ok";
                    case CardError::BlockOutOfRange:
                        return "BlockOutOfRange";
                    case CardError::EmptyImage:
                        return "EmptyImage";
                    default:
                        return "UndefinedCardError";
                }
            }

            etl::string_view nameOf(StorageError err) const {
                switch (err) {
                    case StorageError::Ok:
                        return "Ok";
                    case StorageError::OpenFailed:
                        return "OpenFailed";
                    case StorageError::WriteFailed:
                        return "WriteFailed";
                    case StorageError::ReadFailed:
                        return "ReadFailed";
                    case StorageError::FileTooLarge:
                        return "FileTooLarge";
                    default:
                        return "UndefinedStorageError";
                }
            }

            etl::string_view nameOf(EmulationError err) const {
                switch (err) {
                    case EmulationError::Ok:
                        return "Ok";
                    case EmulationError::AlreadyEmulating:
                        return "AlreadyEmulating";
                    case EmulationError::NotEmulating:
                        return "NotEmulating";
                    case EmulationError::NoCardLoaded:
                        return "NoCardLoaded";
                    case EmulationError::AccessDenied:
                        return "AccessDenied";
                    default:
                        return "UndefinedEmulationError";
                }
            }

            etl::string<160> toString() const {
                etl::string<160> result;
                auto layer_name = layerName(layer);
                result.assign(layer_name.begin(), layer_name.end());
                result.append(" Error: ");

                auto error_name = etl::visit([this](auto&& arg) -> etl::string_view {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, CardError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, StorageError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, EmulationError>) {
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
