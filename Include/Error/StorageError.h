/**
 * @file StorageError.h
 * @author ShadowCard developers
 * @brief Defines storage collaborator error codes
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class StorageError : uint8_t {
        Ok = 0,
        OpenFailed,
        WriteFailed,
        ReadFailed,
        FileTooLarge
    };

} // namespace error
