/**
 * @file EmulationError.h
 * @author ShadowCard developers
 * @brief Defines operator-level emulation error codes
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    /**
     * @brief Errors returned to the operator surface when a command
     *        does not fit the current session state
     * 
     */
    enum class EmulationError : uint8_t {
        Ok = 0,
        AlreadyEmulating,
        NotEmulating,
        NoCardLoaded,
        AccessDenied
    };

} // namespace error
