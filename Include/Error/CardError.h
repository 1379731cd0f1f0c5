/**
 * @file CardError.h
 * @author ShadowCard developers
 * @brief Defines virtual card and card image error codes
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
     * @brief Virtual card and card image error codes
     * 
     */
    enum class CardError : uint8_t {
        Ok = 0,
        BlockOutOfRange,
        EmptyImage
    };

} // namespace error
