/**
 * @file ProviderDetector.h
 * @author ShadowCard developers
 * @brief Identifies the laundry card operator from signature blocks
 * @version 0.1
 * @date 2026-03-03
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <cstdint>
#include <etl/string_view.h>

#include "VirtualCard.h"

namespace shadow
{
    enum class CardProvider : uint8_t
    {
        Unknown,
        CscServiceWorks,
        UBestWash
    };

    class ProviderDetector
    {
    public:
        /**
         * @brief Detect the card provider
         * 
         * CSC ServiceWorks cards carry 01 01 at the start of block 2.
         * U-Best Wash cards carry the ASCII text "UBESTWASH" in block 1.
         * 
         * @param card Loaded card image
         * @return CardProvider Detected provider
         */
        static CardProvider detect(const VirtualCard& card);

        static etl::string_view name(CardProvider provider);
    };

} // namespace shadow
