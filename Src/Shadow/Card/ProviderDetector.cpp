/**
 * @file ProviderDetector.cpp
 * @author ShadowCard developers
 * @brief Provider detection implementation
 * @version 0.1
 * @date 2026-03-03
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Card/ProviderDetector.h"

namespace shadow
{
    namespace
    {
        constexpr uint8_t CSC_SIGNATURE_BLOCK = 2;
        constexpr uint8_t UBEST_SIGNATURE_BLOCK = 1;
    }

    CardProvider ProviderDetector::detect(const VirtualCard& card)
    {
        if (card.isBlockLoaded(CSC_SIGNATURE_BLOCK))
        {
            auto block = card.readBlock(CSC_SIGNATURE_BLOCK);
            if (block.has_value() && block.value()[0] == 0x01 && block.value()[1] == 0x01)
            {
                return CardProvider::CscServiceWorks;
            }
        }

        if (card.isBlockLoaded(UBEST_SIGNATURE_BLOCK))
        {
            auto block = card.readBlock(UBEST_SIGNATURE_BLOCK);
            if (block.has_value())
            {
                // Non-printable bytes become '.' so the signature can be found anywhere in the block
                char ascii[limits::BLOCK_SIZE];
                for (size_t i = 0; i < limits::BLOCK_SIZE; ++i)
                {
                    uint8_t b = block.value()[i];
                    ascii[i] = (b >= 32 && b <= 126) ? static_cast<char>(b) : '.';
                }

                etl::string_view text(ascii, limits::BLOCK_SIZE);
                if (text.find("UBESTWASH") != etl::string_view::npos)
                {
                    return CardProvider::UBestWash;
                }
            }
        }

        return CardProvider::Unknown;
    }

    etl::string_view ProviderDetector::name(CardProvider provider)
    {
        switch (provider)
        {
            case CardProvider::CscServiceWorks:
                return "CSC ServiceWorks";
            case CardProvider::UBestWash:
                return "U-Best Wash";
            default:
                return "Unknown";
        }
    }

} // namespace shadow
