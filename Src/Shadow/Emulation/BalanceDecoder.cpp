/**
 * @file BalanceDecoder.cpp
 * @author ShadowCard developers
 * @brief Balance decoder implementation
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Emulation/BalanceDecoder.h"

#include <cstdio>

namespace shadow
{
    namespace
    {
        uint16_t readLe16(const Block& block, size_t offset)
        {
            return static_cast<uint16_t>(block[offset] | (block[offset + 1] << 8));
        }

        etl::optional<uint16_t> readChecked(const Block& block, size_t valueOffset, size_t inverseOffset)
        {
            uint16_t value = readLe16(block, valueOffset);
            uint16_t inverse = readLe16(block, inverseOffset);
            if ((value ^ inverse) != 0xFFFF)
            {
                return etl::nullopt;
            }
            return value;
        }
    }

    BalanceDecoder::BalanceDecoder()
    {
        blocks.push_back(limits::BALANCE_BLOCK_PRIMARY);
        blocks.push_back(limits::BALANCE_BLOCK_MIRROR);
    }

    BalanceDecoder::BalanceDecoder(const BlockList& balanceBlocks)
        : blocks(balanceBlocks)
    {
        if (blocks.empty())
        {
            blocks.push_back(limits::BALANCE_BLOCK_PRIMARY);
            blocks.push_back(limits::BALANCE_BLOCK_MIRROR);
        }
    }

    bool BalanceDecoder::isBalanceBlock(uint8_t blockIndex) const
    {
        for (uint8_t block : blocks)
        {
            if (block == blockIndex)
            {
                return true;
            }
        }
        return false;
    }

    uint8_t BalanceDecoder::primaryBlock() const
    {
        return blocks.front();
    }

    const BalanceDecoder::BlockList& BalanceDecoder::balanceBlocks() const
    {
        return blocks;
    }

    uint16_t BalanceDecoder::decodeValue(const Block& block)
    {
        return readLe16(block, 0);
    }

    etl::optional<uint16_t> BalanceDecoder::decodeValidated(const Block& block)
    {
        return readChecked(block, 0, 4);
    }

    etl::optional<uint16_t> BalanceDecoder::decodeCounter(const Block& block)
    {
        return readChecked(block, 2, 6);
    }

    etl::string<16> BalanceDecoder::formatCents(uint16_t cents)
    {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "$%u.%02u",
                      static_cast<unsigned>(cents / 100U),
                      static_cast<unsigned>(cents % 100U));
        return etl::string<16>(buffer);
    }

} // namespace shadow
