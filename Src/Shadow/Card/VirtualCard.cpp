/**
 * @file VirtualCard.cpp
 * @author ShadowCard developers
 * @brief Virtual card implementation
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Card/VirtualCard.h"

namespace shadow
{
    VirtualCard::VirtualCard()
    {
        clear();
    }

    etl::expected<Block, error::Error> VirtualCard::readBlock(uint8_t blockIndex) const
    {
        if (blockIndex >= limits::BLOCK_COUNT)
        {
            return etl::unexpected(error::Error::fromCard(error::CardError::BlockOutOfRange));
        }

        return blocks[blockIndex];
    }

    etl::expected<void, error::Error> VirtualCard::writeBlock(uint8_t blockIndex, const Block& data)
    {
        if (blockIndex >= limits::BLOCK_COUNT)
        {
            return etl::unexpected(error::Error::fromCard(error::CardError::BlockOutOfRange));
        }

        blocks[blockIndex] = data;
        loaded[blockIndex] = true;
        return {};
    }

    bool VirtualCard::isBlockLoaded(uint8_t blockIndex) const
    {
        return blockIndex < limits::BLOCK_COUNT && loaded[blockIndex];
    }

    size_t VirtualCard::loadedBlockCount() const
    {
        size_t count = 0;
        for (bool isLoaded : loaded)
        {
            if (isLoaded)
            {
                ++count;
            }
        }
        return count;
    }

    bool VirtualCard::isEmpty() const
    {
        return loadedBlockCount() == 0;
    }

    void VirtualCard::setUid(etl::string_view uidText)
    {
        uid.assign(uidText.begin(), uidText.end());
    }

    const etl::string<limits::UID_TEXT_MAX>& VirtualCard::getUid() const
    {
        return uid;
    }

    void VirtualCard::clear()
    {
        for (auto& block : blocks)
        {
            block.fill(0x00);
        }
        loaded.fill(false);
        uid.clear();
    }

} // namespace shadow
