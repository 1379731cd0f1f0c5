/**
 * @file VirtualCard.h
 * @author ShadowCard developers
 * @brief Block image presented to the reader during emulation
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/array.h>
#include <etl/expected.h>
#include <etl/string.h>
#include <etl/string_view.h>

#include "CardTypes.h"
#include "Error/Error.h"
#include "Shadow/EmulationLimits.h"

namespace shadow
{
    /**
     * @brief Emulated MIFARE Classic 1K memory
     * 
     * Holds 64 blocks of 16 bytes. Blocks are opaque payload here; only the
     * balance decoder and provider detector interpret a few of them. The
     * image changes only through writeBlock(), which the reader-emulation
     * layer calls for writes the engine granted.
     */
    class VirtualCard
    {
    public:
        /**
         * @brief Construct an empty card (all blocks zero, none loaded)
         */
        VirtualCard();

        /**
         * @brief Read a block
         * 
         * @param blockIndex Block number (0..63)
         * @return etl::expected<Block, error::Error> Block contents or CardError::BlockOutOfRange
         */
        etl::expected<Block, error::Error> readBlock(uint8_t blockIndex) const;

        /**
         * @brief Overwrite a block and mark it loaded
         * 
         * @param blockIndex Block number (0..63)
         * @param data New contents
         * @return etl::expected<void, error::Error> Success or CardError::BlockOutOfRange
         */
        etl::expected<void, error::Error> writeBlock(uint8_t blockIndex, const Block& data);

        /**
         * @brief Check whether a block was present in the loaded image
         * 
         * @param blockIndex Block number
         * @return true Block has contents
         * @return false Block is out of range or was never set
         */
        bool isBlockLoaded(uint8_t blockIndex) const;

        /**
         * @brief Number of loaded blocks
         */
        size_t loadedBlockCount() const;

        /**
         * @brief Check whether any block has been loaded
         */
        bool isEmpty() const;

        void setUid(etl::string_view uidText);
        const etl::string<limits::UID_TEXT_MAX>& getUid() const;

        /**
         * @brief Clear all blocks and the UID
         */
        void clear();

    private:
        etl::array<Block, limits::BLOCK_COUNT> blocks;
        etl::array<bool, limits::BLOCK_COUNT> loaded;
        etl::string<limits::UID_TEXT_MAX> uid;
    };

} // namespace shadow
