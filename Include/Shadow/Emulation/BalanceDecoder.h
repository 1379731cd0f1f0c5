/**
 * @file BalanceDecoder.h
 * @author ShadowCard developers
 * @brief Interprets the designated value blocks as a monetary balance
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <cstdint>
#include <etl/optional.h>
#include <etl/string.h>
#include <etl/vector.h>

#include "Shadow/Card/CardTypes.h"
#include "Shadow/EmulationLimits.h"

namespace shadow
{
    /**
     * @brief Balance block layout
     * 
     * Bytes 0-1: value in cents, little endian
     * Bytes 2-3: transaction counter, little endian
     * Bytes 4-5: bitwise inverse of the value
     * Bytes 6-7: bitwise inverse of the counter
     * 
     * The reader writes the whole block; the engine only needs the value.
     */
    class BalanceDecoder
    {
    public:
        using BlockList = etl::vector<uint8_t, limits::BALANCE_BLOCK_MAX>;

        /**
         * @brief Construct with the default balance blocks (4 and 8)
         */
        BalanceDecoder();

        /**
         * @brief Construct with explicit balance blocks
         * 
         * @param balanceBlocks Block indices; the first one is the primary block.
         *        An empty list selects the defaults.
         */
        explicit BalanceDecoder(const BlockList& balanceBlocks);

        bool isBalanceBlock(uint8_t blockIndex) const;

        /**
         * @brief Block read at session start for the original balance
         */
        uint8_t primaryBlock() const;

        const BlockList& balanceBlocks() const;

        /**
         * @brief Raw value from bytes 0-1, no integrity check
         */
        static uint16_t decodeValue(const Block& block);

        /**
         * @brief Value from bytes 0-1, checked against its inverse at bytes 4-5
         * 
         * @return etl::optional<uint16_t> Value, or nullopt if the check fails
         */
        static etl::optional<uint16_t> decodeValidated(const Block& block);

        /**
         * @brief Counter from bytes 2-3, checked against its inverse at bytes 6-7
         */
        static etl::optional<uint16_t> decodeCounter(const Block& block);

        /**
         * @brief Format cents as dollars, e.g. 1250 -> "$12.50"
         */
        static etl::string<16> formatCents(uint16_t cents);

    private:
        BlockList blocks;
    };

} // namespace shadow
