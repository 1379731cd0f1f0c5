/**
 * @file EmulationLimits.h
 * @author ShadowCard developers
 * @brief Fixed sizes and capacities for the emulation engine
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace shadow
{
    namespace limits
    {
        // ========================================================================
        // MIFARE Classic 1K memory geometry
        // ========================================================================

        /**
         * @brief Size of one card block in bytes
         */
        constexpr size_t BLOCK_SIZE = 16;

        /**
         * @brief Number of blocks on a 1K card
         *
         * Calculation: 16 sectors * 4 blocks per sector = 64 blocks
         */
        constexpr size_t BLOCK_COUNT = 64;

        /**
         * @brief Blocks sharing one key pair
         */
        constexpr uint8_t BLOCKS_PER_SECTOR = 4;

        /**
         * @brief Size of a sector key (key A or key B)
         */
        constexpr size_t KEY_SIZE = 6;

        // ========================================================================
        // Balance layout
        // ========================================================================

        /**
         * @brief Block holding the stored value
         */
        constexpr uint8_t BALANCE_BLOCK_PRIMARY = 4;

        /**
         * @brief Backup copy of the value block
         */
        constexpr uint8_t BALANCE_BLOCK_MIRROR = 8;

        /**
         * @brief Maximum number of configured balance blocks
         */
        constexpr size_t BALANCE_BLOCK_MAX = 4;

        // ========================================================================
        // Session capacities
        // ========================================================================

        /**
         * @brief Transaction log capacity
         *
         * Appends beyond this count are dropped, oldest entries are kept.
         */
        constexpr size_t TRANSACTION_LOG_CAPACITY = 64;

        /**
         * @brief Credential store capacity
         *
         * Distinct keys beyond this count are dropped, never evicted.
         */
        constexpr size_t CREDENTIAL_STORE_CAPACITY = 16;

        // ========================================================================
        // Text buffers
        // ========================================================================

        /**
         * @brief Export line maximum
         *
         * Calculation: "S" + 3 digits + ":Key" + 1 + ":" + 12 hex + "\n" = 22 bytes,
         * rounded up
         */
        constexpr size_t EXPORT_LINE_MAX = 32;

        /**
         * @brief Export file maximum
         *
         * Calculation: header (~48 bytes) + 16 lines * 32 bytes = 560 bytes,
         * rounded up
         */
        constexpr size_t EXPORT_TEXT_MAX = 640;

        /**
         * @brief Largest card image text accepted from storage
         *
         * A full 1K dump is 64 lines of "Block NN: " + 16 * "XX " plus a
         * header of roughly 20 lines.
         */
        constexpr size_t CARD_IMAGE_TEXT_MAX = 8192;

        /**
         * @brief Maximum file path length
         */
        constexpr size_t PATH_MAX_LENGTH = 128;

        /**
         * @brief UID text maximum (7-byte UID with separators)
         */
        constexpr size_t UID_TEXT_MAX = 32;

        /**
         * @brief Narrative log line maximum
         */
        constexpr size_t NARRATIVE_LINE_MAX = 96;

    } // namespace limits

} // namespace shadow
