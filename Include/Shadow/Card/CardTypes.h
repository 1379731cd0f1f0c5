/**
 * @file CardTypes.h
 * @author ShadowCard developers
 * @brief Basic MIFARE Classic value types shared by the card and the engine
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <cstdint>
#include <etl/array.h>

#include "Shadow/EmulationLimits.h"

namespace shadow
{
    /**
     * @brief Sector key role
     * 
     * Key A usually grants read access, key B is the write key.
     */
    enum class KeyKind : uint8_t
    {
        A,
        B
    };

    using Block = etl::array<uint8_t, limits::BLOCK_SIZE>;
    using SectorKey = etl::array<uint8_t, limits::KEY_SIZE>;

    /**
     * @brief Single letter name of a key kind ("A" or "B")
     */
    inline const char* keyKindName(KeyKind kind)
    {
        return kind == KeyKind::A ? "A" : "B";
    }

    /**
     * @brief Sector that contains a block
     */
    inline uint8_t sectorOf(uint8_t blockIndex)
    {
        return static_cast<uint8_t>(blockIndex / limits::BLOCKS_PER_SECTOR);
    }

} // namespace shadow
