/**
 * @file IEmulationHandler.h
 * @author ShadowCard developers
 * @brief Interface called by the reader-emulation layer for each protocol event
 * @version 0.1
 * @date 2026-03-05
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <cstdint>

#include "Shadow/Card/CardTypes.h"

namespace shadow
{
    /**
     * @brief Protocol event handler
     * 
     * The reader-emulation layer holds a reference to an implementation and
     * calls it synchronously, one event at a time, in the order the reader
     * issues them. The return value goes straight back into the live RF
     * exchange, so implementations must return quickly and must not block
     * on I/O.
     */
    class IEmulationHandler
    {
    public:
        virtual ~IEmulationHandler() = default;

        /**
         * @brief Reader authenticates to the sector containing a block
         * 
         * @param blockIndex Block named in the AUTH command
         * @param keyKind Key A or key B
         * @param keyBytes Key the reader used
         * @return true Grant
         * @return false Deny
         */
        virtual bool onAuthenticate(uint8_t blockIndex, KeyKind keyKind, const SectorKey& keyBytes) = 0;

        /**
         * @brief Reader reads a block
         * 
         * @param blockIndex Block number
         * @param currentBlockData Contents about to be returned to the reader
         * @return true Grant
         * @return false Deny
         */
        virtual bool onRead(uint8_t blockIndex, const Block& currentBlockData) = 0;

        /**
         * @brief Reader writes a block
         * 
         * @param blockIndex Block number
         * @param proposedBlockData Data the reader sent
         * @return true Grant; the caller commits the data to the card
         * @return false Deny; the card is left unchanged
         */
        virtual bool onWrite(uint8_t blockIndex, const Block& proposedBlockData) = 0;
    };

} // namespace shadow
