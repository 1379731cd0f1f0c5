/**
 * @file CardEmulator.h
 * @author ShadowCard developers
 * @brief Binds an emulation handler to a virtual card
 * @version 0.1
 * @date 2026-03-06
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <mutex>
#include <etl/expected.h>

#include "EmulationSession.h"
#include "IEmulationHandler.h"
#include "Shadow/Card/VirtualCard.h"
#include "Error/Error.h"

namespace shadow
{
    /**
     * @brief Reader-facing side of the emulated card
     * 
     * Plays the role of the listener in the radio stack: it turns decoded
     * reader commands into handler calls and applies the handler's decision
     * to the virtual card. A write reaches the card only when the handler
     * grants it.
     * 
     * Reader commands are refused while the session is not emulating; the
     * handler is not called. The card itself is guarded by a lock of its
     * own, taken before the session lock, so an operator load() never
     * overlaps a commit from the reader context.
     */
    class CardEmulator
    {
    public:
        CardEmulator(VirtualCard& card, IEmulationHandler& handler, const EmulationSession& session);

        CardEmulator(const CardEmulator&) = delete;
        CardEmulator& operator=(const CardEmulator&) = delete;

        /**
         * @brief Replace the card contents
         * 
         * @return etl::expected<void, error::Error> AlreadyEmulating while a
         *         session is running
         */
        etl::expected<void, error::Error> load(const VirtualCard& image);

        /**
         * @brief Lock held for the whole of each reader command
         * 
         * The operator holds it while stopping a session so no command is
         * half-handled across the stop.
         */
        std::mutex& mutex();

        /**
         * @brief AUTH command
         * 
         * @return true Authentication accepted
         * @return false Block out of range or not emulating
         */
        bool authenticate(uint8_t blockIndex, KeyKind keyKind, const SectorKey& keyBytes);

        /**
         * @brief READ command
         * 
         * @return etl::expected<Block, error::Error> Block contents, or an error
         *         when not emulating, the block does not exist or the handler
         *         denied the read
         */
        etl::expected<Block, error::Error> read(uint8_t blockIndex);

        /**
         * @brief WRITE command
         * 
         * @return true Write acknowledged and committed
         * @return false Write refused (NAK to the reader), card unchanged
         */
        bool write(uint8_t blockIndex, const Block& data);

    private:
        VirtualCard& card;
        IEmulationHandler& handler;
        const EmulationSession& session;
        std::mutex cardLock;
    };

} // namespace shadow
