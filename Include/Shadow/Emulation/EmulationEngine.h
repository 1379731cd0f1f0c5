/**
 * @file EmulationEngine.h
 * @author ShadowCard developers
 * @brief Protocol event handlers of the emulated card
 * @version 0.1
 * @date 2026-03-05
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include "IEmulationHandler.h"
#include "EmulationSession.h"
#include "BalanceDecoder.h"

namespace shadow
{
    /**
     * @brief Emulation engine
     * 
     * - Authentication is always granted, whatever key the reader offers, so
     *   the reader goes on to disclose its reads, writes and further keys.
     *   Every offered key goes to the session's credential store.
     * - Reads are always granted and only observed.
     * - Writes are logged with the proposed data. A write to a balance block
     *   updates the session's current balance whether or not it is committed.
     *   The write is granted only in Apply mode.
     * 
     * Capacity exhaustion of the log or the store never changes a decision.
     */
    class EmulationEngine : public IEmulationHandler
    {
    public:
        /**
         * @brief Construct an engine
         * 
         * @param session Session state to update
         * @param balanceDecoder Balance block layout
         */
        EmulationEngine(EmulationSession& session, const BalanceDecoder& balanceDecoder);

        bool onAuthenticate(uint8_t blockIndex, KeyKind keyKind, const SectorKey& keyBytes) override;
        bool onRead(uint8_t blockIndex, const Block& currentBlockData) override;
        bool onWrite(uint8_t blockIndex, const Block& proposedBlockData) override;

    private:
        static void appendEntry(TransactionLog& log, uint8_t blockIndex, TransactionOperation operation, const Block& payload);

        EmulationSession& session;
        BalanceDecoder decoder;
    };

} // namespace shadow
