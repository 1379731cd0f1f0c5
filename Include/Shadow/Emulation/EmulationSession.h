/**
 * @file EmulationSession.h
 * @author ShadowCard developers
 * @brief State shared between the reader context and the operator/display context
 * @version 0.1
 * @date 2026-03-05
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <etl/optional.h>

#include "CredentialStore.h"
#include "TransactionLog.h"
#include "WritePolicyGate.h"
#include "INarrativeLog.h"

namespace shadow
{
    /**
     * @brief Protocol event counters
     */
    struct SessionCounters
    {
        uint32_t authenticateCount = 0;
        uint32_t readCount = 0;
        uint32_t writeCount = 0;
    };

    /**
     * @brief Copy of the session state for presentation
     */
    struct SessionSnapshot
    {
        bool emulating;
        WritePolicyMode mode;
        SessionCounters counters;
        uint16_t originalBalance;
        uint16_t currentBalance;
        size_t transactionCount;
        size_t credentialCount;
    };

    /**
     * @brief Emulation session state
     * 
     * One instance per emulation; nothing here is global. All members are
     * guarded by one mutex:
     * 
     * - The engine locks it for the duration of one handler.
     * - The display context only uses the try* accessors, which skip when
     *   the lock is busy instead of waiting, so the reader exchange is
     *   never stalled by drawing.
     * - Operator commands lock it only around flag updates and copies.
     * 
     * The write-policy mode lives outside the lock (see WritePolicyGate).
     * 
     * The accessors without a lock (transactionLog(), credentials(), ...)
     * require the caller to hold mutex().
     */
    class EmulationSession
    {
    public:
        /**
         * @brief Construct a new session
         * 
         * @param narrative Operator-facing log
         * @param initialMode Write-policy mode at creation
         */
        explicit EmulationSession(INarrativeLog& narrative, WritePolicyMode initialMode = WritePolicyMode::Suppress);

        EmulationSession(const EmulationSession&) = delete;
        EmulationSession& operator=(const EmulationSession&) = delete;

        // ------------------------------------------------------------------
        // Operator context (locks internally)
        // ------------------------------------------------------------------

        /**
         * @brief Mark the session as emulating and fix the original balance
         * 
         * @param originalBalance Balance decoded from the card at start
         */
        void start(uint16_t originalBalance);

        /**
         * @brief Mark the session as idle; state is kept for review
         */
        void stop();

        /**
         * @brief Clear counters and the transaction log, restore the current
         *        balance to the original one
         * 
         * The write-policy mode and the captured credentials survive a reset.
         */
        void reset();

        /**
         * @brief Flip the write-policy mode
         * 
         * @return WritePolicyMode Mode after the toggle
         */
        WritePolicyMode toggleWritePolicy();
        void setWritePolicy(WritePolicyMode mode);

        /**
         * @brief Whether a session is running (locks internally)
         */
        bool isRunning() const;

        /**
         * @brief Blocking snapshot for operator commands
         */
        SessionSnapshot snapshot() const;

        /**
         * @brief Blocking copy of the credential store (used by export)
         */
        CredentialStore copyCredentials() const;

        // ------------------------------------------------------------------
        // Display context (never blocks)
        // ------------------------------------------------------------------

        /**
         * @brief Snapshot if the lock is free
         * 
         * @return etl::optional<SessionSnapshot> Snapshot, or nullopt to skip this frame
         */
        etl::optional<SessionSnapshot> trySnapshot() const;

        /**
         * @brief Copy the transaction log if the lock is free
         * 
         * @param out Destination
         * @return true Copied
         * @return false Lock busy, out untouched
         */
        bool tryCopyTransactionLog(TransactionLog& out) const;

        /**
         * @brief Copy the credential store if the lock is free
         */
        bool tryCopyCredentials(CredentialStore& out) const;

        // ------------------------------------------------------------------
        // Engine context (caller holds mutex())
        // ------------------------------------------------------------------

        std::mutex& mutex() const;

        TransactionLog& transactionLog();
        CredentialStore& credentials();
        SessionCounters& counters();
        const WritePolicyGate& writePolicy() const;

        uint16_t currentBalance() const;
        void setCurrentBalance(uint16_t balance);
        uint16_t originalBalance() const;
        bool isEmulating() const;

    private:
        SessionSnapshot makeSnapshot() const;

        mutable std::mutex lock;

        WritePolicyGate gate;
        TransactionLog log;
        CredentialStore store;
        SessionCounters eventCounters;

        uint16_t original = 0;
        uint16_t current = 0;
        bool emulating = false;
    };

} // namespace shadow
