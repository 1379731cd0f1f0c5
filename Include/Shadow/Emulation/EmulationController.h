/**
 * @file EmulationController.h
 * @author ShadowCard developers
 * @brief Operator-facing control of a card emulation
 * @version 0.1
 * @date 2026-03-07
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/expected.h>
#include <etl/optional.h>
#include <etl/string_view.h>

#include "CardEmulator.h"
#include "EmulationEngine.h"
#include "EmulationOptions.h"
#include "EmulationSession.h"
#include "INarrativeLog.h"
#include "Shadow/Card/ProviderDetector.h"
#include "Shadow/Card/VirtualCard.h"
#include "Shadow/Export/CredentialExporter.h"
#include "Shadow/Storage/IStorage.h"
#include "Error/Error.h"

namespace shadow
{
    /**
     * @brief Result of one emulation run
     */
    struct SessionSummary
    {
        SessionCounters counters;
        uint16_t originalBalance;
        uint16_t currentBalance;
        int32_t charge;                 ///< originalBalance - currentBalance, in cents
        size_t transactionCount;
        size_t credentialCount;
    };

    /**
     * @brief Emulation controller
     * 
     * Owns the virtual card, the session, the engine and the exporter, and
     * exposes the operator commands: load card, start/stop, toggle the
     * write policy, export keys, reset and view. All commands run on the
     * operator context; the reader-emulation layer talks to handler() or
     * emulator() from its own context.
     */
    class EmulationController
    {
    public:
        EmulationController(IStorage& storage, INarrativeLog& narrative, const EmulationOptions& options = EmulationOptions());

        EmulationController(const EmulationController&) = delete;
        EmulationController& operator=(const EmulationController&) = delete;

        /**
         * @brief Load a card dump from storage
         * 
         * @param path Dump path
         * @return etl::expected<void, error::Error> Success, StorageError, CardError::EmptyImage
         *         or EmulationError::AlreadyEmulating
         */
        etl::expected<void, error::Error> loadCard(etl::string_view path);

        /**
         * @brief Use an already parsed card image
         */
        etl::expected<void, error::Error> loadCard(const VirtualCard& image);

        /**
         * @brief Start emulating the loaded card
         * 
         * The original balance is decoded from the primary balance block; an
         * image whose value fails the inverse check starts at 0.
         * 
         * @return etl::expected<void, error::Error> Success, NoCardLoaded or AlreadyEmulating
         */
        etl::expected<void, error::Error> startEmulation();

        /**
         * @brief Stop emulating
         * 
         * @return etl::expected<SessionSummary, error::Error> Summary or NotEmulating
         */
        etl::expected<SessionSummary, error::Error> stopEmulation();

        WritePolicyMode toggleWritePolicy();

        /**
         * @brief Export captured keys to the configured path
         * 
         * @return etl::expected<size_t, error::Error> Keys written or StorageError
         */
        etl::expected<size_t, error::Error> exportCredentials();

        /**
         * @brief Reset counters, transaction log and current balance
         */
        void resetSession();

        /**
         * @brief Stop emulation if needed and export the captured keys
         * 
         * Call once before the application exits.
         */
        etl::expected<size_t, error::Error> shutdown();

        // Display context
        etl::optional<SessionSnapshot> trySnapshot() const;
        bool tryCopyTransactionLog(TransactionLog& out) const;
        bool tryCopyCredentials(CredentialStore& out) const;

        IEmulationHandler& handler();
        CardEmulator& emulator();
        const VirtualCard& card() const;
        CardProvider provider() const;
        const EmulationSession& session() const;

    private:
        uint16_t decodeOriginalBalance() const;

        IStorage& storage;
        INarrativeLog& narrative;
        BalanceDecoder decoder;
        VirtualCard virtualCard;
        CardProvider cardProvider;
        EmulationSession emulationSession;
        EmulationEngine engine;
        CardEmulator cardEmulator;
        CredentialExporter exporter;
    };

} // namespace shadow
