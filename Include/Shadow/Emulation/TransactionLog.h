/**
 * @file TransactionLog.h
 * @author ShadowCard developers
 * @brief Bounded log of reader protocol events
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <cstdint>
#include <etl/vector.h>
#include <etl/string_view.h>

#include "Shadow/Card/CardTypes.h"
#include "Shadow/EmulationLimits.h"

namespace shadow
{
    enum class TransactionOperation : uint8_t
    {
        Read,
        Write,
        Authenticate
    };

    etl::string_view operationName(TransactionOperation operation);

    /**
     * @brief One protocol event as seen by the engine
     * 
     * For writes the payload is the data the reader proposed, whether or not
     * it was committed. Authenticate entries carry a zero payload.
     */
    struct TransactionLogEntry
    {
        uint8_t blockIndex;
        TransactionOperation operation;
        Block payload;
        uint32_t timestamp;
    };

    /**
     * @brief Append-only transaction log
     * 
     * Holds at most 64 entries. Once full, append() is a no-op: the first
     * 64 events of a session are kept and later ones are dropped. This is
     * not a ring buffer.
     */
    class TransactionLog
    {
    public:
        using Entries = etl::vector<TransactionLogEntry, limits::TRANSACTION_LOG_CAPACITY>;

        /**
         * @brief Append an entry
         * 
         * @param entry Entry to store
         * @return true Entry stored
         * @return false Log full, entry dropped
         */
        bool append(const TransactionLogEntry& entry);

        size_t size() const;
        bool empty() const;
        bool full() const;
        static constexpr size_t capacity() { return limits::TRANSACTION_LOG_CAPACITY; }

        const TransactionLogEntry& at(size_t index) const;
        const Entries& entries() const;

        void clear();

    private:
        Entries log;
    };

} // namespace shadow
