/**
 * @file EmulationEngine.cpp
 * @author ShadowCard developers
 * @brief Emulation engine implementation
 * @version 0.1
 * @date 2026-03-05
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Emulation/EmulationEngine.h"
#include "Utils/Logging.h"
#include "Utils/Timing.h"

namespace shadow
{
    EmulationEngine::EmulationEngine(EmulationSession& sessionRef, const BalanceDecoder& balanceDecoder)
        : session(sessionRef)
        , decoder(balanceDecoder)
    {
    }

    bool EmulationEngine::onAuthenticate(uint8_t blockIndex, KeyKind keyKind, const SectorKey& keyBytes)
    {
        const uint8_t sector = sectorOf(blockIndex);
        CaptureOutcome outcome;
        size_t captured;

        {
            std::lock_guard<std::mutex> guard(session.mutex());
            session.counters().authenticateCount++;
            outcome = session.credentials().record(sector, keyKind, keyBytes);
            captured = session.credentials().size();
            appendEntry(session.transactionLog(), blockIndex, TransactionOperation::Authenticate, Block{});
        }

        LOG_DEBUG("Reader AUTH Block %u Sector %u (Key %s): %02X%02X%02X%02X%02X%02X",
                  blockIndex, sector, keyKindName(keyKind),
                  keyBytes[0], keyBytes[1], keyBytes[2], keyBytes[3], keyBytes[4], keyBytes[5]);

        if (outcome == CaptureOutcome::Recorded)
        {
            LOG_INFO("New key captured (#%u): Sector %u Key%s",
                     static_cast<unsigned>(captured), sector, keyKindName(keyKind));
            if (keyKind == KeyKind::B)
            {
                LOG_WARN("Write key attempt: KeyB for Sector %u: %02X%02X%02X%02X%02X%02X",
                         sector, keyBytes[0], keyBytes[1], keyBytes[2], keyBytes[3], keyBytes[4], keyBytes[5]);
            }
        }

        // Never denied, not even when the store is full
        return true;
    }

    bool EmulationEngine::onRead(uint8_t blockIndex, const Block& currentBlockData)
    {
        {
            std::lock_guard<std::mutex> guard(session.mutex());
            appendEntry(session.transactionLog(), blockIndex, TransactionOperation::Read, currentBlockData);
            session.counters().readCount++;
        }

        LOG_DEBUG("Reader READ Block %u", blockIndex);
        return true;
    }

    bool EmulationEngine::onWrite(uint8_t blockIndex, const Block& proposedBlockData)
    {
        const bool balanceBlock = decoder.isBalanceBlock(blockIndex);
        uint16_t previousBalance = 0;
        uint16_t newBalance = 0;
        bool grant;

        {
            std::lock_guard<std::mutex> guard(session.mutex());
            appendEntry(session.transactionLog(), blockIndex, TransactionOperation::Write, proposedBlockData);
            session.counters().writeCount++;

            // Tracks what the reader attempted, committed or not
            if (balanceBlock)
            {
                previousBalance = session.currentBalance();
                newBalance = BalanceDecoder::decodeValue(proposedBlockData);
                session.setCurrentBalance(newBalance);
            }

            grant = session.writePolicy().allowsWrites();
        }

        if (balanceBlock)
        {
            LOG_INFO("Balance change detected: Block %u: %s -> %s",
                     blockIndex,
                     BalanceDecoder::formatCents(previousBalance).c_str(),
                     BalanceDecoder::formatCents(newBalance).c_str());
        }

        if (grant)
        {
            LOG_INFO("Applying write to Block %u", blockIndex);
        }
        else
        {
            LOG_WARN("Ignoring write to Block %u (testing mode)", blockIndex);
        }

        return grant;
    }

    void EmulationEngine::appendEntry(TransactionLog& log, uint8_t blockIndex, TransactionOperation operation, const Block& payload)
    {
        TransactionLogEntry entry;
        entry.blockIndex = blockIndex;
        entry.operation = operation;
        entry.payload = payload;
        entry.timestamp = utils::get_tick_ms();
        if (!log.append(entry))
        {
            LOG_DEBUG("Transaction log full, dropping %s Block %u",
                      operationName(operation).data(), blockIndex);
        }
    }

} // namespace shadow
