/**
 * @file EmulationSession.cpp
 * @author ShadowCard developers
 * @brief Emulation session implementation
 * @version 0.1
 * @date 2026-03-05
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Emulation/EmulationSession.h"

namespace shadow
{
    EmulationSession::EmulationSession(INarrativeLog& narrative, WritePolicyMode initialMode)
        : gate(narrative, initialMode)
    {
    }

    void EmulationSession::start(uint16_t originalBalance)
    {
        std::lock_guard<std::mutex> guard(lock);
        original = originalBalance;
        current = originalBalance;
        emulating = true;
    }

    void EmulationSession::stop()
    {
        std::lock_guard<std::mutex> guard(lock);
        emulating = false;
    }

    void EmulationSession::reset()
    {
        std::lock_guard<std::mutex> guard(lock);
        log.clear();
        eventCounters = SessionCounters{};
        current = original;
    }

    WritePolicyMode EmulationSession::toggleWritePolicy()
    {
        return gate.toggle();
    }

    void EmulationSession::setWritePolicy(WritePolicyMode mode)
    {
        gate.set(mode);
    }

    bool EmulationSession::isRunning() const
    {
        std::lock_guard<std::mutex> guard(lock);
        return emulating;
    }

    SessionSnapshot EmulationSession::snapshot() const
    {
        std::lock_guard<std::mutex> guard(lock);
        return makeSnapshot();
    }

    CredentialStore EmulationSession::copyCredentials() const
    {
        std::lock_guard<std::mutex> guard(lock);
        return store;
    }

    etl::optional<SessionSnapshot> EmulationSession::trySnapshot() const
    {
        std::unique_lock<std::mutex> guard(lock, std::try_to_lock);
        if (!guard.owns_lock())
        {
            return etl::nullopt;
        }
        return makeSnapshot();
    }

    bool EmulationSession::tryCopyTransactionLog(TransactionLog& out) const
    {
        std::unique_lock<std::mutex> guard(lock, std::try_to_lock);
        if (!guard.owns_lock())
        {
            return false;
        }
        out = log;
        return true;
    }

    bool EmulationSession::tryCopyCredentials(CredentialStore& out) const
    {
        std::unique_lock<std::mutex> guard(lock, std::try_to_lock);
        if (!guard.owns_lock())
        {
            return false;
        }
        out = store;
        return true;
    }

    std::mutex& EmulationSession::mutex() const
    {
        return lock;
    }

    TransactionLog& EmulationSession::transactionLog()
    {
        return log;
    }

    CredentialStore& EmulationSession::credentials()
    {
        return store;
    }

    SessionCounters& EmulationSession::counters()
    {
        return eventCounters;
    }

    const WritePolicyGate& EmulationSession::writePolicy() const
    {
        return gate;
    }

    uint16_t EmulationSession::currentBalance() const
    {
        return current;
    }

    void EmulationSession::setCurrentBalance(uint16_t balance)
    {
        current = balance;
    }

    uint16_t EmulationSession::originalBalance() const
    {
        return original;
    }

    bool EmulationSession::isEmulating() const
    {
        return emulating;
    }

    SessionSnapshot EmulationSession::makeSnapshot() const
    {
        SessionSnapshot snap;
        snap.emulating = emulating;
        snap.mode = gate.mode();
        snap.counters = eventCounters;
        snap.originalBalance = original;
        snap.currentBalance = current;
        snap.transactionCount = log.size();
        snap.credentialCount = store.size();
        return snap;
    }

} // namespace shadow
