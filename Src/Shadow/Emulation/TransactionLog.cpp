/**
 * @file TransactionLog.cpp
 * @author ShadowCard developers
 * @brief Transaction log implementation
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Emulation/TransactionLog.h"

namespace shadow
{
    etl::string_view operationName(TransactionOperation operation)
    {
        switch (operation)
        {
            case TransactionOperation::Read:
                return "READ";
            case TransactionOperation::Write:
                return "WRITE";
            case TransactionOperation::Authenticate:
                return "AUTH";
            default:
                return "UNKNOWN";
        }
    }

    bool TransactionLog::append(const TransactionLogEntry& entry)
    {
        if (log.full())
        {
            return false;
        }

        log.push_back(entry);
        return true;
    }

    size_t TransactionLog::size() const
    {
        return log.size();
    }

    bool TransactionLog::empty() const
    {
        return log.empty();
    }

    bool TransactionLog::full() const
    {
        return log.full();
    }

    const TransactionLogEntry& TransactionLog::at(size_t index) const
    {
        return log[index];
    }

    const TransactionLog::Entries& TransactionLog::entries() const
    {
        return log;
    }

    void TransactionLog::clear()
    {
        log.clear();
    }

} // namespace shadow
