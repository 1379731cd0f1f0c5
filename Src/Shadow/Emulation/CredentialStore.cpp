/**
 * @file CredentialStore.cpp
 * @author ShadowCard developers
 * @brief Credential store implementation
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Emulation/CredentialStore.h"

namespace shadow
{
    CaptureOutcome CredentialStore::record(uint8_t sector, KeyKind keyKind, const SectorKey& keyBytes)
    {
        if (contains(keyBytes))
        {
            return CaptureOutcome::Duplicate;
        }

        if (store.full())
        {
            return CaptureOutcome::Dropped;
        }

        store.push_back(CapturedCredential{sector, keyKind, keyBytes});
        return CaptureOutcome::Recorded;
    }

    bool CredentialStore::contains(const SectorKey& keyBytes) const
    {
        for (const auto& credential : store)
        {
            if (credential.keyBytes == keyBytes)
            {
                return true;
            }
        }
        return false;
    }

    size_t CredentialStore::size() const
    {
        return store.size();
    }

    bool CredentialStore::empty() const
    {
        return store.empty();
    }

    bool CredentialStore::full() const
    {
        return store.full();
    }

    const CapturedCredential& CredentialStore::at(size_t index) const
    {
        return store[index];
    }

    const CredentialStore::Credentials& CredentialStore::credentials() const
    {
        return store;
    }

    void CredentialStore::clear()
    {
        store.clear();
    }

} // namespace shadow
