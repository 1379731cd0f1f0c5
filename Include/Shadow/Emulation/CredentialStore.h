/**
 * @file CredentialStore.h
 * @author ShadowCard developers
 * @brief Deduplicated set of sector keys disclosed by the reader
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <cstdint>
#include <etl/vector.h>

#include "Shadow/Card/CardTypes.h"
#include "Shadow/EmulationLimits.h"

namespace shadow
{
    /**
     * @brief A key offered by the reader during authentication
     */
    struct CapturedCredential
    {
        uint8_t sector;
        KeyKind keyKind;
        SectorKey keyBytes;
    };

    /**
     * @brief Result of CredentialStore::record()
     */
    enum class CaptureOutcome : uint8_t
    {
        Recorded,
        Duplicate,
        Dropped
    };

    /**
     * @brief Fixed-capacity credential store
     * 
     * Identity is the raw key bytes only: a key seen again for a different
     * sector or key kind is not stored twice, and the sector and kind of the
     * first sighting are kept. Holds at most 16 keys; further distinct keys
     * are dropped, never evicted. Insertion order is preserved.
     */
    class CredentialStore
    {
    public:
        using Credentials = etl::vector<CapturedCredential, limits::CREDENTIAL_STORE_CAPACITY>;

        /**
         * @brief Record a key
         * 
         * @param sector Sector the reader authenticated against
         * @param keyKind Key role
         * @param keyBytes Raw key
         * @return CaptureOutcome What happened to the key
         */
        CaptureOutcome record(uint8_t sector, KeyKind keyKind, const SectorKey& keyBytes);

        bool contains(const SectorKey& keyBytes) const;

        size_t size() const;
        bool empty() const;
        bool full() const;
        static constexpr size_t capacity() { return limits::CREDENTIAL_STORE_CAPACITY; }

        const CapturedCredential& at(size_t index) const;
        const Credentials& credentials() const;

        void clear();

    private:
        Credentials store;
    };

} // namespace shadow
