/**
 * @file CredentialExporter.h
 * @author ShadowCard developers
 * @brief Writes captured keys to the storage collaborator
 * @version 0.1
 * @date 2026-03-06
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/expected.h>
#include <etl/string.h>
#include <etl/string_view.h>

#include "Error/Error.h"
#include "Shadow/Emulation/CredentialStore.h"
#include "Shadow/Storage/IStorage.h"
#include "Shadow/EmulationLimits.h"

namespace shadow
{
    /**
     * @brief Captured key exporter
     * 
     * File format (UTF-8, overwritten on every export):
     * 
     *   # ShadowCard Captured Keys
     *   # Sector:KeyType:Key
     *   S1:KeyB:AABBCCDDEEFF
     *   S2:KeyA:FFFFFFFFFFFF
     * 
     * The export reflects the current store contents only, so exporting twice
     * without new captures writes identical bytes.
     */
    class CredentialExporter
    {
    public:
        using ExportText = etl::string<limits::EXPORT_TEXT_MAX>;

        static constexpr const char* HEADER =
            "# ShadowCard Captured Keys\n"
            "# Sector:KeyType:Key\n";

        /**
         * @brief Construct an exporter
         * 
         * @param storage Storage collaborator
         * @param path Target file
         */
        CredentialExporter(IStorage& storage, etl::string_view path);

        /**
         * @brief Export the store
         * 
         * An empty store writes nothing and succeeds with 0.
         * 
         * @param store Credentials to export
         * @return etl::expected<size_t, error::Error> Number of keys written or StorageError
         */
        etl::expected<size_t, error::Error> exportCredentials(const CredentialStore& store);

        /**
         * @brief Render the export file contents
         */
        static ExportText format(const CredentialStore& store);

        /**
         * @brief Render one credential line, e.g. "S1:KeyB:AABBCCDDEEFF\n"
         */
        static etl::string<limits::EXPORT_LINE_MAX> formatLine(const CapturedCredential& credential);

        etl::string_view path() const;

    private:
        IStorage& storage;
        etl::string<limits::PATH_MAX_LENGTH> exportPath;
    };

} // namespace shadow
