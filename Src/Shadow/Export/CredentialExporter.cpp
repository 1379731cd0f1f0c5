/**
 * @file CredentialExporter.cpp
 * @author ShadowCard developers
 * @brief Credential exporter implementation
 * @version 0.1
 * @date 2026-03-06
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Export/CredentialExporter.h"
#include "Utils/Logging.h"

#include <cstdio>

namespace shadow
{
    CredentialExporter::CredentialExporter(IStorage& storageRef, etl::string_view path)
        : storage(storageRef)
        , exportPath(path.begin(), path.end())
    {
    }

    etl::expected<size_t, error::Error> CredentialExporter::exportCredentials(const CredentialStore& store)
    {
        if (store.empty())
        {
            LOG_INFO("No keys to save");
            return static_cast<size_t>(0);
        }

        auto text = format(store);
        auto result = storage.writeFile(path(), etl::string_view(text.data(), text.size()));
        if (!result.has_value())
        {
            LOG_ERROR("Key export failed: %s", result.error().toString().c_str());
            return etl::unexpected(result.error());
        }

        LOG_INFO("Saved %u keys to %s", static_cast<unsigned>(store.size()), exportPath.c_str());
        return store.size();
    }

    CredentialExporter::ExportText CredentialExporter::format(const CredentialStore& store)
    {
        ExportText text(HEADER);
        for (const auto& credential : store.credentials())
        {
            auto line = formatLine(credential);
            text.append(line.begin(), line.end());
        }
        return text;
    }

    etl::string<limits::EXPORT_LINE_MAX> CredentialExporter::formatLine(const CapturedCredential& credential)
    {
        char buffer[limits::EXPORT_LINE_MAX];
        const auto& key = credential.keyBytes;
        std::snprintf(buffer, sizeof(buffer),
                      "S%u:Key%s:%02X%02X%02X%02X%02X%02X\n",
                      static_cast<unsigned>(credential.sector),
                      keyKindName(credential.keyKind),
                      key[0], key[1], key[2], key[3], key[4], key[5]);
        return etl::string<limits::EXPORT_LINE_MAX>(buffer);
    }

    etl::string_view CredentialExporter::path() const
    {
        return etl::string_view(exportPath.data(), exportPath.size());
    }

} // namespace shadow
