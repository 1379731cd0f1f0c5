/**
 * @file FileStorage.cpp
 * @author ShadowCard developers
 * @brief stdio-backed storage implementation
 * @version 0.1
 * @date 2026-03-06
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Storage/FileStorage.h"
#include "Utils/Logging.h"

#include <cstdio>

namespace shadow
{
    namespace
    {
        // fopen needs a terminated path
        etl::string<limits::PATH_MAX_LENGTH> toPath(etl::string_view path)
        {
            return etl::string<limits::PATH_MAX_LENGTH>(path.begin(), path.end());
        }
    }

    etl::expected<void, error::Error> FileStorage::writeFile(etl::string_view path, etl::string_view contents)
    {
        auto filePath = toPath(path);
        std::FILE* file = std::fopen(filePath.c_str(), "wb");
        if (file == nullptr)
        {
            LOG_ERROR("Failed to open %s for writing", filePath.c_str());
            return etl::unexpected(error::Error::fromStorage(error::StorageError::OpenFailed));
        }

        size_t written = std::fwrite(contents.data(), 1, contents.size(), file);
        bool closed = std::fclose(file) == 0;

        if (written != contents.size() || !closed)
        {
            LOG_ERROR("Failed to write %s (%u of %u bytes)", filePath.c_str(),
                      static_cast<unsigned>(written), static_cast<unsigned>(contents.size()));
            return etl::unexpected(error::Error::fromStorage(error::StorageError::WriteFailed));
        }

        return {};
    }

    etl::expected<IStorage::FileText, error::Error> FileStorage::readFile(etl::string_view path)
    {
        auto filePath = toPath(path);
        std::FILE* file = std::fopen(filePath.c_str(), "rb");
        if (file == nullptr)
        {
            LOG_ERROR("Failed to open %s for reading", filePath.c_str());
            return etl::unexpected(error::Error::fromStorage(error::StorageError::OpenFailed));
        }

        FileText text;
        char chunk[256];
        size_t count;
        bool tooLarge = false;
        while ((count = std::fread(chunk, 1, sizeof(chunk), file)) > 0)
        {
            if (text.size() + count > text.capacity())
            {
                tooLarge = true;
                break;
            }
            text.append(chunk, count);
        }

        bool readError = std::ferror(file) != 0;
        std::fclose(file);

        if (tooLarge)
        {
            LOG_ERROR("%s exceeds %u bytes", filePath.c_str(), static_cast<unsigned>(text.capacity()));
            return etl::unexpected(error::Error::fromStorage(error::StorageError::FileTooLarge));
        }

        if (readError)
        {
            return etl::unexpected(error::Error::fromStorage(error::StorageError::ReadFailed));
        }

        return text;
    }

} // namespace shadow
