/**
 * @file IStorage.h
 * @author ShadowCard developers
 * @brief Interface to the persistence collaborator
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
#include "Shadow/EmulationLimits.h"

namespace shadow
{
    /**
     * @brief Whole-file text storage
     * 
     * Only used from the operator context, never from an emulation handler.
     */
    class IStorage
    {
    public:
        using FileText = etl::string<limits::CARD_IMAGE_TEXT_MAX>;

        virtual ~IStorage() = default;

        /**
         * @brief Create or truncate a file and write the contents
         * 
         * @param path File path
         * @param contents Complete new contents
         * @return etl::expected<void, error::Error> Success or StorageError
         */
        virtual etl::expected<void, error::Error> writeFile(etl::string_view path, etl::string_view contents) = 0;

        /**
         * @brief Read a complete file
         * 
         * @param path File path
         * @return etl::expected<FileText, error::Error> Contents or StorageError
         */
        virtual etl::expected<FileText, error::Error> readFile(etl::string_view path) = 0;
    };

} // namespace shadow
