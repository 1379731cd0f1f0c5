/**
 * @file FileStorage.h
 * @author ShadowCard developers
 * @brief stdio-backed storage
 * @version 0.1
 * @date 2026-03-06
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include "IStorage.h"

namespace shadow
{
    class FileStorage : public IStorage
    {
    public:
        etl::expected<void, error::Error> writeFile(etl::string_view path, etl::string_view contents) override;
        etl::expected<FileText, error::Error> readFile(etl::string_view path) override;
    };

} // namespace shadow
