/**
 * @file ConsoleNarrativeLog.h
 * @author ShadowCard developers
 * @brief Narrative log that forwards to the console logger
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include "INarrativeLog.h"
#include "Utils/Logging.h"

namespace shadow
{
    class ConsoleNarrativeLog : public INarrativeLog
    {
    public:
        void write(etl::string_view line) override
        {
            LOG_INFO("%.*s", static_cast<int>(line.size()), line.data());
        }
    };

} // namespace shadow
