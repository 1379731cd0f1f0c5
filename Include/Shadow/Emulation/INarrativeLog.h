/**
 * @file INarrativeLog.h
 * @author ShadowCard developers
 * @brief Interface for the human-readable session log
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/string_view.h>

namespace shadow
{
    /**
     * @brief Sink for operator-facing session messages
     * 
     * Separate from the structured TransactionLog. Written from the operator
     * context (mode changes, session start/stop, exports).
     */
    class INarrativeLog
    {
    public:
        virtual ~INarrativeLog() = default;

        /**
         * @brief Write one line
         * 
         * @param line Message without trailing newline
         */
        virtual void write(etl::string_view line) = 0;
    };

} // namespace shadow
