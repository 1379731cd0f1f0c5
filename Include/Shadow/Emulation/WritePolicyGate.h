/**
 * @file WritePolicyGate.h
 * @author ShadowCard developers
 * @brief Decides whether reader writes are committed to the virtual card
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <etl/string_view.h>

#include "INarrativeLog.h"

namespace shadow
{
    enum class WritePolicyMode : uint8_t
    {
        Suppress,   ///< Writes are denied, card state stays as loaded
        Apply       ///< Writes are granted and committed
    };

    /**
     * @brief Write-policy mode switch
     * 
     * Starts in Suppress mode so nothing the reader writes is kept by
     * accident. Only the operator changes the mode. The mode is atomic:
     * the engine reads it while the operator flips it, and the narrative
     * line is written without holding the session lock.
     */
    class WritePolicyGate
    {
    public:
        /**
         * @brief Construct a gate
         * 
         * @param narrative Receives one line per mode change
         * @param initialMode Starting mode
         */
        explicit WritePolicyGate(INarrativeLog& narrative, WritePolicyMode initialMode = WritePolicyMode::Suppress);

        WritePolicyMode mode() const;

        /**
         * @brief Whether a granted write should be committed
         */
        bool allowsWrites() const;

        /**
         * @brief Flip the mode and log the new one
         * 
         * @return WritePolicyMode Mode after the toggle
         */
        WritePolicyMode toggle();

        /**
         * @brief Set a mode; setting the current mode does nothing
         * 
         * @param newMode Requested mode
         */
        void set(WritePolicyMode newMode);

        /**
         * @brief Operator-facing description, e.g. "NORMAL (apply writes)"
         */
        static etl::string_view describe(WritePolicyMode mode);

        /**
         * @brief Short name for status lines ("NORMAL" / "TESTING")
         */
        static etl::string_view shortName(WritePolicyMode mode);

    private:
        void announce(WritePolicyMode mode);

        INarrativeLog& narrative;
        std::atomic<WritePolicyMode> currentMode;
    };

} // namespace shadow
