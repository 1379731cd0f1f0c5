/**
 * @file WritePolicyGate.cpp
 * @author ShadowCard developers
 * @brief Write-policy gate implementation
 * @version 0.1
 * @date 2026-03-04
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Emulation/WritePolicyGate.h"
#include "Shadow/EmulationLimits.h"

#include <etl/string.h>

namespace shadow
{
    WritePolicyGate::WritePolicyGate(INarrativeLog& narrativeRef, WritePolicyMode initialMode)
        : narrative(narrativeRef)
        , currentMode(initialMode)
    {
    }

    WritePolicyMode WritePolicyGate::mode() const
    {
        return currentMode.load();
    }

    bool WritePolicyGate::allowsWrites() const
    {
        return currentMode.load() == WritePolicyMode::Apply;
    }

    WritePolicyMode WritePolicyGate::toggle()
    {
        WritePolicyMode previous = currentMode.load();
        WritePolicyMode next;
        do
        {
            next = (previous == WritePolicyMode::Apply)
                ? WritePolicyMode::Suppress
                : WritePolicyMode::Apply;
        } while (!currentMode.compare_exchange_weak(previous, next));

        announce(next);
        return next;
    }

    void WritePolicyGate::set(WritePolicyMode newMode)
    {
        if (currentMode.exchange(newMode) == newMode)
        {
            return;
        }

        announce(newMode);
    }

    etl::string_view WritePolicyGate::describe(WritePolicyMode mode)
    {
        return mode == WritePolicyMode::Apply
            ? etl::string_view("NORMAL (apply writes)")
            : etl::string_view("TESTING (ignore writes)");
    }

    etl::string_view WritePolicyGate::shortName(WritePolicyMode mode)
    {
        return mode == WritePolicyMode::Apply
            ? etl::string_view("NORMAL")
            : etl::string_view("TESTING");
    }

    void WritePolicyGate::announce(WritePolicyMode mode)
    {
        etl::string<limits::NARRATIVE_LINE_MAX> line("Mode: ");
        auto description = describe(mode);
        line.append(description.begin(), description.end());
        narrative.write(etl::string_view(line.data(), line.size()));
    }

} // namespace shadow
