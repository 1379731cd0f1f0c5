/**
 * @file EmulationOptions.h
 * @author ShadowCard developers
 * @brief Runtime options of an emulation controller
 * @version 0.1
 * @date 2026-03-07
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/string.h>

#include "BalanceDecoder.h"
#include "WritePolicyGate.h"
#include "Shadow/EmulationLimits.h"

namespace shadow
{
    /**
     * @brief Emulation controller options
     */
    struct EmulationOptions
    {
        etl::string<limits::PATH_MAX_LENGTH> exportPath = "captured_keys.txt";
        BalanceDecoder::BlockList balanceBlocks;        // empty: blocks 4 and 8
        WritePolicyMode initialMode = WritePolicyMode::Suppress;
    };

} // namespace shadow
