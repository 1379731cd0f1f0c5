/**
 * @file CardImageParser.h
 * @author ShadowCard developers
 * @brief Parser for Flipper-style .nfc MIFARE Classic dumps
 * @version 0.1
 * @date 2026-03-03
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <etl/expected.h>
#include <etl/string_view.h>

#include "VirtualCard.h"
#include "Error/Error.h"

namespace shadow
{
    /**
     * @brief Parses a text card dump into a VirtualCard
     * 
     * Recognised lines:
     *   "UID: 04 A1 B2 C3"
     *   "Block 4: 64 00 00 00 9B FF FF FF 64 00 00 00 04 FB 04 FB"
     * 
     * Unknown bytes written as "??" (uncracked key bytes in the sector
     * trailer) are stored as 0xFF. A block line is kept only when all 16
     * bytes parse and the block number is below 64. Every other line is
     * ignored.
     */
    class CardImageParser
    {
    public:
        /**
         * @brief Parse a complete dump
         * 
         * @param text Dump contents
         * @return etl::expected<VirtualCard, error::Error> Card or CardError::EmptyImage
         */
        static etl::expected<VirtualCard, error::Error> parse(etl::string_view text);

        /**
         * @brief Apply one line of a dump to a card
         * 
         * @param line Line without the terminating newline
         * @param card Card to update
         * @return true Line was a valid block or UID line
         * @return false Line was ignored
         */
        static bool parseLine(etl::string_view line, VirtualCard& card);

        /**
         * @brief Parse two hex characters ("??" yields 0xFF)
         * 
         * @param high First character
         * @param low Second character
         * @param out Parsed byte
         * @return true Valid byte
         */
        static bool parseHexByte(char high, char low, uint8_t& out);

    private:
        static bool parseBlockLine(etl::string_view rest, VirtualCard& card);
        static void parseUidLine(etl::string_view rest, VirtualCard& card);
    };

} // namespace shadow
