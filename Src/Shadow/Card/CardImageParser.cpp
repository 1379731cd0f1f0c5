/**
 * @file CardImageParser.cpp
 * @author ShadowCard developers
 * @brief Card image parser implementation
 * @version 0.1
 * @date 2026-03-03
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Card/CardImageParser.h"
#include "Utils/Logging.h"

namespace shadow
{
    namespace
    {
        const etl::string_view BLOCK_PREFIX("Block ");
        const etl::string_view UID_PREFIX("UID: ");

        bool startsWith(etl::string_view text, etl::string_view prefix)
        {
            return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
        }

        int hexNibble(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            return -1;
        }
    }

    bool CardImageParser::parseHexByte(char high, char low, uint8_t& out)
    {
        if (high == '?' && low == '?')
        {
            out = 0xFF;
            return true;
        }

        int hi = hexNibble(high);
        int lo = hexNibble(low);
        if (hi < 0 || lo < 0)
        {
            return false;
        }

        out = static_cast<uint8_t>((hi << 4) | lo);
        return true;
    }

    etl::expected<VirtualCard, error::Error> CardImageParser::parse(etl::string_view text)
    {
        VirtualCard card;

        size_t start = 0;
        while (start < text.size())
        {
            size_t end = text.find('\n', start);
            if (end == etl::string_view::npos)
            {
                end = text.size();
            }

            etl::string_view line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }

            parseLine(line, card);
            start = end + 1;
        }

        if (card.isEmpty())
        {
            LOG_WARN("Card image contains no complete block lines");
            return etl::unexpected(error::Error::fromCard(error::CardError::EmptyImage));
        }

        LOG_INFO("Parsed card image: %u blocks, UID %s",
                 static_cast<unsigned>(card.loadedBlockCount()),
                 card.getUid().empty() ? "unknown" : card.getUid().c_str());
        return card;
    }

    bool CardImageParser::parseLine(etl::string_view line, VirtualCard& card)
    {
        if (startsWith(line, BLOCK_PREFIX))
        {
            return parseBlockLine(line.substr(BLOCK_PREFIX.size()), card);
        }

        if (startsWith(line, UID_PREFIX))
        {
            parseUidLine(line.substr(UID_PREFIX.size()), card);
            return true;
        }

        return false;
    }

    bool CardImageParser::parseBlockLine(etl::string_view rest, VirtualCard& card)
    {
        size_t pos = 0;
        unsigned blockNumber = 0;
        size_t digits = 0;
        while (pos < rest.size() && rest[pos] >= '0' && rest[pos] <= '9' && digits < 3)
        {
            blockNumber = blockNumber * 10U + static_cast<unsigned>(rest[pos] - '0');
            ++pos;
            ++digits;
        }

        if (digits == 0 || pos >= rest.size() || rest[pos] != ':' || blockNumber >= limits::BLOCK_COUNT)
        {
            return false;
        }
        ++pos;

        Block data{};
        size_t byteCount = 0;
        while (byteCount < limits::BLOCK_SIZE)
        {
            while (pos < rest.size() && rest[pos] == ' ')
            {
                ++pos;
            }
            if (pos + 1 >= rest.size())
            {
                break;
            }
            if (!parseHexByte(rest[pos], rest[pos + 1], data[byteCount]))
            {
                break;
            }
            ++byteCount;
            pos += 2;
        }

        if (byteCount != limits::BLOCK_SIZE)
        {
            LOG_DEBUG("Ignoring incomplete block line %u (%u bytes)", blockNumber, static_cast<unsigned>(byteCount));
            return false;
        }

        return card.writeBlock(static_cast<uint8_t>(blockNumber), data).has_value();
    }

    void CardImageParser::parseUidLine(etl::string_view rest, VirtualCard& card)
    {
        etl::string<limits::UID_TEXT_MAX> uid;
        for (char c : rest)
        {
            if (c == ' ' || c == '\r' || c == '\n')
            {
                continue;
            }
            if (uid.full())
            {
                break;
            }
            uid.push_back(c);
        }
        card.setUid(etl::string_view(uid.data(), uid.size()));
    }

} // namespace shadow
