/**
 * @file CardEmulator.cpp
 * @author ShadowCard developers
 * @brief Card emulator implementation
 * @version 0.1
 * @date 2026-03-06
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Emulation/CardEmulator.h"
#include "Utils/Logging.h"

namespace shadow
{
    CardEmulator::CardEmulator(VirtualCard& cardRef, IEmulationHandler& handlerRef, const EmulationSession& sessionRef)
        : card(cardRef)
        , handler(handlerRef)
        , session(sessionRef)
    {
    }

    etl::expected<void, error::Error> CardEmulator::load(const VirtualCard& image)
    {
        std::lock_guard<std::mutex> guard(cardLock);
        if (session.isRunning())
        {
            return etl::unexpected(error::Error::fromEmulation(error::EmulationError::AlreadyEmulating));
        }

        card = image;
        return {};
    }

    std::mutex& CardEmulator::mutex()
    {
        return cardLock;
    }

    bool CardEmulator::authenticate(uint8_t blockIndex, KeyKind keyKind, const SectorKey& keyBytes)
    {
        if (blockIndex >= limits::BLOCK_COUNT)
        {
            return false;
        }

        std::lock_guard<std::mutex> guard(cardLock);
        if (!session.isRunning())
        {
            LOG_DEBUG("AUTH Block %u ignored, not emulating", blockIndex);
            return false;
        }

        return handler.onAuthenticate(blockIndex, keyKind, keyBytes);
    }

    etl::expected<Block, error::Error> CardEmulator::read(uint8_t blockIndex)
    {
        std::lock_guard<std::mutex> guard(cardLock);
        if (!session.isRunning())
        {
            return etl::unexpected(error::Error::fromEmulation(error::EmulationError::NotEmulating));
        }

        auto block = card.readBlock(blockIndex);
        if (!block.has_value())
        {
            return etl::unexpected(block.error());
        }

        if (!handler.onRead(blockIndex, block.value()))
        {
            return etl::unexpected(error::Error::fromEmulation(error::EmulationError::AccessDenied));
        }

        return block.value();
    }

    bool CardEmulator::write(uint8_t blockIndex, const Block& data)
    {
        if (blockIndex >= limits::BLOCK_COUNT)
        {
            return false;
        }

        std::lock_guard<std::mutex> guard(cardLock);
        if (!session.isRunning())
        {
            LOG_DEBUG("WRITE Block %u ignored, not emulating", blockIndex);
            return false;
        }

        if (!handler.onWrite(blockIndex, data))
        {
            return false;
        }

        auto committed = card.writeBlock(blockIndex, data);
        if (!committed.has_value())
        {
            LOG_ERROR("Commit of Block %u failed: %s", blockIndex, committed.error().toString().c_str());
            return false;
        }

        return true;
    }

} // namespace shadow
