/**
 * @file EmulationController.cpp
 * @author ShadowCard developers
 * @brief Emulation controller implementation
 * @version 0.1
 * @date 2026-03-07
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include "Shadow/Emulation/EmulationController.h"
#include "Shadow/Card/CardImageParser.h"
#include "Utils/Logging.h"

#include <cstdio>

namespace shadow
{
    EmulationController::EmulationController(IStorage& storageRef, INarrativeLog& narrativeRef, const EmulationOptions& options)
        : storage(storageRef)
        , narrative(narrativeRef)
        , decoder(options.balanceBlocks)
        , virtualCard()
        , cardProvider(CardProvider::Unknown)
        , emulationSession(narrativeRef, options.initialMode)
        , engine(emulationSession, decoder)
        , cardEmulator(virtualCard, engine, emulationSession)
        , exporter(storageRef, etl::string_view(options.exportPath.data(), options.exportPath.size()))
    {
    }

    etl::expected<void, error::Error> EmulationController::loadCard(etl::string_view path)
    {
        if (emulationSession.snapshot().emulating)
        {
            return etl::unexpected(error::Error::fromEmulation(error::EmulationError::AlreadyEmulating));
        }

        auto text = storage.readFile(path);
        if (!text.has_value())
        {
            return etl::unexpected(text.error());
        }

        auto image = CardImageParser::parse(etl::string_view(text.value().data(), text.value().size()));
        if (!image.has_value())
        {
            return etl::unexpected(image.error());
        }

        return loadCard(image.value());
    }

    etl::expected<void, error::Error> EmulationController::loadCard(const VirtualCard& image)
    {
        if (emulationSession.snapshot().emulating)
        {
            return etl::unexpected(error::Error::fromEmulation(error::EmulationError::AlreadyEmulating));
        }

        if (image.isEmpty())
        {
            return etl::unexpected(error::Error::fromCard(error::CardError::EmptyImage));
        }

        auto loaded = cardEmulator.load(image);
        if (!loaded.has_value())
        {
            return etl::unexpected(loaded.error());
        }
        cardProvider = ProviderDetector::detect(image);

        char line[limits::NARRATIVE_LINE_MAX];
        std::snprintf(line, sizeof(line), "Card loaded: UID %s, provider %s, %u blocks",
                      image.getUid().empty() ? "unknown" : image.getUid().c_str(),
                      ProviderDetector::name(cardProvider).data(),
                      static_cast<unsigned>(image.loadedBlockCount()));
        narrative.write(line);
        return {};
    }

    etl::expected<void, error::Error> EmulationController::startEmulation()
    {
        if (virtualCard.isEmpty())
        {
            return etl::unexpected(error::Error::fromEmulation(error::EmulationError::NoCardLoaded));
        }

        if (emulationSession.snapshot().emulating)
        {
            return etl::unexpected(error::Error::fromEmulation(error::EmulationError::AlreadyEmulating));
        }

        uint16_t original = decodeOriginalBalance();
        emulationSession.start(original);

        char line[limits::NARRATIVE_LINE_MAX];
        std::snprintf(line, sizeof(line), "Emulation started | Mode: %s | Provider: %s | Balance: %s",
                      WritePolicyGate::shortName(emulationSession.writePolicy().mode()).data(),
                      ProviderDetector::name(cardProvider).data(),
                      BalanceDecoder::formatCents(original).c_str());
        narrative.write(line);
        return {};
    }

    etl::expected<SessionSummary, error::Error> EmulationController::stopEmulation()
    {
        SessionSnapshot snap;
        {
            // No reader command may straddle the stop
            std::lock_guard<std::mutex> cardGuard(cardEmulator.mutex());
            snap = emulationSession.snapshot();
            if (!snap.emulating)
            {
                return etl::unexpected(error::Error::fromEmulation(error::EmulationError::NotEmulating));
            }
            emulationSession.stop();
        }

        SessionSummary summary;
        summary.counters = snap.counters;
        summary.originalBalance = snap.originalBalance;
        summary.currentBalance = snap.currentBalance;
        summary.charge = static_cast<int32_t>(snap.originalBalance) - static_cast<int32_t>(snap.currentBalance);
        summary.transactionCount = snap.transactionCount;
        summary.credentialCount = snap.credentialCount;

        char line[limits::NARRATIVE_LINE_MAX];
        std::snprintf(line, sizeof(line), "Emulation stopped | Auths: %lu R:%lu W:%lu | Charge: %ld cents",
                      static_cast<unsigned long>(summary.counters.authenticateCount),
                      static_cast<unsigned long>(summary.counters.readCount),
                      static_cast<unsigned long>(summary.counters.writeCount),
                      static_cast<long>(summary.charge));
        narrative.write(line);
        return summary;
    }

    WritePolicyMode EmulationController::toggleWritePolicy()
    {
        return emulationSession.toggleWritePolicy();
    }

    etl::expected<size_t, error::Error> EmulationController::exportCredentials()
    {
        // Copy under the lock, write after releasing it
        CredentialStore captured = emulationSession.copyCredentials();

        auto result = exporter.exportCredentials(captured);
        char line[limits::NARRATIVE_LINE_MAX];
        if (result.has_value())
        {
            std::snprintf(line, sizeof(line), "Saved %u captured keys to %.*s",
                          static_cast<unsigned>(result.value()),
                          static_cast<int>(exporter.path().size()), exporter.path().data());
        }
        else
        {
            std::snprintf(line, sizeof(line), "Key export failed: %s", result.error().toString().c_str());
        }
        narrative.write(line);
        return result;
    }

    void EmulationController::resetSession()
    {
        emulationSession.reset();
        narrative.write("Session reset");
    }

    etl::expected<size_t, error::Error> EmulationController::shutdown()
    {
        if (emulationSession.snapshot().emulating)
        {
            auto summary = stopEmulation();
            if (!summary.has_value())
            {
                LOG_WARN("Stop during shutdown failed: %s", summary.error().toString().c_str());
            }
        }

        return exportCredentials();
    }

    etl::optional<SessionSnapshot> EmulationController::trySnapshot() const
    {
        return emulationSession.trySnapshot();
    }

    bool EmulationController::tryCopyTransactionLog(TransactionLog& out) const
    {
        return emulationSession.tryCopyTransactionLog(out);
    }

    bool EmulationController::tryCopyCredentials(CredentialStore& out) const
    {
        return emulationSession.tryCopyCredentials(out);
    }

    IEmulationHandler& EmulationController::handler()
    {
        return engine;
    }

    CardEmulator& EmulationController::emulator()
    {
        return cardEmulator;
    }

    const VirtualCard& EmulationController::card() const
    {
        return virtualCard;
    }

    CardProvider EmulationController::provider() const
    {
        return cardProvider;
    }

    const EmulationSession& EmulationController::session() const
    {
        return emulationSession;
    }

    uint16_t EmulationController::decodeOriginalBalance() const
    {
        const uint8_t primary = decoder.primaryBlock();
        if (!virtualCard.isBlockLoaded(primary))
        {
            LOG_WARN("Balance block %u not present in image, starting at $0.00", primary);
            return 0;
        }

        auto block = virtualCard.readBlock(primary);
        if (!block.has_value())
        {
            return 0;
        }

        auto value = BalanceDecoder::decodeValidated(block.value());
        if (!value.has_value())
        {
            LOG_WARN("Balance block %u fails the inverse check, starting at $0.00", primary);
            return 0;
        }

        return value.value();
    }

} // namespace shadow
