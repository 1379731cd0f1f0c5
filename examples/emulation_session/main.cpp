/**
 * @file main.cpp
 * @author ShadowCard developers
 * @brief Emulation session example - scripted reader taps against a virtual card
 * @version 0.1
 * @date 2026-03-08
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include <atomic>
#include <iostream>
#include <thread>
#include "Shadow/Card/VirtualCard.h"
#include "Shadow/Emulation/ConsoleNarrativeLog.h"
#include "Shadow/Emulation/EmulationController.h"
#include "Shadow/Storage/FileStorage.h"
#include "Utils/Logging.h"
#include "Utils/Timing.h"

using namespace shadow;

namespace
{
    const SectorKey READER_KEY_A = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    const SectorKey READER_KEY_B = {0xEE, 0xB7, 0x06, 0xFC, 0x71, 0x4F};

    void printSeparator(const char* title = nullptr)
    {
        std::cout << "\n";
        std::cout << "========================================" << std::endl;
        if (title)
        {
            std::cout << "  " << title << std::endl;
            std::cout << "========================================" << std::endl;
        }
    }

    Block valueBlock(uint16_t cents, uint16_t counter)
    {
        Block block{};
        block[0] = static_cast<uint8_t>(cents & 0xFF);
        block[1] = static_cast<uint8_t>(cents >> 8);
        block[2] = static_cast<uint8_t>(counter & 0xFF);
        block[3] = static_cast<uint8_t>(counter >> 8);
        block[4] = static_cast<uint8_t>(~block[0]);
        block[5] = static_cast<uint8_t>(~block[1]);
        block[6] = static_cast<uint8_t>(~block[2]);
        block[7] = static_cast<uint8_t>(~block[3]);
        return block;
    }

    bool loadBlock(VirtualCard& card, uint8_t blockIndex, const Block& data)
    {
        auto result = card.writeBlock(blockIndex, data);
        if (!result.has_value())
        {
            LOG_ERROR("Block %u: %s", blockIndex, result.error().toString().c_str());
            return false;
        }
        return true;
    }

    VirtualCard makeLaundryCard()
    {
        VirtualCard card;
        card.setUid("04A1B2C3");

        Block signature{};
        signature[0] = 0x01;
        signature[1] = 0x01;
        loadBlock(card, 2, signature);

        Block balance = valueBlock(1000, 7);    // $10.00
        loadBlock(card, 4, balance);
        loadBlock(card, 8, balance);

        Block trailer{};
        trailer.fill(0xFF);
        for (uint8_t sector = 0; sector < 16; ++sector)
        {
            loadBlock(card, static_cast<uint8_t>(sector * limits::BLOCKS_PER_SECTOR + 3), trailer);
        }
        return card;
    }

    // One vend: read the value block, then debit it by the price
    void readerTap(CardEmulator& emulator, uint16_t price)
    {
        if (!emulator.authenticate(4, KeyKind::A, READER_KEY_A))
        {
            return;
        }
        auto current = emulator.read(4);
        if (!current.has_value())
        {
            LOG_ERROR("Reader could not read balance block");
            return;
        }

        uint16_t balance = BalanceDecoder::decodeValue(current.value());
        uint16_t counter = BalanceDecoder::decodeCounter(current.value()).value_or(0);
        uint16_t debited = balance >= price ? static_cast<uint16_t>(balance - price) : 0;

        if (!emulator.authenticate(4, KeyKind::B, READER_KEY_B))
        {
            return;
        }
        bool acknowledged = emulator.write(4, valueBlock(debited, static_cast<uint16_t>(counter + 1)));
        std::cout << (acknowledged ? "+ Reader write acknowledged" : "- Reader write refused") << std::endl;
    }

    void printSnapshot(const SessionSnapshot& snap)
    {
        std::cout << "Mode: " << WritePolicyGate::shortName(snap.mode).data()
                  << " | Balance: " << BalanceDecoder::formatCents(snap.currentBalance).c_str()
                  << " (was " << BalanceDecoder::formatCents(snap.originalBalance).c_str() << ")"
                  << " | Auths: " << snap.counters.authenticateCount
                  << " R:" << snap.counters.readCount
                  << " W:" << snap.counters.writeCount
                  << " | Keys: " << snap.credentialCount << std::endl;
    }
}

int main()
{
    FileStorage storage;
    ConsoleNarrativeLog narrative;
    EmulationOptions options;
    options.exportPath = "captured_keys.txt";

    EmulationController controller(storage, narrative, options);

    printSeparator("Load Card");
    auto loaded = controller.loadCard(makeLaundryCard());
    if (!loaded.has_value())
    {
        LOG_ERROR("Load failed: %s", loaded.error().toString().c_str());
        return 1;
    }

    auto started = controller.startEmulation();
    if (!started.has_value())
    {
        LOG_ERROR("Start failed: %s", started.error().toString().c_str());
        return 1;
    }

    // Display context: polls without ever blocking the reader
    std::atomic<bool> running{true};
    std::thread display([&controller, &running]() {
        while (running.load())
        {
            auto snap = controller.trySnapshot();
            if (snap.has_value())
            {
                printSnapshot(snap.value());
            }

            TransactionLog log;
            if (controller.tryCopyTransactionLog(log) && !log.empty())
            {
                const TransactionLogEntry& last = log.at(log.size() - 1);
                std::cout << "  last: " << operationName(last.operation).data()
                          << " Block " << static_cast<unsigned>(last.blockIndex)
                          << " @" << last.timestamp << "ms" << std::endl;
            }

            CredentialStore keys;
            if (controller.tryCopyCredentials(keys))
            {
                for (const auto& key : keys.credentials())
                {
                    std::cout << "  key: " << CredentialExporter::formatLine(key).c_str();
                }
            }
            utils::delay_ms(50);
        }
    });

    printSeparator("Testing Mode (writes suppressed)");
    readerTap(controller.emulator(), 175);
    readerTap(controller.emulator(), 175);
    utils::delay_ms(100);

    printSeparator("Normal Mode (writes applied)");
    controller.toggleWritePolicy();
    readerTap(controller.emulator(), 175);
    utils::delay_ms(100);

    running.store(false);
    display.join();

    printSeparator("Summary");
    auto summary = controller.stopEmulation();
    if (summary.has_value())
    {
        std::cout << "Transactions logged: " << summary.value().transactionCount << std::endl;
        std::cout << "Charge observed: " << summary.value().charge << " cents" << std::endl;
    }

    auto stored = controller.card().readBlock(4);
    if (stored.has_value())
    {
        std::cout << "Card balance block now holds "
                  << BalanceDecoder::formatCents(BalanceDecoder::decodeValue(stored.value())).c_str() << std::endl;
    }

    auto exported = controller.shutdown();
    if (!exported.has_value())
    {
        LOG_ERROR("Export failed: %s", exported.error().toString().c_str());
        return 1;
    }

    std::cout << "Exported " << exported.value() << " keys to " << options.exportPath.c_str() << std::endl;
    return 0;
}
