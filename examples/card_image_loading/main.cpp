/**
 * @file main.cpp
 * @author ShadowCard developers
 * @brief Card image example - loads an .nfc dump and shows what the engine will see
 * @version 0.1
 * @date 2026-03-08
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include <iostream>
#include "Shadow/Card/CardImageParser.h"
#include "Shadow/Card/ProviderDetector.h"
#include "Shadow/Emulation/BalanceDecoder.h"
#include "Shadow/Storage/FileStorage.h"
#include "Utils/Logging.h"

using namespace shadow;

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cout << "Usage: " << argv[0] << " <card.nfc>" << std::endl;
        return 1;
    }

    FileStorage storage;
    auto text = storage.readFile(argv[1]);
    if (!text.has_value())
    {
        LOG_ERROR("Could not read %s: %s", argv[1], text.error().toString().c_str());
        return 1;
    }

    auto card = CardImageParser::parse(etl::string_view(text.value().data(), text.value().size()));
    if (!card.has_value())
    {
        LOG_ERROR("Could not parse %s: %s", argv[1], card.error().toString().c_str());
        return 1;
    }

    const VirtualCard& image = card.value();
    std::cout << "UID:      " << (image.getUid().empty() ? "unknown" : image.getUid().c_str()) << std::endl;
    std::cout << "Blocks:   " << image.loadedBlockCount() << " / " << limits::BLOCK_COUNT << std::endl;
    std::cout << "Provider: " << ProviderDetector::name(ProviderDetector::detect(image)).data() << std::endl;

    BalanceDecoder decoder;
    for (uint8_t blockIndex : decoder.balanceBlocks())
    {
        if (!image.isBlockLoaded(blockIndex))
        {
            std::cout << "Block " << static_cast<unsigned>(blockIndex) << ": not in image" << std::endl;
            continue;
        }

        auto block = image.readBlock(blockIndex);
        if (!block.has_value())
        {
            continue;
        }

        auto value = BalanceDecoder::decodeValidated(block.value());
        auto counter = BalanceDecoder::decodeCounter(block.value());
        std::cout << "Block " << static_cast<unsigned>(blockIndex) << ": ";
        if (value.has_value())
        {
            std::cout << BalanceDecoder::formatCents(value.value()).c_str() << " [VALID]";
        }
        else
        {
            std::cout << BalanceDecoder::formatCents(BalanceDecoder::decodeValue(block.value())).c_str()
                      << " [INVALID CHECKSUM]";
        }
        if (counter.has_value())
        {
            std::cout << ", counter " << counter.value();
        }
        std::cout << std::endl;
    }

    return 0;
}
