#include <gtest/gtest.h>
#include "Shadow/Emulation/BalanceDecoder.h"
#include "TestDoubles.h"

using namespace shadow;
using testing_support::makeBlock;
using testing_support::makeValueBlock;

TEST(BalanceDecoderTests, DefaultBalanceBlocks)
{
    BalanceDecoder decoder;

    EXPECT_TRUE(decoder.isBalanceBlock(4));
    EXPECT_TRUE(decoder.isBalanceBlock(8));
    EXPECT_FALSE(decoder.isBalanceBlock(5));
    EXPECT_FALSE(decoder.isBalanceBlock(0));
    EXPECT_EQ(decoder.primaryBlock(), 4);
}

TEST(BalanceDecoderTests, ConfiguredBalanceBlocks)
{
    BalanceDecoder::BlockList blocks;
    blocks.push_back(12);
    BalanceDecoder decoder(blocks);

    EXPECT_TRUE(decoder.isBalanceBlock(12));
    EXPECT_FALSE(decoder.isBalanceBlock(4));
    EXPECT_EQ(decoder.primaryBlock(), 12);
}

TEST(BalanceDecoderTests, EmptyListSelectsDefaults)
{
    BalanceDecoder decoder{BalanceDecoder::BlockList()};

    EXPECT_TRUE(decoder.isBalanceBlock(4));
    EXPECT_TRUE(decoder.isBalanceBlock(8));
}

TEST(BalanceDecoderTests, DecodesLittleEndianValue)
{
    EXPECT_EQ(BalanceDecoder::decodeValue(makeBlock({0x64, 0x00})), 100);
    EXPECT_EQ(BalanceDecoder::decodeValue(makeBlock({0xE8, 0x03})), 1000);
    EXPECT_EQ(BalanceDecoder::decodeValue(makeBlock({0xFF, 0xFF})), 65535);
}

TEST(BalanceDecoderTests, ValidatedDecodeChecksInverse)
{
    auto value = BalanceDecoder::decodeValidated(makeValueBlock(2500, 3));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 2500);

    auto counter = BalanceDecoder::decodeCounter(makeValueBlock(2500, 3));
    ASSERT_TRUE(counter.has_value());
    EXPECT_EQ(counter.value(), 3);

    Block tampered = makeValueBlock(2500, 3);
    tampered[0] = 0x00;
    EXPECT_FALSE(BalanceDecoder::decodeValidated(tampered).has_value());
    EXPECT_FALSE(BalanceDecoder::decodeValidated(makeBlock({0x64, 0x00})).has_value());
}

TEST(BalanceDecoderTests, FormatsCents)
{
    EXPECT_STREQ(BalanceDecoder::formatCents(0).c_str(), "$0.00");
    EXPECT_STREQ(BalanceDecoder::formatCents(100).c_str(), "$1.00");
    EXPECT_STREQ(BalanceDecoder::formatCents(1250).c_str(), "$12.50");
    EXPECT_STREQ(BalanceDecoder::formatCents(65535).c_str(), "$655.35");
}
