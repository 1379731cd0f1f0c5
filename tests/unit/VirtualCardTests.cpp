#include <gtest/gtest.h>
#include "Shadow/Card/VirtualCard.h"
#include "TestDoubles.h"

using namespace shadow;
using testing_support::makeBlock;

TEST(VirtualCardTests, NewCardIsEmpty)
{
    VirtualCard card;

    EXPECT_TRUE(card.isEmpty());
    EXPECT_EQ(card.loadedBlockCount(), 0U);
    EXPECT_TRUE(card.getUid().empty());

    auto block = card.readBlock(10);
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block.value(), Block{});
}

TEST(VirtualCardTests, WriteThenRead)
{
    VirtualCard card;
    Block data = makeBlock({0xDE, 0xAD, 0xBE, 0xEF});

    ASSERT_TRUE(card.writeBlock(63, data).has_value());

    EXPECT_TRUE(card.isBlockLoaded(63));
    EXPECT_FALSE(card.isEmpty());
    EXPECT_EQ(card.readBlock(63).value(), data);
}

TEST(VirtualCardTests, OutOfRangeIndexRejected)
{
    VirtualCard card;

    auto read = card.readBlock(64);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().get<error::CardError>(), error::CardError::BlockOutOfRange);

    auto write = card.writeBlock(255, Block{});
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error().get<error::CardError>(), error::CardError::BlockOutOfRange);

    EXPECT_FALSE(card.isBlockLoaded(64));
    EXPECT_TRUE(card.isEmpty());
}

TEST(VirtualCardTests, ClearForgetsEverything)
{
    VirtualCard card;
    ASSERT_TRUE(card.writeBlock(1, makeBlock({0x01})).has_value());
    card.setUid("04AABBCC");

    card.clear();

    EXPECT_TRUE(card.isEmpty());
    EXPECT_TRUE(card.getUid().empty());
    EXPECT_EQ(card.readBlock(1).value(), Block{});
}
