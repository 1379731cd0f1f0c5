#include <gtest/gtest.h>
#include "Shadow/Emulation/TransactionLog.h"
#include "TestDoubles.h"

using namespace shadow;
using testing_support::makeBlock;

namespace
{
    TransactionLogEntry readEntry(uint8_t blockIndex, uint32_t timestamp)
    {
        TransactionLogEntry entry;
        entry.blockIndex = blockIndex;
        entry.operation = TransactionOperation::Read;
        entry.payload = makeBlock({blockIndex});
        entry.timestamp = timestamp;
        return entry;
    }
}

TEST(TransactionLogTests, StartsEmpty)
{
    TransactionLog log;

    EXPECT_TRUE(log.empty());
    EXPECT_FALSE(log.full());
    EXPECT_EQ(log.size(), 0U);
    EXPECT_EQ(TransactionLog::capacity(), 64U);
}

TEST(TransactionLogTests, KeepsAppendOrder)
{
    TransactionLog log;

    ASSERT_TRUE(log.append(readEntry(4, 100)));
    ASSERT_TRUE(log.append(readEntry(5, 100)));
    ASSERT_TRUE(log.append(readEntry(6, 99)));

    ASSERT_EQ(log.size(), 3U);
    EXPECT_EQ(log.at(0).blockIndex, 4);
    EXPECT_EQ(log.at(1).blockIndex, 5);
    EXPECT_EQ(log.at(2).blockIndex, 6);
    EXPECT_EQ(log.at(2).timestamp, 99U);
}

TEST(TransactionLogTests, DropsNewestWhenFull)
{
    TransactionLog log;
    for (uint8_t i = 0; i < 64; ++i)
    {
        ASSERT_TRUE(log.append(readEntry(i, i)));
    }
    ASSERT_TRUE(log.full());

    TransactionLog before = log;

    EXPECT_FALSE(log.append(readEntry(1, 1000)));
    EXPECT_FALSE(log.append(readEntry(2, 1001)));

    ASSERT_EQ(log.size(), 64U);
    for (size_t i = 0; i < log.size(); ++i)
    {
        EXPECT_EQ(log.at(i).blockIndex, before.at(i).blockIndex);
        EXPECT_EQ(log.at(i).timestamp, before.at(i).timestamp);
        EXPECT_EQ(log.at(i).payload, before.at(i).payload);
    }
    EXPECT_EQ(log.at(63).blockIndex, 63);
}

TEST(TransactionLogTests, ClearAllowsAppendingAgain)
{
    TransactionLog log;
    for (uint8_t i = 0; i < 64; ++i)
    {
        log.append(readEntry(i, i));
    }

    log.clear();

    EXPECT_TRUE(log.empty());
    EXPECT_TRUE(log.append(readEntry(9, 9)));
    EXPECT_EQ(log.size(), 1U);
}

TEST(TransactionLogTests, OperationNames)
{
    EXPECT_EQ(operationName(TransactionOperation::Read), etl::string_view("READ"));
    EXPECT_EQ(operationName(TransactionOperation::Write), etl::string_view("WRITE"));
    EXPECT_EQ(operationName(TransactionOperation::Authenticate), etl::string_view("AUTH"));
}
