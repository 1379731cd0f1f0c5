#include <gtest/gtest.h>
#include "Shadow/Emulation/CredentialStore.h"
#include "TestDoubles.h"

using namespace shadow;
using testing_support::makeKey;

TEST(CredentialStoreTests, RecordsNewKey)
{
    CredentialStore store;
    auto key = makeKey(0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF);

    EXPECT_EQ(store.record(1, KeyKind::B, key), CaptureOutcome::Recorded);

    ASSERT_EQ(store.size(), 1U);
    EXPECT_EQ(store.at(0).sector, 1);
    EXPECT_EQ(store.at(0).keyKind, KeyKind::B);
    EXPECT_EQ(store.at(0).keyBytes, key);
    EXPECT_TRUE(store.contains(key));
}

TEST(CredentialStoreTests, IdentityIsKeyBytesOnly)
{
    CredentialStore store;
    auto key = makeKey(0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF);

    store.record(1, KeyKind::B, key);
    EXPECT_EQ(store.record(2, KeyKind::A, key), CaptureOutcome::Duplicate);
    EXPECT_EQ(store.record(1, KeyKind::B, key), CaptureOutcome::Duplicate);

    ASSERT_EQ(store.size(), 1U);
    EXPECT_EQ(store.at(0).sector, 1);
    EXPECT_EQ(store.at(0).keyKind, KeyKind::B);
}

TEST(CredentialStoreTests, SameSectorDifferentKeysAreDistinct)
{
    CredentialStore store;

    store.record(3, KeyKind::A, makeKey(0, 0, 0, 0, 0, 1));
    store.record(3, KeyKind::A, makeKey(0, 0, 0, 0, 0, 2));

    EXPECT_EQ(store.size(), 2U);
}

TEST(CredentialStoreTests, DropsDistinctKeysBeyondCapacity)
{
    CredentialStore store;
    for (uint8_t i = 0; i < 16; ++i)
    {
        ASSERT_EQ(store.record(i, KeyKind::A, makeKey(0x10, 0, 0, 0, 0, i)), CaptureOutcome::Recorded);
    }

    EXPECT_EQ(store.record(0, KeyKind::B, makeKey(0x20, 0, 0, 0, 0, 0)), CaptureOutcome::Dropped);
    EXPECT_EQ(store.record(0, KeyKind::B, makeKey(0x10, 0, 0, 0, 0, 5)), CaptureOutcome::Duplicate);

    ASSERT_EQ(store.size(), 16U);
    EXPECT_TRUE(store.full());
    EXPECT_FALSE(store.contains(makeKey(0x20, 0, 0, 0, 0, 0)));
    // First-seen entries keep their positions
    for (uint8_t i = 0; i < 16; ++i)
    {
        EXPECT_EQ(store.at(i).keyBytes[5], i);
    }
}

TEST(CredentialStoreTests, ClearEmptiesStore)
{
    CredentialStore store;
    store.record(1, KeyKind::A, makeKey(1, 2, 3, 4, 5, 6));

    store.clear();

    EXPECT_TRUE(store.empty());
    EXPECT_FALSE(store.contains(makeKey(1, 2, 3, 4, 5, 6)));
}
