#include <gtest/gtest.h>
#include "Error/Error.h"

using namespace error;

// Test: Error creation from different layers
TEST(ErrorTest, CreateFromCard) {
    Error err = Error::fromCard(CardError::BlockOutOfRange);

    EXPECT_TRUE(err.is<CardError>());
    EXPECT_FALSE(err.is<StorageError>());
    EXPECT_EQ(err.getLayer(), ErrorLayer::Card);

    auto cardErr = err.get<CardError>();
    EXPECT_EQ(cardErr, CardError::BlockOutOfRange);
}

TEST(ErrorTest, CreateFromStorage) {
    Error err = Error::fromStorage(StorageError::WriteFailed);

    EXPECT_TRUE(err.is<StorageError>());
    EXPECT_FALSE(err.is<EmulationError>());
    EXPECT_EQ(err.getLayer(), ErrorLayer::Storage);
}

TEST(ErrorTest, CreateFromEmulation) {
    Error err = Error::fromEmulation(EmulationError::NoCardLoaded);

    EXPECT_TRUE(err.is<EmulationError>());
    EXPECT_EQ(err.get<EmulationError>(), EmulationError::NoCardLoaded);
}

// Test: toString renders "<Layer> Error: <Name>"
TEST(ErrorTest, ToStringStorage) {
    Error err = Error::fromStorage(StorageError::OpenFailed);
    auto str = err.toString();

    EXPECT_STREQ(str.c_str(), "Storage Error: OpenFailed");
}

TEST(ErrorTest, ToStringCard) {
    Error err = Error::fromCard(CardError::EmptyImage);

    EXPECT_STREQ(err.toString().c_str(), "Card Error: EmptyImage");
}

TEST(ErrorTest, ToStringEmulation) {
    Error err = Error::fromEmulation(EmulationError::AlreadyEmulating);

    EXPECT_STREQ(err.toString().c_str(), "Emulation Error: AlreadyEmulating");
}

// Test: Different error values
TEST(ErrorTest, DifferentValues) {
    Error err1 = Error::fromStorage(StorageError::ReadFailed);
    Error err2 = Error::fromStorage(StorageError::FileTooLarge);

    EXPECT_NE(err1.get<StorageError>(), err2.get<StorageError>());
}
