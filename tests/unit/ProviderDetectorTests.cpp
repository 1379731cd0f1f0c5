#include <gtest/gtest.h>
#include "Shadow/Card/ProviderDetector.h"
#include "TestDoubles.h"

using namespace shadow;
using testing_support::makeBlock;

TEST(ProviderDetectorTests, EmptyCardIsUnknown)
{
    VirtualCard card;

    EXPECT_EQ(ProviderDetector::detect(card), CardProvider::Unknown);
    EXPECT_EQ(ProviderDetector::name(CardProvider::Unknown), etl::string_view("Unknown"));
}

TEST(ProviderDetectorTests, CscSignatureInBlockTwo)
{
    VirtualCard card;
    ASSERT_TRUE(card.writeBlock(2, makeBlock({0x01, 0x01, 0x00, 0x00})).has_value());

    EXPECT_EQ(ProviderDetector::detect(card), CardProvider::CscServiceWorks);
    EXPECT_EQ(ProviderDetector::name(CardProvider::CscServiceWorks), etl::string_view("CSC ServiceWorks"));
}

TEST(ProviderDetectorTests, UBestWashTextInBlockOne)
{
    VirtualCard card;
    ASSERT_TRUE(card.writeBlock(1, makeBlock({0x00, 0x00, 'U', 'B', 'E', 'S', 'T', 'W', 'A', 'S', 'H', 0x00})).has_value());

    EXPECT_EQ(ProviderDetector::detect(card), CardProvider::UBestWash);
    EXPECT_EQ(ProviderDetector::name(CardProvider::UBestWash), etl::string_view("U-Best Wash"));
}

TEST(ProviderDetectorTests, PartialSignaturesAreUnknown)
{
    VirtualCard card;
    ASSERT_TRUE(card.writeBlock(2, makeBlock({0x01, 0x02})).has_value());
    ASSERT_TRUE(card.writeBlock(1, makeBlock({'U', 'B', 'E', 'S', 'T'})).has_value());

    EXPECT_EQ(ProviderDetector::detect(card), CardProvider::Unknown);
}
