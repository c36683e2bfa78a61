#include <gtest/gtest.h>
#include "Utils/Hex.h"

TEST(HexTests, ParsesWithSeparators)
{
    etl::vector<uint8_t, 8> bytes;
    ASSERT_TRUE(utils::parseHex("3f 00:7F10", bytes));
    ASSERT_EQ(bytes.size(), 4U);
    EXPECT_EQ(bytes[0], 0x3F);
    EXPECT_EQ(bytes[1], 0x00);
    EXPECT_EQ(bytes[2], 0x7F);
    EXPECT_EQ(bytes[3], 0x10);
}

TEST(HexTests, RejectsOddDigitCount)
{
    etl::vector<uint8_t, 8> bytes;
    EXPECT_FALSE(utils::parseHex("3F0", bytes));
}

TEST(HexTests, RejectsInvalidCharacter)
{
    etl::vector<uint8_t, 8> bytes;
    EXPECT_FALSE(utils::parseHex("3G00", bytes));
}

TEST(HexTests, RejectsCapacityOverflow)
{
    etl::vector<uint8_t, 2> bytes;
    EXPECT_FALSE(utils::parseHex("010203", bytes));
}

TEST(HexTests, FormatsUpperCase)
{
    etl::vector<uint8_t, 4> bytes;
    bytes.push_back(0xA0);
    bytes.push_back(0x0f);

    etl::string<16> text;
    utils::appendHex(text, bytes);
    EXPECT_STREQ(text.c_str(), "A00F");
}

TEST(HexTests, MarksTruncatedOutput)
{
    const uint8_t bytes[] = {0xAA, 0xBB, 0xCC, 0xDD};

    etl::string<6> text;
    utils::appendHex(text, bytes, sizeof(bytes));
    EXPECT_STREQ(text.c_str(), "AABB..");
}

TEST(HexTests, ReadsBigEndian)
{
    const uint8_t bytes[] = {0x7F, 0xFF};
    EXPECT_EQ(utils::readUint16(bytes), 0x7FFF);
}
