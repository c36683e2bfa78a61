#include <gtest/gtest.h>
#include "SimTrace/Apdu/StatusWord.h"

using namespace simtrace;

TEST(StatusWordTests, DescribesNormalEnding)
{
    etl::string<64> text;
    describeStatusWord(0x90, 0x00, text);
    EXPECT_STREQ(text.c_str(), "normal ending of the command");
}

TEST(StatusWordTests, DescribesFileNotFound)
{
    etl::string<64> text;
    describeStatusWord(0x6A, 0x82, text);
    EXPECT_STREQ(text.c_str(), "file not found");
}

TEST(StatusWordTests, DescribesParameterInSw2)
{
    etl::string<64> text;
    describeStatusWord(0x61, 0x1C, text);
    EXPECT_STREQ(text.c_str(), "28 response bytes available");

    text.clear();
    describeStatusWord(0x63, 0xC2, text);
    EXPECT_STREQ(text.c_str(), "verification failed, 2 retries left");
}

TEST(StatusWordTests, DescribesUnknown)
{
    etl::string<64> text;
    describeStatusWord(0x12, 0x34, text);
    EXPECT_STREQ(text.c_str(), "unknown status");
}

TEST(StatusWordTests, RetriesOnlyFor63Cx)
{
    EXPECT_EQ(retriesFromStatusWord(0x63, 0xC3), 3);
    EXPECT_EQ(retriesFromStatusWord(0x63, 0xC0), 0);
    EXPECT_EQ(retriesFromStatusWord(0x63, 0x00), -1);
    EXPECT_EQ(retriesFromStatusWord(0x90, 0x00), -1);
}
