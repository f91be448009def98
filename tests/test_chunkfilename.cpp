#include <gtest/gtest.h>
#include "chunkfilename.h"

TEST(ChunkFileNameTest, FormatJoinsTimestamps)
{
    EXPECT_EQ(ChunkFileName::format(1700000000, 1700000900), "1700000000_1700000900.mp4");
    EXPECT_EQ(ChunkFileName::format(5, 10, "mkv"), "5_10.mkv");
}

TEST(ChunkFileNameTest, ParseRecoversRange)
{
    std::optional<ChunkTimeRange> range = ChunkFileName::parse("/var/rec/1700000000_1700000900.mp4");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->startTs, 1700000000);
    EXPECT_EQ(range->endTs, 1700000900);
    EXPECT_EQ(range->extension, "mp4");
}

TEST(ChunkFileNameTest, ParseAcceptsZeroLengthChunk)
{
    std::optional<ChunkTimeRange> range = ChunkFileName::parse("42_42.mp4");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->startTs, range->endTs);
}

TEST(ChunkFileNameTest, ParseRejectsMalformedNames)
{
    EXPECT_FALSE(ChunkFileName::parse("notes.txt").has_value());
    EXPECT_FALSE(ChunkFileName::parse("100_200").has_value());
    EXPECT_FALSE(ChunkFileName::parse("100-200.mp4").has_value());
    EXPECT_FALSE(ChunkFileName::parse("-100_200.mp4").has_value());
    EXPECT_FALSE(ChunkFileName::parse("100_200_300.mp4").has_value());
    EXPECT_FALSE(ChunkFileName::parse("abc_200.mp4").has_value());
    EXPECT_FALSE(ChunkFileName::parse("300_200.mp4").has_value());
    EXPECT_FALSE(ChunkFileName::parse("").has_value());
}
