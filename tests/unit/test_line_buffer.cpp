#include "../../src/internal/line_buffer.hpp"

#include <bridge/errors.hpp>
#include <gtest/gtest.h>

using namespace bridge::protocol;

TEST(LineBufferTest, SingleCompleteLine)
{
    LineBuffer buffer;
    auto lines = buffer.add_data("{\"id\":1}\n");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "{\"id\":1}");
    EXPECT_FALSE(buffer.has_buffered_data());
}

TEST(LineBufferTest, LineSplitAcrossChunks)
{
    LineBuffer buffer;

    EXPECT_TRUE(buffer.add_data("{\"event\":\"re").empty());
    EXPECT_TRUE(buffer.has_buffered_data());
    EXPECT_TRUE(buffer.add_data("ady\",\"data\"").empty());

    auto lines = buffer.add_data(":{}}\n{\"id\"");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "{\"event\":\"ready\",\"data\":{}}");
    EXPECT_TRUE(buffer.has_buffered_data());
}

TEST(LineBufferTest, SeveralLinesInOneChunk)
{
    LineBuffer buffer;
    auto lines = buffer.add_data("a\nb\nc\n");

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "c");
}

TEST(LineBufferTest, StripsCarriageReturnAndSkipsBlankLines)
{
    LineBuffer buffer;
    auto lines = buffer.add_data("first\r\n\r\n   \nsecond\n\n");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
}

TEST(LineBufferTest, RemainderAtEndOfStream)
{
    LineBuffer buffer;
    EXPECT_TRUE(buffer.add_data("{\"id\":9,\"result\":1}").empty());

    auto rest = buffer.take_remainder();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(*rest, "{\"id\":9,\"result\":1}");
    EXPECT_FALSE(buffer.take_remainder().has_value());
}

TEST(LineBufferTest, NoLimitByDefault)
{
    LineBuffer buffer;
    std::string big(3 * 1024 * 1024, 'x');

    EXPECT_TRUE(buffer.add_data(big).empty());
    EXPECT_FALSE(buffer.overflowed());

    auto lines = buffer.add_data("\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].size(), big.size());
}

TEST(LineBufferTest, OverflowKeepsCompletedLinesThenRejectsData)
{
    LineBuffer buffer(16);

    // Lines finished by the overflowing chunk are still handed out
    auto lines = buffer.add_data("ok\n" + std::string(40, 'x'));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "ok");
    EXPECT_TRUE(buffer.overflowed());
    EXPECT_FALSE(buffer.has_buffered_data());

    EXPECT_THROW(buffer.add_data("x\nnext\n"), bridge::MessageFramingError);
    EXPECT_FALSE(buffer.take_remainder().has_value());
}

TEST(LineBufferTest, ClearBufferResetsOverflow)
{
    LineBuffer buffer(8);
    buffer.add_data(std::string(20, 'y'));
    ASSERT_TRUE(buffer.overflowed());

    buffer.clear_buffer();
    EXPECT_FALSE(buffer.overflowed());

    auto lines = buffer.add_data("short\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "short");
}

TEST(LineBufferTest, LineAtTheLimitIsAccepted)
{
    LineBuffer buffer(8);
    EXPECT_TRUE(buffer.add_data(std::string(8, 'z')).empty());
    EXPECT_FALSE(buffer.overflowed());
    EXPECT_EQ(buffer.add_data("\n").size(), 1u);
}

TEST(LineBufferTest, ClearBuffer)
{
    LineBuffer buffer;
    buffer.add_data("partial");
    EXPECT_TRUE(buffer.has_buffered_data());

    buffer.clear_buffer();
    EXPECT_FALSE(buffer.has_buffered_data());
    EXPECT_FALSE(buffer.take_remainder().has_value());
}
