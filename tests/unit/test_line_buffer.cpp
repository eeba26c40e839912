#include "../../src/internal/line_buffer.hpp"

#include <gtest/gtest.h>
#include <mcpmgr/errors.hpp>

using namespace mcpmgr;
using mcpmgr::internal::LineBuffer;

TEST(LineBufferTest, SplitsCompleteLines)
{
    LineBuffer buffer;
    auto lines = buffer.add_data("{\"a\":1}\n{\"b\":2}\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "{\"a\":1}");
    EXPECT_EQ(lines[1], "{\"b\":2}");
    EXPECT_FALSE(buffer.has_buffered_data());
}

TEST(LineBufferTest, KeepsPartialLineUntilNewline)
{
    LineBuffer buffer;
    EXPECT_TRUE(buffer.add_data("{\"id\":").empty());
    EXPECT_TRUE(buffer.has_buffered_data());

    auto lines = buffer.add_data("1}\n{\"id\"");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "{\"id\":1}");
    EXPECT_TRUE(buffer.has_buffered_data());
}

TEST(LineBufferTest, StripsCarriageReturnAndSkipsBlankLines)
{
    LineBuffer buffer;
    auto lines = buffer.add_data("one\r\n\n   \r\ntwo\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
}

TEST(LineBufferTest, OversizedLineThrowsAndResets)
{
    LineBuffer buffer(16);
    EXPECT_THROW(buffer.add_data(std::string(32, 'x')), JSONDecodeError);
    EXPECT_FALSE(buffer.has_buffered_data());

    // Usable again afterwards
    auto lines = buffer.add_data("ok\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "ok");
}

TEST(LineBufferTest, RemainderAtEndOfStream)
{
    LineBuffer buffer;
    buffer.add_data("done\n{\"last\":true}");

    auto rest = buffer.take_remainder();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(*rest, "{\"last\":true}");
    EXPECT_FALSE(buffer.take_remainder().has_value());
}
