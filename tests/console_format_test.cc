#include "exifnote/console_format.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace exifnote {

TEST(ConsoleFormat, PlainTextPassesThrough)
{
    std::string out = "x=";
    EXPECT_FALSE(append_console_escaped_ascii("IMG_0001.jpg", 0, &out));
    EXPECT_EQ(out, "x=IMG_0001.jpg");
}


TEST(ConsoleFormat, EscapesControlAndNonAscii)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped_ascii(
        std::string_view("a\nb\t\x1b[31m\0\xC3\xA9", 12), 0, &out));
    EXPECT_EQ(out, "a\\nb\\t\\x1B[31m\\x00\\xC3\\xA9");
}


TEST(ConsoleFormat, QuotesAreEscapedButNotDangerous)
{
    std::string out;
    EXPECT_FALSE(append_console_escaped_ascii("say \"hi\" \\", 0, &out));
    EXPECT_EQ(out, "say \\\"hi\\\" \\\\");
}


TEST(ConsoleFormat, Truncates)
{
    EXPECT_EQ(console_escaped("abcdef", 3), "abc...");
    EXPECT_EQ(console_escaped("abc", 3), "abc");
    EXPECT_EQ(console_escaped("abc"), "abc");

    std::string out;
    EXPECT_TRUE(append_console_escaped_ascii("abcdef", 2, &out));
    EXPECT_FALSE(append_console_escaped_ascii("x", 0, nullptr));
}

}  // namespace exifnote
