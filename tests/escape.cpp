#include <gtest/gtest.h>

#include <string>

#include "xembly/escape.hpp"

using namespace xembly;

TEST(escape, plain)
{
    EXPECT_EQ(escape(""), "");
    EXPECT_EQ(escape("hello, world"), "hello, world");
    EXPECT_EQ(escape("a;b#c"), "a;b#c");
}

TEST(escape, named)
{
    EXPECT_EQ(escape("\""), "&quot;");
    EXPECT_EQ(escape("&"), "&amp;");
    EXPECT_EQ(escape("'"), "&apos;");
    EXPECT_EQ(escape("<"), "&lt;");
    EXPECT_EQ(escape(">"), "&gt;");
    EXPECT_EQ(escape("<a>&\"'"), "&lt;a&gt;&amp;&quot;&apos;");
    EXPECT_EQ(escape("&amp;"), "&amp;amp;");
}

TEST(escape, numeric)
{
    EXPECT_EQ(escape("\t"), "&#9;");
    EXPECT_EQ(escape("\n"), "&#10;");
    EXPECT_EQ(escape("\r"), "&#13;");
    EXPECT_EQ(escape("a\tb"), "a&#9;b");
    EXPECT_EQ(escape(std::string{'\0'}), "&#0;");
    EXPECT_EQ(escape("\x1F"), "&#31;");
    EXPECT_EQ(escape(" "), " ");
}

TEST(escape, non_ascii)
{
    EXPECT_EQ(escape("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(escape("\xE2\x82\xAC<"), "\xE2\x82\xAC&lt;");
    EXPECT_EQ(escape("\x7F"), "\x7F");
}
