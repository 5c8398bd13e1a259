#include <gtest/gtest.h>

#include <sstream> // for std::ostringstream

#include "xembly/code_point_range.hpp"

using namespace xembly;

TEST(code_point_range, contains)
{
    const auto range = code_point_range{0x0B, 0x0C};
    EXPECT_FALSE(range.contains(0x0A));
    EXPECT_TRUE(range.contains(0x0B));
    EXPECT_TRUE(range.contains(0x0C));
    EXPECT_FALSE(range.contains(0x0D));
}

TEST(code_point_range, restricted_ranges)
{
    ASSERT_EQ(size(restricted_ranges), 5u);
    EXPECT_EQ(restricted_ranges[0], (code_point_range{0x00, 0x08}));
    EXPECT_EQ(restricted_ranges[1], (code_point_range{0x0B, 0x0C}));
    EXPECT_EQ(restricted_ranges[2], (code_point_range{0x0E, 0x1F}));
    EXPECT_EQ(restricted_ranges[3], (code_point_range{0x7F, 0x84}));
    EXPECT_EQ(restricted_ranges[4], (code_point_range{0x86, 0x9F}));
}

TEST(code_point_range, find_restricted_range)
{
    for (auto&& range: restricted_ranges) {
        for (auto c = range.first; c <= range.last; ++c) {
            EXPECT_EQ(find_restricted_range(c), range);
        }
    }
    for (const auto c: {0x09u, 0x0Au, 0x0Du, 0x20u, 0x7Eu, 0x85u, 0xA0u,
                        0xFFFDu, 0x10FFFFu}) {
        EXPECT_FALSE(find_restricted_range(c)) << c;
        EXPECT_FALSE(is_restricted(c)) << c;
    }
}

TEST(code_point_range, write_code_point)
{
    {
        std::ostringstream os;
        write_code_point(os, 0x05);
        EXPECT_EQ(os.str(), "#05");
    }
    {
        std::ostringstream os;
        write_code_point(os, 0x9F);
        EXPECT_EQ(os.str(), "#9F");
    }
    {
        std::ostringstream os;
        write_code_point(os, 0x10FFFF);
        EXPECT_EQ(os.str(), "#10FFFF");
    }
    {
        std::ostringstream os;
        write_code_point(os, 0x1F);
        os << ' ' << 31;
        EXPECT_EQ(os.str(), "#1F 31");
    }
}

TEST(code_point_range, ostream)
{
    std::ostringstream os;
    os << code_point_range{0x7F, 0x84};
    EXPECT_EQ(os.str(), "#7F-#84");
}
