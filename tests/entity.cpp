#include <gtest/gtest.h>

#include <set>
#include <string_view>

#include "xembly/entity.hpp"

using namespace xembly;

TEST(named_entities, table)
{
    EXPECT_EQ(size(named_entities), 5u);
    auto names = std::set<std::string_view>{};
    auto chars = std::set<char>{};
    for (auto&& entity: named_entities) {
        names.insert(entity.name);
        chars.insert(entity.character);
    }
    EXPECT_EQ(names, (std::set<std::string_view>{
        "amp", "apos", "gt", "lt", "quot"
    }));
    EXPECT_EQ(chars, (std::set<char>{'"', '&', '\'', '<', '>'}));
}

TEST(named_entities, find_entity_char)
{
    EXPECT_EQ(find_entity_char("apos"), '\'');
    EXPECT_EQ(find_entity_char("quot"), '"');
    EXPECT_EQ(find_entity_char("lt"), '<');
    EXPECT_EQ(find_entity_char("gt"), '>');
    EXPECT_EQ(find_entity_char("amp"), '&');
    EXPECT_FALSE(find_entity_char(""));
    EXPECT_FALSE(find_entity_char("nbsp"));
    EXPECT_FALSE(find_entity_char("Lt"));
    EXPECT_FALSE(find_entity_char("amp;"));
}

TEST(named_entities, find_entity_name)
{
    EXPECT_EQ(find_entity_name('&'), "amp");
    EXPECT_EQ(find_entity_name('"'), "quot");
    EXPECT_FALSE(find_entity_name('a'));
    EXPECT_FALSE(find_entity_name(';'));
}
