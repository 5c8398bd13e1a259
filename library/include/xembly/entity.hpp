#ifndef entity_hpp
#define entity_hpp

#include <array>
#include <optional>
#include <string_view>

namespace xembly {

/// @brief Character that's escaped by name, like <code>&amp;amp;</code>.
struct named_entity
{
    std::string_view name;
    char character{};
};

/// @brief Named entities in the order their characters get tried when
///   escaping.
constexpr auto named_entities = std::array{
    named_entity{"quot", '"'},
    named_entity{"amp", '&'},
    named_entity{"apos", '\''},
    named_entity{"lt", '<'},
    named_entity{"gt", '>'},
};

constexpr auto find_entity_char(std::string_view name) noexcept
    -> std::optional<char>
{
    for (auto&& entity: named_entities) {
        if (entity.name == name) {
            return entity.character;
        }
    }
    return {};
}

constexpr auto find_entity_name(char c) noexcept
    -> std::optional<std::string_view>
{
    for (auto&& entity: named_entities) {
        if (entity.character == c) {
            return entity.name;
        }
    }
    return {};
}

static_assert(find_entity_char("amp") == '&');
static_assert(!find_entity_char("AMP"));
static_assert(find_entity_name('<') == std::string_view{"lt"});

}

#endif /* entity_hpp */
