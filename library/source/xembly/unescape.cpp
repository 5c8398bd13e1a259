#include <charconv> // for std::from_chars
#include <cstdint> // for std::uint32_t
#include <optional>
#include <stdexcept> // for std::length_error
#include <utility> // for std::move

#include "xembly/entity.hpp"
#include "xembly/legal.hpp"
#include "xembly/reserved.hpp"
#include "xembly/unescape.hpp"
#include "xembly/utf8.hpp"

namespace xembly {

namespace {

constexpr auto min_quoted_size = std::size_t{2};

auto parse_code_point(std::string_view digits) noexcept
    -> std::optional<char32_t>
{
    if (digits.empty()) {
        return {};
    }
    auto number = std::uint32_t{};
    const auto first = digits.data();
    const auto last = first + digits.size();
    const auto [ptr, ec] = std::from_chars(first, last, number, 10);
    if ((ec != std::errc{}) || (ptr != last)) {
        return {};
    }
    return static_cast<char32_t>(number);
}

}

auto what(const unescape_error& error) -> std::string
{
    return std::visit([](const auto& ex){
        return std::string{ex.what()};
    }, error);
}

auto resolve_entity(std::string_view symbol, std::size_t offset)
    -> expected<std::string, unescape_error>
{
    if (symbol.starts_with(reserved::numeric_entity_prefix)) {
        const auto number = parse_code_point(symbol.substr(1u));
        if (!number) {
            return unexpected{unescape_error{
                make_parse_error(parse_error_kind::bad_number, symbol, offset)
            }};
        }
        const auto legal = check_legal(*number, offset);
        if (!legal) {
            return unexpected{unescape_error{legal.error()}};
        }
        auto result = std::string{};
        append_utf8(result, *legal);
        return result;
    }
    if (const auto c = find_entity_char(symbol)) {
        return std::string(1u, *c);
    }
    return unexpected{unescape_error{
        make_parse_error(parse_error_kind::unknown_symbol, symbol, offset)
    }};
}

auto unescape(std::string_view quoted)
    -> expected<std::string, unescape_error>
{
    if (quoted.size() < min_quoted_size) {
        throw std::length_error{
            "internal error, argument can't be shorter than 2 chars"
        };
    }
    const auto last = quoted.size() - 1u;
    auto output = std::string{};
    output.reserve(quoted.size());
    for (auto i = std::size_t{1}; i < last; ++i) {
        if (quoted[i] != reserved::entity_prefix) {
            output += quoted[i];
            continue;
        }
        const auto start = i;
        // The closing delimiter never ends an entity, even when it's a ';'.
        const auto end = quoted.find(reserved::entity_suffix, start + 1u);
        if ((end == std::string_view::npos) || (end >= last)) {
            return unexpected{unescape_error{
                make_parse_error(parse_error_kind::unterminated,
                                 quoted.substr(start + 1u, last - start - 1u),
                                 start)
            }};
        }
        const auto symbol = quoted.substr(start + 1u, end - start - 1u);
        const auto resolved = resolve_entity(symbol, start);
        if (!resolved) {
            return unexpected{resolved.error()};
        }
        output += *resolved;
        i = end;
    }
    return output;
}

auto unescape_or_throw(std::string_view quoted) -> std::string
{
    auto result = unescape(quoted);
    if (!result) {
        std::visit([](const auto& ex){
            throw ex;
        }, result.error());
    }
    return std::move(*result);
}

}
