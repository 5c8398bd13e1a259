#include "xembly/code_point_range.hpp"
#include "xembly/legal.hpp"
#include "xembly/utf8.hpp"

namespace xembly {

auto check_legal(char32_t c, std::size_t offset)
    -> expected<char32_t, validation_error>
{
    if (const auto range = find_restricted_range(c)) {
        return unexpected{make_restricted_error(c, *range, offset)};
    }
    if (!is_scalar_value(c)) {
        return unexpected{make_non_scalar_error(c, offset)};
    }
    return c;
}

auto check_legal(std::string_view text)
    -> expected<void, validation_error>
{
    auto offset = std::size_t{};
    while (offset < text.size()) {
        const auto sequence = decode_utf8(text.substr(offset));
        if (!sequence) {
            return unexpected{make_malformed_error(text[offset], offset)};
        }
        if (const auto result = check_legal(sequence->code_point, offset);
            !result) {
            return unexpected{result.error()};
        }
        offset += sequence->size;
    }
    return {};
}

}
