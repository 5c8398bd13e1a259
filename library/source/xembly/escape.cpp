#include "xembly/entity.hpp"
#include "xembly/escape.hpp"
#include "xembly/reserved.hpp"

namespace xembly {

auto escape(std::string_view text) -> std::string
{
    auto output = std::string{};
    output.reserve(text.size());
    for (const auto c: text) {
        // UTF-8 multi-byte sequences never hold bytes below 0x80.
        const auto code = char32_t{static_cast<unsigned char>(c)};
        if (code < reserved::first_printable) {
            output += reserved::entity_prefix;
            output += reserved::numeric_entity_prefix;
            output += std::to_string(static_cast<unsigned>(code));
            output += reserved::entity_suffix;
        }
        else if (const auto name = find_entity_name(c)) {
            output += reserved::entity_prefix;
            output += *name;
            output += reserved::entity_suffix;
        }
        else {
            output += c;
        }
    }
    return output;
}

}
