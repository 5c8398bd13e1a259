#include "xembly/utf8.hpp"

namespace xembly {

namespace {

constexpr auto continuation_mask = 0xC0u;
constexpr auto continuation_tag = 0x80u;

struct lead_info
{
    unsigned mask;
    unsigned tag;
    std::size_t size;
    char32_t min; ///< Smallest code point not overlong in this size.
};

constexpr lead_info lead_infos[] = {
    {0x80u, 0x00u, 1u, 0x0},
    {0xE0u, 0xC0u, 2u, 0x80},
    {0xF0u, 0xE0u, 3u, 0x800},
    {0xF8u, 0xF0u, 4u, 0x10000},
};

auto to_byte(char c) noexcept -> unsigned
{
    return static_cast<unsigned char>(c);
}

}

auto decode_utf8(std::string_view bytes) noexcept
    -> std::optional<utf8_sequence>
{
    if (bytes.empty()) {
        return {};
    }
    const auto lead = to_byte(bytes[0]);
    for (auto&& info: lead_infos) {
        if ((lead & info.mask) != info.tag) {
            continue;
        }
        if (bytes.size() < info.size) {
            return {};
        }
        auto c = static_cast<char32_t>(lead & ~info.mask & 0xFFu);
        for (auto i = std::size_t{1}; i < info.size; ++i) {
            const auto byte = to_byte(bytes[i]);
            if ((byte & continuation_mask) != continuation_tag) {
                return {};
            }
            c = (c << 6u) | (byte & ~continuation_mask & 0xFFu);
        }
        if ((c < info.min) || !is_scalar_value(c)) {
            return {};
        }
        return utf8_sequence{c, info.size};
    }
    return {};
}

auto append_utf8(std::string& output, char32_t c) -> void
{
    if (c < 0x80) {
        output += static_cast<char>(c);
    }
    else if (c < 0x800) {
        output += static_cast<char>(0xC0u | (c >> 6u));
        output += static_cast<char>(0x80u | (c & 0x3Fu));
    }
    else if (c < 0x10000) {
        output += static_cast<char>(0xE0u | (c >> 12u));
        output += static_cast<char>(0x80u | ((c >> 6u) & 0x3Fu));
        output += static_cast<char>(0x80u | (c & 0x3Fu));
    }
    else {
        output += static_cast<char>(0xF0u | (c >> 18u));
        output += static_cast<char>(0x80u | ((c >> 12u) & 0x3Fu));
        output += static_cast<char>(0x80u | ((c >> 6u) & 0x3Fu));
        output += static_cast<char>(0x80u | (c & 0x3Fu));
    }
}

}
