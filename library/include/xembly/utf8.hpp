#ifndef utf8_hpp
#define utf8_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <string>
#include <string_view>

namespace xembly {

constexpr auto max_code_point = char32_t{0x10FFFF};

/// @brief Whether the given value is a Unicode scalar value.
/// @note Scalar values are the code points other than surrogates.
constexpr auto is_scalar_value(char32_t c) noexcept -> bool
{
    return (c <= max_code_point) && !((c >= 0xD800) && (c <= 0xDFFF));
}

/// @brief A code point decoded from the front of a UTF-8 byte sequence.
struct utf8_sequence
{
    char32_t code_point{};
    std::size_t size{}; ///< Number of bytes the code point was encoded in.
};

/// @brief Decodes the first code point of the given bytes.
/// @return Decoded code point and its encoded size, or the empty optional if
///   @c bytes is empty or doesn't start with a well-formed UTF-8 sequence.
///   Overlong forms, surrogates and values over <code>0x10FFFF</code> are
///   not well-formed.
auto decode_utf8(std::string_view bytes) noexcept
    -> std::optional<utf8_sequence>;

/// @brief Appends the UTF-8 encoding of the given code point.
/// @pre <code>is_scalar_value(c)</code>.
auto append_utf8(std::string& output, char32_t c) -> void;

}

#endif /* utf8_hpp */
