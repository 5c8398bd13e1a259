#ifndef code_point_range_hpp
#define code_point_range_hpp

#include <array>
#include <optional>
#include <ostream>

namespace xembly {

/// @brief Inclusive range of code points.
struct code_point_range
{
    char32_t first{};
    char32_t last{};

    [[nodiscard]] constexpr auto contains(char32_t c) const noexcept -> bool
    {
        return (c >= first) && (c <= last);
    }

    friend constexpr auto operator==(const code_point_range&,
                                     const code_point_range&) noexcept
        -> bool = default;
};

/// @brief Code points that may not appear in an argument value.
/// @see http://www.w3.org/TR/2004/REC-xml11-20040204/#charsets
constexpr auto restricted_ranges = std::array{
    code_point_range{0x00, 0x08},
    code_point_range{0x0B, 0x0C},
    code_point_range{0x0E, 0x1F},
    code_point_range{0x7F, 0x84},
    code_point_range{0x86, 0x9F},
};

/// @brief Finds the restricted range containing the given code point.
/// @return Range containing @c c, or the empty optional if @c c isn't
///   restricted.
constexpr auto find_restricted_range(char32_t c) noexcept
    -> std::optional<code_point_range>
{
    for (auto&& range: restricted_ranges) {
        if (range.contains(c)) {
            return range;
        }
    }
    return {};
}

constexpr auto is_restricted(char32_t c) noexcept -> bool
{
    return find_restricted_range(c).has_value();
}

static_assert(is_restricted(0x00) && is_restricted(0x9F));
static_assert(!is_restricted(0x09) && !is_restricted(0x85));

/// @brief Writes the code point as <code>#</code> followed by at least two
///   upper-case hexadecimal digits.
auto write_code_point(std::ostream& os, char32_t c) -> std::ostream&;

/// @brief Writes the range as <code>#XX-#YY</code>.
auto operator<<(std::ostream& os, const code_point_range& range)
    -> std::ostream&;

}

#endif /* code_point_range_hpp */
