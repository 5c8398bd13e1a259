#ifndef validation_error_hpp
#define validation_error_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <stdexcept> // for std::invalid_argument
#include <string>

#include "xembly/code_point_range.hpp"

namespace xembly {

/// @brief Error for text holding a character that may not appear in an
///   argument value.
/// @details Reports the offending code point along with the restricted
///   range it's in. The range is empty when the offending "character" isn't
///   a code point at all, like for a byte that's not part of well-formed
///   UTF-8 or for a numeric entity naming a surrogate.
struct validation_error: public std::invalid_argument
{
    using invalid_argument::invalid_argument;

    validation_error(char32_t badc,
                     std::optional<code_point_range> range,
                     std::size_t offset,
                     const std::string& what_arg = {});

    [[nodiscard]] auto code_point() const noexcept -> char32_t;
    [[nodiscard]] auto range() const noexcept
        -> std::optional<code_point_range>;

    /// @brief Byte offset within the checked text of the offending character.
    [[nodiscard]] auto offset() const noexcept -> std::size_t;

private:
    std::optional<code_point_range> range_;
    std::size_t offset_{};
    char32_t code_point_{};
};

/// @brief Makes the error for a code point in the given restricted range.
auto make_restricted_error(char32_t c,
                           const code_point_range& range,
                           std::size_t offset = 0u)
    -> validation_error;

/// @brief Makes the error for a numeric entity that's not a scalar value.
auto make_non_scalar_error(char32_t c,
                           std::size_t offset = 0u)
    -> validation_error;

/// @brief Makes the error for a byte that doesn't start well-formed UTF-8.
auto make_malformed_error(char byte,
                          std::size_t offset)
    -> validation_error;

}

#endif /* validation_error_hpp */
