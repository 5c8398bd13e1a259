#ifndef unescape_hpp
#define unescape_hpp

#include <cstddef> // for std::size_t
#include <string>
#include <string_view>
#include <variant>

#include "xembly/expected.hpp"
#include "xembly/parse_error.hpp"
#include "xembly/validation_error.hpp"

namespace xembly {

using unescape_error = std::variant<parse_error, validation_error>;

/// @brief Gets the message of whichever error the given variant holds.
auto what(const unescape_error& error) -> std::string;

/// @brief Resolves an entity's symbol to the text it stands for.
/// @param[in] symbol Text between the <code>'&'</code> and the
///   <code>';'</code>. Either one of the <code>named_entities</code> names or
///   <code>'#'</code> followed by a decimal code point.
/// @param[in] offset Offset to report in any error.
/// @return UTF-8 encoding of the character, or the error.
auto resolve_entity(std::string_view symbol, std::size_t offset = 0u)
    -> expected<std::string, unescape_error>;

/// @brief Recovers text from a quoted literal.
/// @details Strips the first and last characters without looking at them,
///   then replaces every entity of what's left with the character it
///   stands for.
/// @return Unescaped text, or a <code>parse_error</code> for an unterminated
///   or unknown entity, or a <code>validation_error</code> for a numeric
///   entity of a restricted code point.
/// @throws std::length_error if @c quoted is shorter than two characters.
///   That's a misuse by the caller rather than bad content.
/// @see argument_value::render.
auto unescape(std::string_view quoted)
    -> expected<std::string, unescape_error>;

/// @brief Recovers text from a quoted literal.
/// @throws parse_error, validation_error, or std::length_error under the
///   same conditions <code>unescape</code> returns or throws them.
auto unescape_or_throw(std::string_view quoted) -> std::string;

}

#endif /* unescape_hpp */
