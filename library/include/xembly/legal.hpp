#ifndef legal_hpp
#define legal_hpp

#include <cstddef> // for std::size_t
#include <string_view>

#include "xembly/expected.hpp"
#include "xembly/validation_error.hpp"

namespace xembly {

/// @brief Checks that the given code point may appear in an argument value.
/// @param[in] c Code point to check.
/// @param[in] offset Offset to report in the error if @c c is illegal.
/// @return @c c if legal, the error otherwise. The error has a range if
///   @c c is restricted. It has no range if @c c isn't a scalar value.
auto check_legal(char32_t c, std::size_t offset = 0u)
    -> expected<char32_t, validation_error>;

/// @brief Checks that every character of the given UTF-8 text may appear in
///   an argument value.
/// @return Nothing on success, or the error for the first illegal character.
auto check_legal(std::string_view text)
    -> expected<void, validation_error>;

}

#endif /* legal_hpp */
