#ifndef parse_error_hpp
#define parse_error_hpp

#include <cstddef> // for std::size_t
#include <ostream>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>

namespace xembly {

enum class parse_error_kind {
    unterminated, ///< Input ended before the entity's terminating ';'.
    unknown_symbol, ///< Entity name isn't one of the named entities.
    bad_number, ///< Numeric entity isn't a decimal number of a code point.
};

auto operator<<(std::ostream& os, parse_error_kind kind) -> std::ostream&;

/// @brief Error for a malformed escape sequence in a quoted literal.
struct parse_error: public std::invalid_argument
{
    using invalid_argument::invalid_argument;

    parse_error(parse_error_kind kind,
                std::string symbol,
                std::size_t offset,
                const std::string& what_arg = {});

    [[nodiscard]] auto kind() const noexcept -> parse_error_kind;

    /// @brief Text collected after the <code>'&'</code>, excluding the
    ///   <code>';'</code>.
    [[nodiscard]] auto symbol() const -> std::string;

    /// @brief Offset within the quoted literal of the <code>'&'</code>
    ///   that started the malformed sequence.
    [[nodiscard]] auto offset() const noexcept -> std::size_t;

private:
    std::string symbol_;
    std::size_t offset_{};
    parse_error_kind kind_{parse_error_kind::unterminated};
};

auto make_parse_error(parse_error_kind kind,
                      std::string_view symbol,
                      std::size_t offset = 0u)
    -> parse_error;

}

#endif /* parse_error_hpp */
