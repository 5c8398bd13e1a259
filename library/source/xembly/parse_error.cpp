#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "xembly/parse_error.hpp"
#include "xembly/reserved.hpp"

namespace xembly {

auto operator<<(std::ostream& os, parse_error_kind kind) -> std::ostream&
{
    switch (kind) {
    case parse_error_kind::unterminated:
        os << "unterminated";
        return os;
    case parse_error_kind::unknown_symbol:
        os << "unknown-symbol";
        return os;
    case parse_error_kind::bad_number:
        os << "bad-number";
        return os;
    }
    os << "unknown parse_error_kind " << static_cast<int>(kind);
    return os;
}

parse_error::parse_error(parse_error_kind kind,
                         std::string symbol,
                         std::size_t offset,
                         const std::string& what_arg):
    invalid_argument(what_arg),
    symbol_(std::move(symbol)), offset_(offset), kind_(kind)
{
    // Intentionally empty.
}

auto parse_error::kind() const noexcept -> parse_error_kind
{
    return kind_;
}

auto parse_error::symbol() const -> std::string
{
    return symbol_;
}

auto parse_error::offset() const noexcept -> std::size_t
{
    return offset_;
}

auto make_parse_error(parse_error_kind kind,
                      std::string_view symbol,
                      std::size_t offset)
    -> parse_error
{
    std::ostringstream os;
    switch (kind) {
    case parse_error_kind::unterminated:
        os << "reached end of input while parsing an escape sequence";
        os << " starting at offset " << offset;
        break;
    case parse_error_kind::unknown_symbol:
        os << "unknown escape symbol ";
        os << reserved::entity_prefix << symbol << reserved::entity_suffix;
        break;
    case parse_error_kind::bad_number:
        os << "invalid numeric escape ";
        os << reserved::entity_prefix << symbol << reserved::entity_suffix;
        break;
    }
    return parse_error{kind, std::string{symbol}, offset, os.str()};
}

}
