#include <sstream> // for std::ostringstream

#include "xembly/reserved.hpp"
#include "xembly/validation_error.hpp"

namespace xembly {

validation_error::validation_error(char32_t badc,
                                   std::optional<code_point_range> range,
                                   std::size_t offset,
                                   const std::string& what_arg):
    invalid_argument(what_arg),
    range_(range), offset_(offset), code_point_(badc)
{
    // Intentionally empty.
}

auto validation_error::code_point() const noexcept -> char32_t
{
    return code_point_;
}

auto validation_error::range() const noexcept
    -> std::optional<code_point_range>
{
    return range_;
}

auto validation_error::offset() const noexcept -> std::size_t
{
    return offset_;
}

auto make_restricted_error(char32_t c,
                           const code_point_range& range,
                           std::size_t offset)
    -> validation_error
{
    std::ostringstream os;
    os << "Character ";
    write_code_point(os, c);
    os << " is in restricted XML range ";
    os << range;
    os << ", see ";
    os << reserved::charsets_reference;
    return validation_error{c, range, offset, os.str()};
}

auto make_non_scalar_error(char32_t c,
                           std::size_t offset)
    -> validation_error
{
    std::ostringstream os;
    os << "Character ";
    write_code_point(os, c);
    os << " is not a Unicode scalar value";
    return validation_error{c, {}, offset, os.str()};
}

auto make_malformed_error(char byte,
                          std::size_t offset)
    -> validation_error
{
    const auto c = static_cast<char32_t>(static_cast<unsigned char>(byte));
    std::ostringstream os;
    os << "Byte ";
    write_code_point(os, c);
    os << " at offset " << offset;
    os << " does not start a well-formed UTF-8 sequence";
    return validation_error{c, {}, offset, os.str()};
}

}
