#include <iomanip> // for std::setw, std::setfill

#include "xembly/code_point_range.hpp"

namespace xembly {

auto write_code_point(std::ostream& os, char32_t c) -> std::ostream&
{
    const auto flags = os.flags();
    const auto fill = os.fill('0');
    os << '#' << std::hex << std::uppercase << std::setw(2);
    os << static_cast<unsigned long>(c);
    os.fill(fill);
    os.flags(flags);
    return os;
}

auto operator<<(std::ostream& os, const code_point_range& range)
    -> std::ostream&
{
    write_code_point(os, range.first);
    os << '-';
    write_code_point(os, range.last);
    return os;
}

}
