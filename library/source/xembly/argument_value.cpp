#include <utility> // for std::move

#include "xembly/argument_value.hpp"
#include "xembly/escape.hpp"
#include "xembly/legal.hpp"
#include "xembly/reserved.hpp"

namespace xembly {

auto argument_value_checker::operator()(std::string v) const -> std::string
{
    if (const auto result = check_legal(v); !result) {
        throw result.error();
    }
    return v;
}

auto argument_value::render() const -> std::string
{
    auto result = std::string{reserved::literal_delimiter};
    result += escape(get());
    result += reserved::literal_delimiter;
    return result;
}

auto make_argument_value(std::string text)
    -> expected<argument_value, validation_error>
{
    try {
        return argument_value{std::move(text)};
    }
    catch (const validation_error& ex) {
        return unexpected{ex};
    }
}

auto operator<<(std::ostream& os, const argument_value& value)
    -> std::ostream&
{
    os << value.render();
    return os;
}

}
