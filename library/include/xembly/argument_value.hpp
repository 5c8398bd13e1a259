#ifndef argument_value_hpp
#define argument_value_hpp

#include <concepts> // for std::regular.
#include <cstddef> // for std::size_t
#include <functional> // for std::hash
#include <ostream>
#include <string>
#include <string_view>

#include "xembly/checked.hpp"
#include "xembly/expected.hpp"
#include "xembly/validation_error.hpp"

namespace xembly {

struct argument_value_checker
{
    auto operator()() const noexcept // NOLINT(bugprone-exception-escape)
        -> std::string
    {
        return {};
    }

    /// @throws validation_error if @c v holds a restricted code point or
    ///   isn't well-formed UTF-8.
    auto operator()(std::string v) const -> std::string;

    auto operator()(const std::string_view& v) const -> std::string
    {
        return operator()(std::string(v));
    }

    auto operator()(const char *v) const -> std::string
    {
        return operator()(std::string(v));
    }

    template <class InputIt>
    auto operator()(InputIt first, InputIt last) const -> std::string
    {
        return operator()(std::string{first, last});
    }
};

/// @brief Argument value.
/// @details Text that's been checked for holding only characters allowed in
///   XML 1.1 documents, and that's rendered as an escaped and quoted
///   attribute literal.
/// @note This is a strongly typed <code>std::string</code> holding UTF-8. A
///   <code>validation_error</code> exception is thrown on construction from
///   text having a code point in one of the <code>restricted_ranges</code>.
/// @see make_argument_value for a non-throwing way to construct.
struct argument_value: detail::checked<std::string, argument_value_checker>
{
    using checked::checked;

    /// @brief Gets the unescaped text this was constructed from.
    [[nodiscard]] auto raw() const noexcept -> const std::string&
    {
        return get();
    }

    /// @brief Renders this as a quoted, escaped literal.
    /// @post <code>unescape(render())</code> equals <code>raw()</code>.
    [[nodiscard]] auto render() const -> std::string;
};

static_assert(std::regular<argument_value>);

/// @brief Makes an argument value from the given text.
/// @return Argument value, or the error for the first illegal character.
auto make_argument_value(std::string text)
    -> expected<argument_value, validation_error>;

/// @brief Writes the rendered literal of the given value.
auto operator<<(std::ostream& os, const argument_value& value)
    -> std::ostream&;

}

template <>
struct std::hash<xembly::argument_value>
{
    auto operator()(const xembly::argument_value& value) const noexcept
        -> std::size_t
    {
        return std::hash<std::string>{}(value.get());
    }
};

#endif /* argument_value_hpp */
