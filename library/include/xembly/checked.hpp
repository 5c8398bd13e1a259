#ifndef checked_hpp
#define checked_hpp

#include <concepts>
#include <ostream>
#include <type_traits>
#include <utility> // for std::exchange

namespace xembly::detail {

template <class T, class R, class ...Args>
concept functor_returns = std::is_invocable_r_v<R, T, Args...>;

/// @brief Strong type of a value that's only ever held after having been
///   accepted by a checker.
/// @details The checker is a stateless functor type. Called with a candidate
///   value, it returns the value to hold or throws. Called with no arguments,
///   it returns the value held by default constructed and moved-from objects.
template <class T, functor_returns<T, T> Checker>
struct checked
{
    using value_type = T;
    using checker_type = Checker;

    template <bool B = functor_returns<Checker, T>, std::enable_if_t<B, int> = 0>
    constexpr checked() // NOLINT(bugprone-exception-escape)
    noexcept(noexcept(Checker{}()) && std::is_nothrow_move_constructible_v<T>):
    data{Checker{}()}
    {
        // Intentionally empty.
    }

    checked(const checked& other) = default;

    checked(checked&& other) // NOLINT(bugprone-exception-escape)
    noexcept(std::is_nothrow_move_constructible_v<value_type> &&
             noexcept(Checker{}())):
        data{std::exchange(other.data, checker_type{}())}
    {
        // Intentionally empty.
    }

    template <class U, class V = std::enable_if_t<
        !std::is_base_of_v<checked, std::decay_t<U>> &&
        functor_returns<Checker, T, U>
    >>
    checked(U&& u): data{
        checker_type{}(std::forward<U>(u)) // NOLINT(cppcoreguidelines-pro-bounds-array-to-pointer-decay)
    }
    {
        // Intentionally empty.
    }

    template<class InputIt, class U = std::enable_if_t<
        functor_returns<Checker, T, InputIt, InputIt>
    >>
    checked(InputIt first, InputIt last)
        : data{checker_type{}(first, last)}
    {
        // Intentionally empty.
    }

    auto operator=(const checked& other) -> checked& = default;

    auto operator=(checked&& other) // NOLINT(bugprone-exception-escape)
        noexcept(std::is_nothrow_move_assignable_v<value_type> &&
                 noexcept(Checker{}()))
        -> checked&
    {
        if (this != &other) {
            data = std::exchange(other.data, checker_type{}());
        }
        return *this;
    }

    constexpr explicit operator value_type() const
    {
        return data;
    }

    [[nodiscard]] auto get() const & noexcept -> const value_type&
    {
        return data;
    }

private:
    value_type data;
};

template <class LhsV, class LhsC, class RhsV, class RhsC>
inline auto operator==(const checked<LhsV, LhsC>& lhs,
                       const checked<RhsV, RhsC>& rhs)
    -> decltype(lhs.get() == rhs.get())
{
    return lhs.get() == rhs.get();
}

template <class LhsV, class LhsC, class RhsV, class RhsC>
inline auto operator<(const checked<LhsV, LhsC>& lhs,
                      const checked<RhsV, RhsC>& rhs)
    -> decltype(lhs.get() < rhs.get())
{
    return lhs.get() < rhs.get();
}

template <class V, class C>
inline auto operator==(const checked<V, C>& checked,
                       const V& value)
    -> decltype(checked.get() == value)
{
    return checked.get() == value;
}

template <class V, class C>
inline auto operator<(const checked<V, C>& checked,
                      const V& value)
    -> decltype(checked.get() < value)
{
    return checked.get() < value;
}

template <class V, class C>
inline auto operator<(const V& value,
                      const checked<V, C>& checked)
    -> decltype(value < checked.get())
{
    return value < checked.get();
}

}

#endif /* checked_hpp */
