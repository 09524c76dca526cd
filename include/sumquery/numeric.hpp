#pragma once

#include <concepts>
#include <type_traits>


namespace sumquery {

// Element type of a prefix-sum table.
//
// Requires value semantics, an additive identity (T{}) and closed
// addition / subtraction. Overflow follows T's native semantics: pick a
// type wide enough for the largest expected sum.
template<class T>
concept Summable =
    std::copyable<T> &&
    std::default_initializable<T> &&
    requires(const T a, const T b) {
        { a + b } -> std::convertible_to<T>;
        { a - b } -> std::convertible_to<T>;
    };

// Additive identity
template<Summable T>
[[nodiscard]] inline constexpr T zero() noexcept(std::is_nothrow_default_constructible_v<T>) {
    return T{};
}

} // namespace sumquery
