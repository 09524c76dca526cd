#pragma once

#include <array>
#include <cstddef>
#include <iterator>
#include <span>
#include <vector>

#include "sumquery/prefix_sum_index.hpp"


namespace sumquery {

// -----------------------------------------------------------------------------
// Fixed (no heap)
// -----------------------------------------------------------------------------

template<Summable T, std::size_t N>
[[nodiscard]] constexpr FixedPrefixSum<T, N> make_fixed(std::array<T, N> data) {
    return FixedPrefixSum<T, N>{std::move(data)};
}

template<Summable T, std::size_t N>
[[nodiscard]] constexpr FixedPrefixSum<T, N> make_fixed(const T (&data)[N]) {
    return FixedPrefixSum<T, N>{std::to_array(data)};
}

// -----------------------------------------------------------------------------
// Owned (heap, runtime sized)
// -----------------------------------------------------------------------------

template<Summable T>
[[nodiscard]] OwnedPrefixSum<T> make_owned(std::vector<T> data) {
    return OwnedPrefixSum<T>{std::move(data)};
}

template<Summable T, std::size_t N>
[[nodiscard]] OwnedPrefixSum<T> make_owned(const std::array<T, N>& data) {
    return OwnedPrefixSum<T>{std::vector<T>(data.begin(), data.end())};
}

template<Summable T, std::size_t N>
[[nodiscard]] OwnedPrefixSum<T> make_owned(const T (&data)[N]) {
    return OwnedPrefixSum<T>{std::vector<T>(std::begin(data), std::end(data))};
}

template<Summable T>
[[nodiscard]] OwnedPrefixSum<T> make_owned(std::span<const T> data) {
    return OwnedPrefixSum<T>{std::vector<T>(data.begin(), data.end())};
}

// -----------------------------------------------------------------------------
// Borrowed (zero-copy view, heap table)
//
// The returned index must not outlive the viewed elements. Temporaries are
// rejected at compile time.
// -----------------------------------------------------------------------------

template<Summable T>
[[nodiscard]] BorrowedPrefixSum<T> make_borrowed(std::span<const T> view) {
    return BorrowedPrefixSum<T>{view};
}

template<Summable T>
[[nodiscard]] BorrowedPrefixSum<T> make_borrowed(const std::vector<T>& data) {
    return BorrowedPrefixSum<T>{std::span<const T>(data)};
}

template<Summable T>
void make_borrowed(const std::vector<T>&&) = delete;

template<Summable T, std::size_t N>
[[nodiscard]] BorrowedPrefixSum<T> make_borrowed(const std::array<T, N>& data) {
    return BorrowedPrefixSum<T>{std::span<const T>(data)};
}

template<Summable T, std::size_t N>
void make_borrowed(const std::array<T, N>&&) = delete;

template<Summable T, std::size_t N>
[[nodiscard]] BorrowedPrefixSum<T> make_borrowed(const T (&data)[N]) {
    return BorrowedPrefixSum<T>{std::span<const T>(data)};
}

template<Summable T, std::size_t N>
void make_borrowed(const T (&&)[N]) = delete;

} // namespace sumquery
