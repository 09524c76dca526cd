#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <utility>
#include <type_traits>

#include "sumquery/numeric.hpp"
#include "sumquery/memory/footprint.hpp"


namespace sumquery::storage {

//------------------------------------------------------------------------------
// Compile-time sized storage.
//
// Source and table are std::array members, so the whole index lives wherever
// its owner lives (stack, static storage, or embedded in a larger value).
//
// Characteristics:
//   • No heap allocation
//   • Usable in constant expressions
//   • Trivially copyable when T is
//
// Template parameters:
//   T  - element type
//   N  - number of elements (0 is allowed)
//------------------------------------------------------------------------------
template<Summable T, std::size_t N>
class Fixed {
public:
    using value_type  = T;
    using source_type = std::array<T, N>;
    using table_type  = std::array<T, N>;

    static constexpr bool allocates = false;

    constexpr explicit Fixed(source_type data) noexcept(std::is_nothrow_move_constructible_v<T>)
        : source_(std::move(data))
        , table_{}
    {}

    [[nodiscard]] constexpr std::span<const T> source() const noexcept {
        return source_;
    }

    [[nodiscard]] constexpr std::span<const T> table() const noexcept {
        return table_;
    }

    [[nodiscard]] constexpr std::span<T> table_mut() noexcept {
        return table_;
    }

    [[nodiscard]] constexpr std::pair<source_type, table_type> release() && {
        return {std::move(source_), std::move(table_)};
    }

    [[nodiscard]] constexpr memory::footprint memory_usage() const noexcept {
        memory::footprint fp;
        fp.add_static(sizeof(Fixed));
        return fp;
    }

private:
    source_type source_;
    table_type table_;
};

} // namespace sumquery::storage
