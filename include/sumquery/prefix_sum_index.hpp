/*
===============================================================================
PrefixSumIndex<Storage>
===============================================================================

Constant-time range-sum queries over an immutable sequence.

Construction performs a single forward pass that fills the prefix table:

    table[0] = source[0]
    table[i] = table[i - 1] + source[i]          (i > 0)

A query over the inclusive range [start, end] is then two table lookups and
one subtraction:

    start == 0  ->  table[end]
    start  > 0  ->  table[end] - table[start - 1]

-------------------------------------------------------------------------------
Contract
-------------------------------------------------------------------------------

  • Indices are 0-based and inclusive on both ends
  • query() requires start <= end < size()
  • query_positive() additionally requires start >= 1
  • A violated precondition terminates the process (see contract.hpp)
  • Overflow follows the element type's native semantics

-------------------------------------------------------------------------------
Threading
-------------------------------------------------------------------------------

Immutable after construction. Concurrent readers need no synchronization.

===============================================================================
*/
#pragma once

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <ostream>
#include <span>
#include <utility>

#include "sumquery/contract.hpp"
#include "sumquery/memory/footprint.hpp"
#include "sumquery/storage/concept.hpp"
#include "sumquery/storage/fixed.hpp"
#include "sumquery/storage/owned.hpp"
#include "sumquery/storage/borrowed.hpp"


namespace sumquery {

template<storage::StorageConcept Storage>
class PrefixSumIndex {
public:
    using storage_type = Storage;
    using value_type   = typename Storage::value_type;
    using source_type  = typename Storage::source_type;
    using table_type   = typename Storage::table_type;

    static constexpr bool allocates = Storage::allocates;

    // O(N). Empty sources are allowed and produce an empty table.
    constexpr explicit PrefixSumIndex(source_type source)
        : storage_(std::move(source))
    {
        build_();
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    // Sum of source[start..=end]
    [[nodiscard]] constexpr value_type query(std::size_t start, std::size_t end) const {
        contract::expects_range("PrefixSumIndex::query", start, end, size());
        const auto table = storage_.table();
        if (start == 0) {
            return table[end];
        }
        return table[end] - table[start - 1];
    }

    // Sum of source[start..=end] for callers that guarantee start >= 1.
    [[nodiscard]] constexpr value_type query_positive(std::size_t start, std::size_t end) const {
        contract::expects_positive_range("PrefixSumIndex::query_positive", start, end, size());
        const auto table = storage_.table();
        return table[end] - table[start - 1];
    }

    // True when query(start, end) satisfies its precondition
    [[nodiscard]] constexpr bool contains(std::size_t start, std::size_t end) const noexcept {
        return start <= end && end < size();
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] constexpr std::size_t size() const noexcept {
        return storage_.table().size();
    }

    [[nodiscard]] constexpr bool empty() const noexcept {
        return size() == 0;
    }

    [[nodiscard]] constexpr std::span<const value_type> source() const noexcept {
        return storage_.source();
    }

    [[nodiscard]] constexpr std::span<const value_type> table() const noexcept {
        return storage_.table();
    }

    [[nodiscard]] constexpr memory::footprint memory_usage() const noexcept {
        return storage_.memory_usage();
    }

    // Consumes the index and hands back (source, table) without copying.
    [[nodiscard]] constexpr std::pair<source_type, table_type> decompose() && {
        return std::move(storage_).release();
    }

    // -------------------------------------------------------------------------
    // Comparison (element-wise over source, then table)
    // -------------------------------------------------------------------------

    friend constexpr bool operator==(const PrefixSumIndex& lhs, const PrefixSumIndex& rhs)
        requires std::equality_comparable<value_type>
    {
        return std::ranges::equal(lhs.source(), rhs.source()) &&
               std::ranges::equal(lhs.table(), rhs.table());
    }

    friend constexpr auto operator<=>(const PrefixSumIndex& lhs, const PrefixSumIndex& rhs)
        requires std::three_way_comparable<value_type>
    {
        const auto ls = lhs.source();
        const auto rs = rhs.source();
        if (auto cmp = std::lexicographical_compare_three_way(ls.begin(), ls.end(), rs.begin(), rs.end()); cmp != 0) {
            return cmp;
        }
        const auto lt = lhs.table();
        const auto rt = rhs.table();
        return std::lexicographical_compare_three_way(lt.begin(), lt.end(), rt.begin(), rt.end());
    }

    // -------------------------------------------------------------------------
    // Formatting: PrefixSumIndex{source: [1, 3], table: [1, 4]}
    // -------------------------------------------------------------------------

    friend std::ostream& operator<<(std::ostream& os, const PrefixSumIndex& index)
        requires requires(std::ostream& out, const value_type& v) { out << v; }
    {
        const auto print = [&os](std::span<const value_type> values) {
            os << '[';
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (i != 0) os << ", ";
                os << values[i];
            }
            os << ']';
        };
        os << "PrefixSumIndex{source: ";
        print(index.source());
        os << ", table: ";
        print(index.table());
        return os << '}';
    }

private:
    Storage storage_;

    constexpr void build_() {
        const auto source = storage_.source();
        auto table = storage_.table_mut();
        if (source.empty()) {
            return;
        }
        table[0] = source[0];
        for (std::size_t idx = 1; idx < source.size(); ++idx) {
            table[idx] = table[idx - 1] + source[idx];
        }
    }
};


// -----------------------------------------------------------------------------
// Variant aliases
// -----------------------------------------------------------------------------

template<Summable T, std::size_t N>
using FixedPrefixSum = PrefixSumIndex<storage::Fixed<T, N>>;

template<Summable T>
using OwnedPrefixSum = PrefixSumIndex<storage::Owned<T>>;

template<Summable T>
using BorrowedPrefixSum = PrefixSumIndex<storage::Borrowed<T>>;

} // namespace sumquery
