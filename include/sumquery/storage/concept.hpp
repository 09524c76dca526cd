/*
===============================================================================
StorageConcept
===============================================================================

Defines the backing contract required by PrefixSumIndex.

A storage:

  • Holds the source sequence (owned or viewed) and an owned prefix table
  • Sizes the table to the source length on construction
  • Exposes read-only views over both
  • Exposes a writable table view used once, by the builder
  • Hands both parts back on release()

No virtual dispatch. Variants are selected by template argument.

-------------------------------------------------------------------------------
Variants
-------------------------------------------------------------------------------

  Fixed<T, N>   std::array source + std::array table      no heap
  Owned<T>      std::vector source + std::vector table    heap
  Borrowed<T>   std::span<const T> view + std::vector     heap (table only)

===============================================================================
*/
#pragma once

#include <span>
#include <utility>
#include <concepts>

#include "sumquery/numeric.hpp"
#include "sumquery/memory/footprint.hpp"


namespace sumquery::storage {

template<class S>
concept StorageConcept =
    Summable<typename S::value_type> &&
    std::move_constructible<S> &&
    std::constructible_from<S, typename S::source_type> &&
    requires(S s, const S cs) {
        typename S::table_type;

        // Whether the table lives on the heap
        { S::allocates } -> std::convertible_to<bool>;

        // ---------------------------------------------------------------------
        // Views
        // ---------------------------------------------------------------------
        { cs.source() } noexcept -> std::same_as<std::span<const typename S::value_type>>;
        { cs.table() } noexcept -> std::same_as<std::span<const typename S::value_type>>;
        { s.table_mut() } noexcept -> std::same_as<std::span<typename S::value_type>>;

        // ---------------------------------------------------------------------
        // Ownership transfer
        // ---------------------------------------------------------------------
        { std::move(s).release() } -> std::same_as<std::pair<typename S::source_type, typename S::table_type>>;

        // ---------------------------------------------------------------------
        // Accounting
        // ---------------------------------------------------------------------
        { cs.memory_usage() } noexcept -> std::same_as<memory::footprint>;
    };

} // namespace sumquery::storage
