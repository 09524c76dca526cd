/*
===============================================================================
Contract checks
===============================================================================

Preconditions of the query surface are programming errors, not runtime
conditions. A violated precondition:

  • is logged once at FATAL level (operation, condition, indices, size)
  • terminates the process
      - std::abort()       when NDEBUG is not defined
      - __builtin_trap()   when NDEBUG is defined
  • is a compile error when reached during constant evaluation

Callers that cannot guarantee a valid range must validate it first
(see PrefixSumIndex::contains()).
===============================================================================
*/
#pragma once

#include <cstddef>
#include <cstdlib>

#include "sumquery/log/logger.hpp"


namespace sumquery::contract {

[[noreturn]] inline void fail(const char* operation, const char* condition,
                              std::size_t start, std::size_t end, std::size_t size) noexcept {
    SQ_FATAL("contract violation in " << operation << ": " << condition
             << " (start=" << start << ", end=" << end << ", size=" << size << ")");
#ifndef NDEBUG
    std::abort();
#else
    __builtin_trap();
#endif
}

// Inclusive range [start, end] inside [0, size)
inline constexpr void expects_range(const char* operation,
                                    std::size_t start, std::size_t end, std::size_t size) noexcept {
    if (end < start) [[unlikely]] {
        fail(operation, "start <= end", start, end, size);
    }
    if (end >= size) [[unlikely]] {
        fail(operation, "end < size", start, end, size);
    }
}

// Same as expects_range(), restricted to start >= 1
inline constexpr void expects_positive_range(const char* operation,
                                             std::size_t start, std::size_t end, std::size_t size) noexcept {
    if (start == 0) [[unlikely]] {
        fail(operation, "start >= 1", start, end, size);
    }
    expects_range(operation, start, end, size);
}

} // namespace sumquery::contract
