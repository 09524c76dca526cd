// ============================================================================
// Example 00_quickstart
//
// Demonstrates:
// - Building a prefix-sum index with each storage variant
// - Answering inclusive range-sum queries
// - Validating a range before querying it
// ============================================================================
#include <array>
#include <vector>
#include <iostream>

#include "sumquery.hpp"

#include "common/logger.hpp"


int main() {
    using namespace sumquery;

    examples::set_log_level("info");
    SQ_INFO("sumquery " << version_major << "." << version_minor << "." << version_patch);

    // -------------------------------------------------------------------------
    // 1) Fixed: compile-time sized, no heap (answers are available at compile time)
    // -------------------------------------------------------------------------
    constexpr auto fixed = make_fixed(std::array<int, 8>{1, 3, 4, 8, 6, 1, 4, 2});
    static_assert(fixed.query(3, 6) == 19);

    SQ_INFO("fixed    : query(3, 6) = " << fixed.query(3, 6)
            << "  [" << fixed.memory_usage().total_bytes() << " bytes, no heap]");
    SQ_DEBUG("fixed    : " << fixed);

    // -------------------------------------------------------------------------
    // 2) Owned: takes the vector
    // -------------------------------------------------------------------------
    auto owned = make_owned(std::vector<double>{1.0, 3.0, 4.0, 8.0, 6.0, 1.0, 4.0, 2.0});
    SQ_INFO("owned    : query(0, 7) = " << owned.query(0, 7)
            << "  [" << owned.memory_usage().dynamic_bytes << " heap bytes]");

    // -------------------------------------------------------------------------
    // 3) Borrowed: views caller data, owns only the table
    // -------------------------------------------------------------------------
    const std::vector<long> readings = {1, 3, 4, 8, 6, 1, 4, 2};
    auto borrowed = make_borrowed(readings);
    SQ_INFO("borrowed : query(2, 7) = " << borrowed.query(2, 7)
            << "  [" << borrowed.memory_usage().dynamic_bytes << " heap bytes]");

    // -------------------------------------------------------------------------
    // Out-of-range queries are programming errors: validate first
    // -------------------------------------------------------------------------
    if (!borrowed.contains(5, 12)) {
        SQ_WARN("borrowed : range [5, 12] is outside [0, " << borrowed.size() - 1 << "], skipped");
    }

    std::cout << "\n[sumquery] Done.\n";
    return 0;
}
