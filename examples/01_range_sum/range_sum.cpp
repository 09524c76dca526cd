// ============================================================================
// Example 01_range_sum
//
// Demonstrates:
// - Configuring a run from the command line
// - Choosing a storage variant at runtime
// - Validating user-supplied ranges before querying
//
// Usage:
//   sumquery_range_sum -v 1 3 4 8 6 1 4 2 -q 3:6 -q 0:7 -s owned
// ============================================================================
#include <span>
#include <string>
#include <vector>
#include <iostream>

#include "sumquery.hpp"

#include "common/cli/range_params.hpp"


// -----------------------------------------------------------------------------
// Runs every requested query against an index, skipping invalid ranges
// -----------------------------------------------------------------------------
template<class Index>
static int run_queries(const Index& index, const std::vector<std::string>& queries) {
    using sumquery::examples::parse_range;

    int skipped = 0;
    for (const auto& text : queries) {
        const auto range = parse_range(text);   // syntax already checked by CLI11
        if (!range || !index.contains(range->first, range->second)) {
            SQ_WARN("Range " << text << " is outside the sequence (size " << index.size() << "), skipped");
            ++skipped;
            continue;
        }
        std::cout << "sum[" << range->first << ".." << range->second << "] = "
                  << index.query(range->first, range->second) << std::endl;
    }
    return skipped;
}


int main(int argc, char** argv) {
    using namespace sumquery;

    const auto params = examples::cli::range::configure(argc, argv, "Range-sum queries over a sequence of numbers");
    params.dump("=== Range sum parameters ===", std::cout);

    int skipped = 0;
    if (params.storage == "owned") {
        auto index = make_owned(std::span<const double>(params.values));
        SQ_DEBUG("Built owned index over " << index.size() << " elements ("
                 << index.memory_usage().total_bytes() << " bytes)");
        skipped = run_queries(index, params.queries);
    }
    else {
        auto index = make_borrowed(params.values);
        SQ_DEBUG("Built borrowed index over " << index.size() << " elements ("
                 << index.memory_usage().total_bytes() << " bytes)");
        skipped = run_queries(index, params.queries);
    }

    if (skipped > 0) {
        SQ_INFO(skipped << " range(s) skipped");
    }
    return 0;
}
