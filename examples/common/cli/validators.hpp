#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "common/range.hpp"


namespace sumquery::examples::cli {

// -------------------------------------------------------------
// Range validator (syntax and ordering only; bounds are checked
// against the sequence once it is known)
// -------------------------------------------------------------
inline auto range_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        const auto range = parse_range(value);
        if (!range) {
            return "Range must be START:END with non-negative integers (e.g. 3:6)";
        }
        if (range->second < range->first) {
            return "Range end must not precede its start";
        }
        return {};
    },
    "Range validator"
);


// -------------------------------------------------------------
// Storage validator
// -------------------------------------------------------------
inline auto storage_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "owned" || value == "borrowed") {
            return {};
        }
        return "Storage must be one of: owned, borrowed";
    },
    "Storage validator"
);

} // namespace sumquery::examples::cli
