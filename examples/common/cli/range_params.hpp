#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <ostream>
#include <iostream>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace sumquery::examples::cli::range {

    // -------------------------------------------------------------
    // Range-sum example parameters
    // -------------------------------------------------------------
    struct Params {
        std::vector<double> values;
        std::vector<std::string> queries;
        std::string storage   = "borrowed";
        std::string log_level = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Values    : ";
            for (const auto& v : values) { os << v << " "; }
            os << "\n"
               << "  Queries   : ";
            for (const auto& q : queries) { os << q << " "; }
            os << "\n"
               << "  Storage   : " << storage << "\n"
               << "  Log Level : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI for the range-sum example
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-v,--values", params.values, "Sequence elements (e.g. -v 1 3 4 8)")->required();
        app.add_option("-q,--query", params.queries, "Inclusive range START:END (repeatable)")->check(range_validator);
        app.add_option("-s,--storage", params.storage, "Storage: owned | borrowed")->check(storage_validator)->default_val(params.storage);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);
        app.footer(
            "Indices are 0-based and inclusive on both ends.\n"
            "Ranges outside the sequence are reported and skipped."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        set_log_level(params.log_level);
        return params;
    }

} // namespace sumquery::examples::cli::range
