#pragma once

#include <span>
#include <vector>
#include <utility>

#include "sumquery/numeric.hpp"
#include "sumquery/memory/footprint.hpp"


namespace sumquery::storage {

//------------------------------------------------------------------------------
// Non-owning view over caller data, paired with an owned table.
//
// Ownership model:
//   - The caller owns the viewed elements
//   - The storage owns the table only
//   - The storage must NOT outlive the viewed elements
//
// The table is computed once from the view; after construction only the
// table is read by queries. A view invalidated later only affects source()
// and release() consumers.
//------------------------------------------------------------------------------
template<Summable T>
class Borrowed {
public:
    using value_type  = T;
    using source_type = std::span<const T>;
    using table_type  = std::vector<T>;

    static constexpr bool allocates = true;

    explicit Borrowed(source_type view)
        : source_(view)
        , table_(view.size())
    {}

    [[nodiscard]] std::span<const T> source() const noexcept {
        return source_;
    }

    [[nodiscard]] std::span<const T> table() const noexcept {
        return table_;
    }

    [[nodiscard]] std::span<T> table_mut() noexcept {
        return table_;
    }

    // Leaves the storage empty: no view, no table.
    [[nodiscard]] std::pair<source_type, table_type> release() && {
        return {std::exchange(source_, source_type{}), std::move(table_)};
    }

    // The viewed elements are not counted: they belong to the caller.
    [[nodiscard]] memory::footprint memory_usage() const noexcept {
        memory::footprint fp;
        fp.add_static(sizeof(Borrowed));
        fp.add_dynamic_buffer(table_);
        return fp;
    }

private:
    source_type source_;
    table_type table_;
};

} // namespace sumquery::storage
