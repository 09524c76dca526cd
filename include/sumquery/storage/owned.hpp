#pragma once

#include <span>
#include <vector>
#include <utility>

#include "sumquery/numeric.hpp"
#include "sumquery/memory/footprint.hpp"


namespace sumquery::storage {

//------------------------------------------------------------------------------
// Heap storage sized at runtime.
//
// Takes ownership of the source vector; the table is pre-sized to the source
// length so the build pass never reallocates.
//------------------------------------------------------------------------------
template<Summable T>
class Owned {
public:
    using value_type  = T;
    using source_type = std::vector<T>;
    using table_type  = std::vector<T>;

    static constexpr bool allocates = true;

    explicit Owned(source_type data)
        : source_(std::move(data))
        , table_(source_.size())
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

    [[nodiscard]] std::pair<source_type, table_type> release() && {
        return {std::move(source_), std::move(table_)};
    }

    [[nodiscard]] memory::footprint memory_usage() const noexcept {
        memory::footprint fp;
        fp.add_static(sizeof(Owned));
        fp.add_dynamic_buffer(source_);
        fp.add_dynamic_buffer(table_);
        return fp;
    }

private:
    source_type source_;
    table_type table_;
};

} // namespace sumquery::storage
