#pragma once

#include <cstdint>


namespace sumquery {
namespace memory {

// Bytes used by an object, split between its own storage (static) and
// heap allocations it owns (dynamic).
struct footprint {
    std::uint64_t static_bytes{0};
    std::uint64_t dynamic_bytes{0};

    [[nodiscard]] inline constexpr std::uint64_t total_bytes() const noexcept {
        return static_bytes + dynamic_bytes;
    }

    inline constexpr void add(const footprint& other) noexcept {
        static_bytes += other.static_bytes;
        dynamic_bytes += other.dynamic_bytes;
    }

    inline constexpr void add_static(std::uint64_t bytes) noexcept {
        static_bytes += bytes;
    }

    inline constexpr void add_dynamic(std::uint64_t bytes) noexcept {
        dynamic_bytes += bytes;
    }

    // Heap bytes reserved by a contiguous container (capacity, not size)
    template <typename Container>
    inline constexpr void add_dynamic_buffer(const Container& c) noexcept {
        dynamic_bytes += static_cast<std::uint64_t>(c.capacity()) * sizeof(typename Container::value_type);
    }

    friend constexpr bool operator==(const footprint&, const footprint&) noexcept = default;
};

} // namespace memory
} // namespace sumquery
