#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <charconv>
#include <system_error>


namespace sumquery::examples {

// -------------------------------------------------------------
// "START:END" -> (start, end), both unsigned decimal
// -------------------------------------------------------------
[[nodiscard]]
inline std::optional<std::pair<std::size_t, std::size_t>> parse_range(std::string_view text) {
    const auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    const auto parse_index = [](std::string_view part) -> std::optional<std::size_t> {
        std::size_t value = 0;
        const auto* first = part.data();
        const auto* last = part.data() + part.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (part.empty() || ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return value;
    };
    const auto start = parse_index(text.substr(0, colon));
    const auto end = parse_index(text.substr(colon + 1));
    if (!start || !end) {
        return std::nullopt;
    }
    return std::make_pair(*start, *end);
}

} // namespace sumquery::examples
