#pragma once

namespace sumquery {

// Semantic versioning for the library API
inline constexpr int version_major = 1;
inline constexpr int version_minor = 0;
inline constexpr int version_patch = 0;

} // namespace sumquery
