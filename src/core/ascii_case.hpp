#pragma once

#include <cstddef>
#include <string_view>

namespace urlbar {

[[nodiscard]] char to_ascii_lower(char c) noexcept;

[[nodiscard]] bool equals_ignoring_case(std::string_view lhs, std::string_view rhs) noexcept;

// Returns std::string_view::npos when needle does not occur in haystack.
[[nodiscard]] std::size_t find_ignoring_case(std::string_view haystack, std::string_view needle) noexcept;

} // namespace urlbar
