#include "core/ascii_case.hpp"

#include <algorithm>
#include <cctype>

namespace urlbar {

namespace {

[[nodiscard]] bool same_ignoring_case(char lhs, char rhs) noexcept {
    return to_ascii_lower(lhs) == to_ascii_lower(rhs);
}

} // namespace

char to_ascii_lower(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool equals_ignoring_case(std::string_view lhs, std::string_view rhs) noexcept {
    return std::ranges::equal(lhs, rhs, same_ignoring_case);
}

std::size_t find_ignoring_case(std::string_view haystack, std::string_view needle) noexcept {
    const auto match = std::ranges::search(haystack, needle, same_ignoring_case);
    if (match.begin() == haystack.end() && !needle.empty()) {
        return std::string_view::npos;
    }

    return static_cast<std::size_t>(match.begin() - haystack.begin());
}

} // namespace urlbar
