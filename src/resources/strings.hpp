#pragma once

#include <string_view>

namespace urlbar::strings {

inline constexpr std::string_view autocomplete_add_custom_url_error = "Please enter a valid URL";

} // namespace urlbar::strings
