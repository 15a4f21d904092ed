#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace urlbar {

// $URLBAR_RESOURCES, falling back to the directory baked in at build time.
[[nodiscard]] std::filesystem::path resource_directory();

[[nodiscard]] std::filesystem::path resource_path(std::string_view name, std::string_view extension);

// Throws std::runtime_error if the file cannot be opened.
[[nodiscard]] std::vector<std::string> read_resource_lines(const std::filesystem::path &path);

} // namespace urlbar
