#include "resources/bundled_resource.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

#ifndef URLBAR_RESOURCE_DIR
#define URLBAR_RESOURCE_DIR "resources"
#endif

namespace urlbar {

std::filesystem::path resource_directory() {
    const char *resources_env = std::getenv("URLBAR_RESOURCES");
    return resources_env != nullptr ? std::filesystem::path(resources_env) : std::filesystem::path(URLBAR_RESOURCE_DIR);
}

std::filesystem::path resource_path(std::string_view name, std::string_view extension) {
    std::string filename(name);
    filename.push_back('.');
    filename.append(extension);

    return resource_directory() / filename;
}

std::vector<std::string> read_resource_lines(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("missing bundled resource " + path.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }

    if (file.bad()) {
        throw std::runtime_error("cannot read bundled resource " + path.string());
    }

    return lines;
}

} // namespace urlbar
