#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace urlbar {

class Settings;

// Read-only list of popular domains from a bundled newline-delimited resource.
// The resource is read on first use and cached for the lifetime of the source.
class TopDomainsSource {
  public:
    TopDomainsSource(const Settings &settings, std::filesystem::path resource_path);

    TopDomainsSource(const TopDomainsSource &) = delete;
    TopDomainsSource &operator=(const TopDomainsSource &) = delete;

    [[nodiscard]] bool enabled() const;

    // Throws std::runtime_error if the resource is missing.
    [[nodiscard]] const std::vector<std::string> &suggestions() const;

  private:
    const Settings &settings_;
    std::filesystem::path resource_path_;

    mutable std::once_flag load_once_;
    mutable std::vector<std::string> domains_;
};

} // namespace urlbar
