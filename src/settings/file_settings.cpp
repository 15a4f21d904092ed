#include "settings/file_settings.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace urlbar {

namespace {

constexpr std::string_view toggle_prefix = "toggle ";
constexpr std::string_view domain_prefix = "domain ";

constexpr bool default_toggle_value = true;

void parse_toggle_record(std::string_view record, std::map<Toggle, bool> &toggles) {
    const auto separator = record.find(' ');
    if (separator == std::string_view::npos) {
        return;
    }

    const auto toggle = toggle_from_name(record.substr(0, separator));
    if (!toggle.has_value()) {
        return;
    }

    const auto value = record.substr(separator + 1);
    if (value == "on") {
        toggles[*toggle] = true;
    } else if (value == "off") {
        toggles[*toggle] = false;
    }
}

} // namespace

FileSettings::FileSettings(std::filesystem::path path) : path_(std::move(path)) {}

std::filesystem::path FileSettings::default_path() {
    const char *settings_env = std::getenv("URLBAR_SETTINGS");
    if (settings_env != nullptr) {
        return settings_env;
    }

    const char *home = std::getenv("HOME");
    return std::filesystem::path(home != nullptr ? home : "") / ".urlbar_settings";
}

bool FileSettings::get_toggle(Toggle toggle) const {
    const auto snapshot = load();
    const auto it = snapshot.toggles.find(toggle);
    return it != snapshot.toggles.end() ? it->second : default_toggle_value;
}

void FileSettings::set_toggle(Toggle toggle, bool enabled) {
    auto snapshot = load();
    snapshot.toggles[toggle] = enabled;
    store(snapshot);
}

std::vector<std::string> FileSettings::custom_domains() const { return load().domains; }

void FileSettings::set_custom_domains(const std::vector<std::string> &domains) {
    auto snapshot = load();
    snapshot.domains = domains;
    store(snapshot);
}

FileSettings::Snapshot FileSettings::load() const {
    Snapshot snapshot;

    std::ifstream file(path_);
    if (!file.is_open()) {
        return snapshot;
    }

    std::string line;
    while (std::getline(file, line)) {
        const std::string_view record(line);

        if (record.starts_with(toggle_prefix)) {
            parse_toggle_record(record.substr(toggle_prefix.size()), snapshot.toggles);
        } else if (record.starts_with(domain_prefix)) {
            snapshot.domains.emplace_back(record.substr(domain_prefix.size()));
        }
    }

    return snapshot;
}

void FileSettings::store(const Snapshot &snapshot) const {
    for (const auto &domain : snapshot.domains) {
        if (domain.find_first_of("\r\n") != std::string::npos) {
            throw std::runtime_error("cannot store a domain with a line break in " + path_.string());
        }
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot write settings file " + path_.string());
    }

    for (const auto &[toggle, enabled] : snapshot.toggles) {
        file << toggle_prefix << toggle_name(toggle) << ' ' << (enabled ? "on" : "off") << '\n';
    }

    for (const auto &domain : snapshot.domains) {
        file << domain_prefix << domain << '\n';
    }

    file.flush();
    if (!file) {
        throw std::runtime_error("failed writing settings file " + path_.string());
    }
}

} // namespace urlbar
