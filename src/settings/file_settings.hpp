#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "settings/settings.hpp"

namespace urlbar {

// Settings stored as a line-oriented text file:
//
//   toggle enableDomainAutocomplete on
//   domain example.com
//
// The file is re-read on every query and rewritten on every update.
class FileSettings : public Settings {
  public:
    explicit FileSettings(std::filesystem::path path);

    // $URLBAR_SETTINGS, falling back to $HOME/.urlbar_settings.
    [[nodiscard]] static std::filesystem::path default_path();

    [[nodiscard]] bool get_toggle(Toggle toggle) const override;
    void set_toggle(Toggle toggle, bool enabled) override;

    [[nodiscard]] std::vector<std::string> custom_domains() const override;
    void set_custom_domains(const std::vector<std::string> &domains) override;

  private:
    struct Snapshot {
        std::map<Toggle, bool> toggles;
        std::vector<std::string> domains;
    };

    std::filesystem::path path_;

    [[nodiscard]] Snapshot load() const;
    void store(const Snapshot &snapshot) const;
};

} // namespace urlbar
