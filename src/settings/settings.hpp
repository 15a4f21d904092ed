#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace urlbar {

enum class Toggle {
    DomainAutocomplete,
    CustomDomainAutocomplete,
};

[[nodiscard]] std::string_view toggle_name(Toggle toggle) noexcept;
[[nodiscard]] std::optional<Toggle> toggle_from_name(std::string_view name) noexcept;

// Persistent key-value store backing the suggestion sources. Implementations are
// expected to be synchronous and durable across restarts.
class Settings {
  public:
    virtual ~Settings() = default;

    [[nodiscard]] virtual bool get_toggle(Toggle toggle) const = 0;
    virtual void set_toggle(Toggle toggle, bool enabled) = 0;

    [[nodiscard]] virtual std::vector<std::string> custom_domains() const = 0;
    virtual void set_custom_domains(const std::vector<std::string> &domains) = 0;
};

} // namespace urlbar
