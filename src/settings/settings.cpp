#include "settings/settings.hpp"

namespace urlbar {

std::string_view toggle_name(Toggle toggle) noexcept {
    switch (toggle) {
    case Toggle::DomainAutocomplete:
        return "enableDomainAutocomplete";
    case Toggle::CustomDomainAutocomplete:
        return "enableCustomDomainAutocomplete";
    }

    return {};
}

std::optional<Toggle> toggle_from_name(std::string_view name) noexcept {
    for (const auto toggle : {Toggle::DomainAutocomplete, Toggle::CustomDomainAutocomplete}) {
        if (toggle_name(toggle) == name) {
            return toggle;
        }
    }

    return std::nullopt;
}

} // namespace urlbar
