#include "completion/top_domains_source.hpp"

#include <utility>

#include "resources/bundled_resource.hpp"
#include "settings/settings.hpp"

namespace urlbar {

TopDomainsSource::TopDomainsSource(const Settings &settings, std::filesystem::path resource_path)
    : settings_(settings), resource_path_(std::move(resource_path)) {}

bool TopDomainsSource::enabled() const { return settings_.get_toggle(Toggle::DomainAutocomplete); }

const std::vector<std::string> &TopDomainsSource::suggestions() const {
    std::call_once(load_once_, [this]() {
        for (auto &line : read_resource_lines(resource_path_)) {
            if (line.ends_with('\r')) {
                line.pop_back();
            }

            if (!line.empty()) {
                domains_.push_back(std::move(line));
            }
        }
    });

    return domains_;
}

} // namespace urlbar
