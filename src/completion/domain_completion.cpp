#include "completion/domain_completion.hpp"

#include <utility>

namespace urlbar {

DomainCompletion::DomainCompletion(std::vector<AutocompleteSource> sources) : sources_(std::move(sources)) {}

std::optional<std::string> DomainCompletion::complete(std::string_view text) const {
    if (text.empty()) {
        return std::nullopt;
    }

    for (const auto &source : sources_) {
        if (!source.enabled()) {
            continue;
        }

        auto completion = source.with_suggestions([&](const std::vector<std::string> &domains) {
            for (const auto &domain : domains) {
                if (auto match = matcher_.completion(domain, text); match.has_value()) {
                    return match;
                }
            }

            return std::optional<std::string>{};
        });

        if (completion.has_value()) {
            return completion;
        }
    }

    return std::nullopt;
}

} // namespace urlbar
