#include "completion/domain_matcher.hpp"

#include "core/ascii_case.hpp"

namespace urlbar {

std::optional<std::string> DomainMatcher::completion(std::string_view domain, std::string_view text) const {
    // The ".www." prefix lets one search match the bare domain, the www. form and
    // any inner label alike.
    std::string probe(".www.");
    probe.append(domain);

    std::string needle(".");
    needle.append(text);

    const auto match = find_ignoring_case(probe, needle);
    if (match == std::string_view::npos) {
        return std::nullopt;
    }

    std::string matched_domain = probe.substr(match + 1);

    if (matched_domain.find('.') == std::string::npos) {
        return std::nullopt;
    }

    if (matched_domain.find('/') == std::string::npos) {
        matched_domain.push_back('/');
    }

    return matched_domain;
}

} // namespace urlbar
