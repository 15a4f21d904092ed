#include "completion/custom_completion_source.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <utility>

#include "core/ascii_case.hpp"
#include "settings/settings.hpp"

namespace urlbar {

namespace {

[[nodiscard]] std::string_view drop_prefix_ignoring_case(std::string_view input, std::string_view prefix) {
    if (input.size() >= prefix.size() && equals_ignoring_case(input.substr(0, prefix.size()), prefix)) {
        input.remove_prefix(prefix.size());
    }

    return input;
}

} // namespace

std::string sanitize_domain(std::string_view input) {
    const auto first_visible = std::ranges::find_if_not(input, [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
    input.remove_prefix(static_cast<std::size_t>(first_visible - input.begin()));

    constexpr std::array<std::string_view, 2> schemes{"https://", "http://"};
    for (const auto scheme : schemes) {
        const auto stripped = drop_prefix_ignoring_case(input, scheme);
        if (stripped.size() != input.size()) {
            input = stripped;
            break;
        }
    }

    input = drop_prefix_ignoring_case(input, "www.");

    if (input.ends_with('/')) {
        input.remove_suffix(1);
    }

    return std::string(input);
}

CustomCompletionSource::CustomCompletionSource(Settings &settings) : settings_(settings) {}

bool CustomCompletionSource::enabled() const { return settings_.get_toggle(Toggle::CustomDomainAutocomplete); }

std::vector<std::string> CustomCompletionSource::suggestions() const { return settings_.custom_domains(); }

std::expected<void, CompletionSourceError> CustomCompletionSource::validate(
    std::string_view suggestion, const std::vector<std::string> &domains) {
    // The input is stored verbatim, one record per line.
    const bool has_control = std::ranges::any_of(
        suggestion, [](char c) { return std::iscntrl(static_cast<unsigned char>(c)) != 0; });
    if (has_control) {
        return std::unexpected(CompletionSourceError::InvalidUrl);
    }

    const auto sanitized = sanitize_domain(suggestion);

    // "/" alone sanitizes to an empty string.
    if (sanitized.empty() || sanitized.find('.') == std::string::npos) {
        return std::unexpected(CompletionSourceError::InvalidUrl);
    }

    const bool duplicate = std::ranges::any_of(domains, [&](const std::string &domain) {
        return equals_ignoring_case(sanitize_domain(domain), sanitized);
    });

    if (duplicate) {
        return std::unexpected(CompletionSourceError::DuplicateDomain);
    }

    return {};
}

CustomCompletionResult CustomCompletionSource::add(std::string_view suggestion) {
    auto domains = suggestions();

    if (auto valid = validate(suggestion, domains); !valid.has_value()) {
        return valid;
    }

    domains.emplace_back(suggestion);
    settings_.set_custom_domains(domains);

    return {};
}

CustomCompletionResult CustomCompletionSource::add(std::string_view suggestion, std::size_t index) {
    auto domains = suggestions();

    if (auto valid = validate(suggestion, domains); !valid.has_value()) {
        return valid;
    }

    if (index > domains.size()) {
        return std::unexpected(CompletionSourceError::IndexOutOfRange);
    }

    domains.emplace(domains.begin() + static_cast<std::ptrdiff_t>(index), suggestion);
    settings_.set_custom_domains(domains);

    return {};
}

CustomCompletionResult CustomCompletionSource::remove(std::size_t index) {
    auto domains = suggestions();

    if (index >= domains.size()) {
        return std::unexpected(CompletionSourceError::IndexOutOfRange);
    }

    domains.erase(domains.begin() + static_cast<std::ptrdiff_t>(index));
    settings_.set_custom_domains(domains);

    return {};
}

CustomCompletionResult CustomCompletionSource::move(std::size_t from, std::size_t to) {
    auto domains = suggestions();

    if (from >= domains.size() || to >= domains.size()) {
        return std::unexpected(CompletionSourceError::IndexOutOfRange);
    }

    auto domain = std::move(domains[from]);
    domains.erase(domains.begin() + static_cast<std::ptrdiff_t>(from));
    domains.insert(domains.begin() + static_cast<std::ptrdiff_t>(to), std::move(domain));
    settings_.set_custom_domains(domains);

    return {};
}

} // namespace urlbar
