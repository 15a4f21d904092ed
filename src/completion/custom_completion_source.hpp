#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "completion/completion_error.hpp"

namespace urlbar {

class Settings;

// Strips leading whitespace, an http:// or https:// scheme and a www. prefix from
// the front of the input (case-insensitively), then a single trailing '/'.
[[nodiscard]] std::string sanitize_domain(std::string_view input);

// User-managed domain list. Every call goes through Settings; nothing is cached.
class CustomCompletionSource {
  public:
    explicit CustomCompletionSource(Settings &settings);

    [[nodiscard]] bool enabled() const;
    [[nodiscard]] std::vector<std::string> suggestions() const;

    [[nodiscard]] CustomCompletionResult add(std::string_view suggestion);
    [[nodiscard]] CustomCompletionResult add(std::string_view suggestion, std::size_t index);
    [[nodiscard]] CustomCompletionResult remove(std::size_t index);
    [[nodiscard]] CustomCompletionResult move(std::size_t from, std::size_t to);

  private:
    Settings &settings_;

    [[nodiscard]] static std::expected<void, CompletionSourceError> validate(
        std::string_view suggestion, const std::vector<std::string> &domains);
};

} // namespace urlbar
