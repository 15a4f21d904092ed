#pragma once

#include <expected>
#include <string_view>

namespace urlbar {

enum class CompletionSourceError {
    InvalidUrl,
    DuplicateDomain,
    IndexOutOfRange,
};

using CustomCompletionResult = std::expected<void, CompletionSourceError>;

// User-facing text for the error. Only InvalidUrl carries a message.
[[nodiscard]] std::string_view error_message(CompletionSourceError error) noexcept;

} // namespace urlbar
