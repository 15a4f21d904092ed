#include "completion/completion_error.hpp"

#include "resources/strings.hpp"

namespace urlbar {

std::string_view error_message(CompletionSourceError error) noexcept {
    if (error != CompletionSourceError::InvalidUrl) {
        return {};
    }

    return strings::autocomplete_add_custom_url_error;
}

} // namespace urlbar
