#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace urlbar {

class DomainMatcher {
  public:
    // Completion of `text` against `domain`, starting at the label the text matched.
    // A match that would only cover the top-level domain yields no completion.
    [[nodiscard]] std::optional<std::string> completion(std::string_view domain, std::string_view text) const;
};

} // namespace urlbar
