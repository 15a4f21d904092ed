#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "completion/autocomplete_source.hpp"
#include "completion/domain_matcher.hpp"

namespace urlbar {

// Finds the inline completion for typed address-bar text. Sources are consulted in
// the order given; the first matching domain wins.
class DomainCompletion {
  public:
    explicit DomainCompletion(std::vector<AutocompleteSource> sources);

    [[nodiscard]] std::optional<std::string> complete(std::string_view text) const;

  private:
    std::vector<AutocompleteSource> sources_;
    DomainMatcher matcher_;
};

} // namespace urlbar
