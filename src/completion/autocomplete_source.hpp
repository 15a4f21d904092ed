#pragma once

#include <variant>

#include "completion/custom_completion_source.hpp"
#include "completion/top_domains_source.hpp"

namespace urlbar {

// Non-owning handle to one of the suggestion providers. The referenced source must
// outlive the handle.
class AutocompleteSource {
  public:
    AutocompleteSource(CustomCompletionSource &source) noexcept : source_(&source) {}
    AutocompleteSource(TopDomainsSource &source) noexcept : source_(&source) {}

    [[nodiscard]] bool enabled() const {
        return std::visit([](const auto *source) { return source->enabled(); }, source_);
    }

    // Calls `fn` with the source's suggestion list without copying cached lists.
    template <typename Fn>
    decltype(auto) with_suggestions(Fn &&fn) const {
        return std::visit([&](const auto *source) -> decltype(auto) { return fn(source->suggestions()); }, source_);
    }

  private:
    std::variant<CustomCompletionSource *, TopDomainsSource *> source_;
};

} // namespace urlbar
