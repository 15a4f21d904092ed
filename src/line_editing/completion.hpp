#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace urlbar {

class DomainCompletion;

// Bridges readline's completion hook to DomainCompletion. Tab on address-bar text
// replaces the typed word with the inline completion.
class CompletionEngine {
  public:
    explicit CompletionEngine(const DomainCompletion &domain_completion);

    void install();

    // Rethrows a failure captured inside a readline callback, if any.
    void rethrow_pending_failure();

  private:
    const DomainCompletion &domain_completion_;
    std::exception_ptr pending_failure_;

    static CompletionEngine *instance_;

    static char **completion_callback(const char *text, int start, int end);
    static char *generator_callback(const char *text, int state);

    [[nodiscard]] std::optional<std::string> collect_completion(std::string_view line, std::string_view text);
};

} // namespace urlbar
