#include "line_editing/completion.hpp"

#include <cstdlib>
#include <cstring>
#include <utility>

#include <readline/readline.h>

#include "completion/domain_completion.hpp"
#include "core/command_line.hpp"

namespace urlbar {

namespace {

// Domains may contain most punctuation, so only whitespace separates words.
char word_break_characters[] = " \t\n";

} // namespace

CompletionEngine *CompletionEngine::instance_ = nullptr;

CompletionEngine::CompletionEngine(const DomainCompletion &domain_completion) : domain_completion_(domain_completion) {}

void CompletionEngine::install() {
    instance_ = this;
    rl_attempted_completion_function = &CompletionEngine::completion_callback;
    rl_completer_word_break_characters = word_break_characters;
}

void CompletionEngine::rethrow_pending_failure() {
    if (pending_failure_) {
        std::rethrow_exception(std::exchange(pending_failure_, nullptr));
    }
}

char **CompletionEngine::completion_callback(const char *text, int start, int /*end*/) {
    rl_attempted_completion_over = 1;
    rl_completion_append_character = '\0';

    if (instance_ == nullptr || start != 0) {
        return nullptr;
    }

    return rl_completion_matches(text, &CompletionEngine::generator_callback);
}

char *CompletionEngine::generator_callback(const char *text, int state) {
    if (instance_ == nullptr || state != 0) {
        return nullptr;
    }

    const std::string_view line = rl_line_buffer != nullptr ? rl_line_buffer : "";
    const auto completion = instance_->collect_completion(line, text);
    if (!completion.has_value()) {
        return nullptr;
    }

    return ::strdup(completion->c_str());
}

std::optional<std::string> CompletionEngine::collect_completion(std::string_view line, std::string_view text) {
    if (is_command_line(line)) {
        return std::nullopt;
    }

    // Exceptions must not unwind through readline's C frames.
    try {
        return domain_completion_.complete(text);
    } catch (...) {
        pending_failure_ = std::current_exception();
        rl_done = 1;
        return std::nullopt;
    }
}

} // namespace urlbar
