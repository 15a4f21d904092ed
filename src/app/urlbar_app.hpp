#pragma once

#include <iosfwd>
#include <string_view>

#include "commands/command_registry.hpp"
#include "completion/custom_completion_source.hpp"
#include "completion/domain_completion.hpp"
#include "completion/top_domains_source.hpp"
#include "core/command_line.hpp"
#include "line_editing/completion.hpp"
#include "settings/file_settings.hpp"

namespace urlbar {

class UrlbarApp {
  public:
    UrlbarApp();

    int run();

    // Handles one entered line: a ':' command or address-bar text to complete.
    // Returns the exit status of the command, 0 for address-bar text.
    int handle_line(std::string_view input, std::ostream &out, std::ostream &err);

    [[nodiscard]] bool exit_requested() const noexcept;

  private:
    FileSettings settings_;
    CustomCompletionSource custom_source_;
    TopDomainsSource top_domains_source_;
    DomainCompletion domain_completion_;
    CommandParser command_parser_;
    CommandRegistry command_registry_;
    CompletionEngine completion_engine_;
    int last_status_{0};
};

} // namespace urlbar
