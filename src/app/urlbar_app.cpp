#include "app/urlbar_app.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include <readline/history.h>
#include <readline/readline.h>

#include "resources/bundled_resource.hpp"

namespace urlbar {

// Custom domains take priority over the bundled list.
UrlbarApp::UrlbarApp()
    : settings_(FileSettings::default_path()),
      custom_source_(settings_),
      top_domains_source_(settings_, resource_path("topdomains", "txt")),
      domain_completion_({custom_source_, top_domains_source_}),
      command_parser_(),
      command_registry_(custom_source_, settings_),
      completion_engine_(domain_completion_) {}

int UrlbarApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    completion_engine_.install();
    using_history();

    while (!exit_requested()) {
        char *line = readline("urlbar> ");
        const bool end_of_input = line == nullptr;
        std::string input(end_of_input ? "" : line);
        std::free(line);

        completion_engine_.rethrow_pending_failure();

        if (end_of_input) {
            std::cout << std::endl;
            break;
        }

        if (!input.empty()) {
            add_history(input.c_str());
        }

        last_status_ = handle_line(input, std::cout, std::cerr);
    }

    return last_status_;
}

int UrlbarApp::handle_line(std::string_view input, std::ostream &out, std::ostream &err) {
    if (input.empty()) {
        return 0;
    }

    if (!is_command_line(input)) {
        const auto completion = domain_completion_.complete(input);
        out << (completion.has_value() ? *completion : "no completion") << std::endl;
        return 0;
    }

    auto command = command_parser_.parse(input);
    if (!command.has_value()) {
        err << command.error().message << std::endl;
        return 1;
    }

    return command_registry_.execute(command->name, command->args, out, err);
}

bool UrlbarApp::exit_requested() const noexcept { return command_registry_.exit_requested(); }

} // namespace urlbar
