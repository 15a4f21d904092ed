#include "commands/command_registry.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <ostream>
#include <system_error>

#include "completion/custom_completion_source.hpp"
#include "settings/settings.hpp"

namespace urlbar {

namespace {

[[nodiscard]] std::optional<std::size_t> parse_index(std::string_view token) {
    std::size_t index = 0;
    const char *first = token.data();
    const char *last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, index);

    if (token.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }

    return index;
}

[[nodiscard]] std::string_view describe(CompletionSourceError error) {
    const auto message = error_message(error);
    if (!message.empty()) {
        return message;
    }

    switch (error) {
    case CompletionSourceError::DuplicateDomain:
        return "domain already in list";
    case CompletionSourceError::IndexOutOfRange:
        return "index out of range";
    case CompletionSourceError::InvalidUrl:
        break;
    }

    return "invalid URL";
}

[[nodiscard]] int report(std::string_view command, const CustomCompletionResult &result, std::ostream &err) {
    if (result.has_value()) {
        return 0;
    }

    err << command << ": " << describe(result.error()) << std::endl;
    return 1;
}

} // namespace

CommandRegistry::CommandRegistry(CustomCompletionSource &custom_source, Settings &settings)
    : custom_source_(custom_source), settings_(settings) {
    register_commands();
}

int CommandRegistry::execute(
    std::string_view name, const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    auto it = registry_.find(std::string(name));
    if (it == registry_.end()) {
        err << name << ": unknown command" << std::endl;
        return 1;
    }

    return it->second(args, out, err);
}

bool CommandRegistry::exit_requested() const noexcept { return exit_requested_; }

void CommandRegistry::register_commands() {
    registry_["list"] = [this](const auto &args, auto &out, auto &err) { return command_list(args, out, err); };
    registry_["add"] = [this](const auto &args, auto &out, auto &err) { return command_add(args, out, err); };
    registry_["remove"] = [this](const auto &args, auto &out, auto &err) { return command_remove(args, out, err); };
    registry_["move"] = [this](const auto &args, auto &out, auto &err) { return command_move(args, out, err); };
    registry_["toggle"] = [this](const auto &args, auto &out, auto &err) { return command_toggle(args, out, err); };
    registry_["exit"] = [this](const auto &args, auto &out, auto &err) { return command_exit(args, out, err); };
}

int CommandRegistry::command_list(const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream & /*err*/) {
    const auto domains = custom_source_.suggestions();

    for (std::size_t i = 0; i < domains.size(); ++i) {
        out << i << "  " << domains[i] << '\n';
    }

    out.flush();
    return 0;
}

int CommandRegistry::command_add(const std::vector<std::string> &args, std::ostream & /*out*/, std::ostream &err) {
    if (args.empty() || args.size() > 2) {
        err << "add: usage: add <domain> [index]" << std::endl;
        return 1;
    }

    if (args.size() == 1) {
        return report("add", custom_source_.add(args[0]), err);
    }

    const auto index = parse_index(args[1]);
    if (!index.has_value()) {
        err << "add: invalid index" << std::endl;
        return 1;
    }

    return report("add", custom_source_.add(args[0], *index), err);
}

int CommandRegistry::command_remove(const std::vector<std::string> &args, std::ostream & /*out*/, std::ostream &err) {
    if (args.size() != 1) {
        err << "remove: usage: remove <index>" << std::endl;
        return 1;
    }

    const auto index = parse_index(args[0]);
    if (!index.has_value()) {
        err << "remove: invalid index" << std::endl;
        return 1;
    }

    return report("remove", custom_source_.remove(*index), err);
}

int CommandRegistry::command_move(const std::vector<std::string> &args, std::ostream & /*out*/, std::ostream &err) {
    if (args.size() != 2) {
        err << "move: usage: move <from> <to>" << std::endl;
        return 1;
    }

    const auto from = parse_index(args[0]);
    const auto to = parse_index(args[1]);
    if (!from.has_value() || !to.has_value()) {
        err << "move: invalid index" << std::endl;
        return 1;
    }

    return report("move", custom_source_.move(*from, *to), err);
}

int CommandRegistry::command_toggle(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (args.empty() || args.size() > 2) {
        err << "toggle: usage: toggle <name> [on|off]" << std::endl;
        return 1;
    }

    const auto toggle = toggle_from_name(args[0]);
    if (!toggle.has_value()) {
        err << "toggle: unknown toggle " << args[0] << std::endl;
        return 1;
    }

    if (args.size() == 1) {
        out << toggle_name(*toggle) << ' ' << (settings_.get_toggle(*toggle) ? "on" : "off") << std::endl;
        return 0;
    }

    if (args[1] != "on" && args[1] != "off") {
        err << "toggle: expected on or off" << std::endl;
        return 1;
    }

    settings_.set_toggle(*toggle, args[1] == "on");
    return 0;
}

int CommandRegistry::command_exit(const std::vector<std::string> & /*args*/, std::ostream & /*out*/, std::ostream & /*err*/) {
    exit_requested_ = true;
    return 0;
}

} // namespace urlbar
