#include "core/command_line.hpp"

#include <cctype>
#include <iterator>
#include <utility>

namespace urlbar {

bool is_command_line(std::string_view input) noexcept { return input.starts_with(command_marker); }

std::expected<CommandLine, ParseError> CommandParser::parse(std::string_view input) const {
    if (!is_command_line(input)) {
        return std::unexpected(ParseError{"commands start with ':'"});
    }

    auto words = split_words(input.substr(1));
    if (!words.has_value()) {
        return std::unexpected(std::move(words.error()));
    }

    if (words->empty()) {
        return std::unexpected(ParseError{"missing command name"});
    }

    CommandLine command;
    command.name = std::move(words->front());
    command.args.assign(std::make_move_iterator(words->begin() + 1), std::make_move_iterator(words->end()));

    return command;
}

std::expected<std::vector<std::string>, ParseError> CommandParser::split_words(std::string_view input) const {
    std::vector<std::string> words;
    std::string word;

    bool single_quoted = false;
    bool double_quoted = false;
    bool escaped = false;
    // Set by a quote pair so that '' and "" produce an empty word.
    bool word_started = false;

    for (const char current : input) {
        if (escaped) {
            if (double_quoted && current != '\\' && current != '"') {
                word.push_back('\\');
            }
            word.push_back(current);
            escaped = false;
            continue;
        }

        if (current == '\\' && !single_quoted) {
            escaped = true;
            word_started = true;
            continue;
        }

        if (current == '\'' && !double_quoted) {
            single_quoted = !single_quoted;
            word_started = true;
            continue;
        }

        if (current == '"' && !single_quoted) {
            double_quoted = !double_quoted;
            word_started = true;
            continue;
        }

        if (!single_quoted && !double_quoted && std::isspace(static_cast<unsigned char>(current))) {
            if (word_started || !word.empty()) {
                words.push_back(std::move(word));
                word.clear();
                word_started = false;
            }
            continue;
        }

        word.push_back(current);
    }

    if (single_quoted || double_quoted) {
        return std::unexpected(ParseError{"unterminated quote"});
    }

    if (escaped) {
        return std::unexpected(ParseError{"trailing backslash"});
    }

    if (word_started || !word.empty()) {
        words.push_back(std::move(word));
    }

    return words;
}

} // namespace urlbar
