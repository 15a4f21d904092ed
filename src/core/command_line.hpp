#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace urlbar {

inline constexpr char command_marker = ':';

struct CommandLine {
    std::string name;
    std::vector<std::string> args;
};

struct ParseError {
    std::string message;
};

// Lines starting with ':' are commands; anything else is address-bar text.
[[nodiscard]] bool is_command_line(std::string_view input) noexcept;

class CommandParser {
  public:
    // Splits ":name arg ..." into words. Single quotes, double quotes and backslash
    // escapes behave as in a POSIX shell.
    [[nodiscard]] std::expected<CommandLine, ParseError> parse(std::string_view input) const;

  private:
    [[nodiscard]] std::expected<std::vector<std::string>, ParseError> split_words(std::string_view input) const;
};

} // namespace urlbar
