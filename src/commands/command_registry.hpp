#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace urlbar {

class CustomCompletionSource;
class Settings;

// Address-bar commands for managing the custom domain list and the source toggles.
class CommandRegistry {
  public:
    using CommandFunc = std::function<int(const std::vector<std::string> &, std::ostream &, std::ostream &)>;

    CommandRegistry(CustomCompletionSource &custom_source, Settings &settings);

    int execute(std::string_view name, const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

    [[nodiscard]] bool exit_requested() const noexcept;

  private:
    CustomCompletionSource &custom_source_;
    Settings &settings_;
    bool exit_requested_{false};
    std::unordered_map<std::string, CommandFunc> registry_;

    void register_commands();

    int command_list(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_add(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_remove(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_move(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_toggle(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_exit(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
};

} // namespace urlbar
