#include "shellwarden/security/command_safety.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/tools/gated_tools.hpp"

#include <algorithm>
#include <regex>

namespace shellwarden::security {

namespace {

bool has_in_place_flag(const std::vector<std::string> &args) {
  return std::any_of(args.begin(), args.end(), [](const std::string &arg) {
    return common::starts_with(arg, "-i") || common::starts_with(arg, "--in-place");
  });
}

bool is_safe_chmod(const std::vector<std::string> &args) {
  std::vector<std::string> operands;
  for (const auto &arg : args) {
    if (!common::starts_with(arg, "-")) {
      operands.push_back(arg);
    }
  }
  // Mode plus at least one path.
  if (operands.size() < 2) {
    return false;
  }
  return is_chmod_mode(operands.front());
}

} // namespace

bool is_safe_read_command(const std::string &command) {
  const std::string lowered = common::to_lower(command);
  return std::any_of(kSafeReadCommands.begin(), kSafeReadCommands.end(),
                     [&lowered](std::string_view verb) {
                       return lowered.compare(0, verb.size(), verb) == 0;
                     });
}

bool is_chmod_mode(const std::string &mode) {
  static const std::regex symbolic(R"(^[ugoa]*[+\-=][rwxstugo]+$)");
  static const std::regex octal(R"(^[0-7]{3,4}$)");
  return std::regex_match(mode, symbolic) || std::regex_match(mode, octal);
}

bool is_known_safe_command(const std::vector<std::string> &tokens,
                           const std::optional<std::string> &workdir) {
  if (tokens.empty()) {
    return false;
  }

  const std::string rendered = tools::format_shell_command(tokens, workdir);
  if (is_safe_read_command(rendered)) {
    return true;
  }
  if (common::starts_with(rendered, "sudo ") && is_safe_read_command(rendered.substr(5))) {
    return true;
  }

  std::vector<std::string> lowered;
  lowered.reserve(tokens.size());
  for (const auto &token : tokens) {
    lowered.push_back(common::to_lower(token));
  }

  const std::size_t offset = lowered.front() == "sudo" ? 1 : 0;
  if (offset >= lowered.size() || lowered[offset].empty()) {
    return false;
  }
  const std::string &verb = lowered[offset];
  const std::vector<std::string> args(lowered.begin() + static_cast<std::ptrdiff_t>(offset) + 1,
                                      lowered.end());

  if (verb == "git" && std::find(args.begin(), args.end(), "status") != args.end()) {
    return true;
  }
  if (common::starts_with(tokens[offset], "./") && common::ends_with(verb, ".py")) {
    return true;
  }
  if (verb == "sed") {
    return !has_in_place_flag(args);
  }
  if (verb == "chmod") {
    return is_safe_chmod(args);
  }
  return false;
}

} // namespace shellwarden::security
