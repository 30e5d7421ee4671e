#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shellwarden::security {

/// Read-only verbs that never need a risk assessment.
inline constexpr std::array<std::string_view, 35> kSafeReadCommands = {
    "ls",     "cat",      "head",  "tail",    "less",     "more",   "grep",
    "find",   "locate",   "file",  "stat",    "du",       "df",     "ps",
    "top",    "htop",     "free",  "uptime",  "who",      "whoami", "w",
    "id",     "pwd",      "echo",  "printenv", "env",     "which",  "whereis",
    "man",    "help",     "info",  "type",    "hash",     "history", "alias"};

/// Prefix match of the lower-cased command string against kSafeReadCommands. A bare
/// prefix is enough, so "wc -l" matches "w".
[[nodiscard]] bool is_safe_read_command(const std::string &command);

/// True when a shell invocation can run without asking the risk assessor: read-only
/// verbs, `git status`, local `./*.py` scripts, `sed` without in-place editing, and
/// `chmod <mode> <path>...`. An optional leading `sudo` is ignored.
[[nodiscard]] bool is_known_safe_command(const std::vector<std::string> &tokens,
                                         const std::optional<std::string> &workdir = std::nullopt);

[[nodiscard]] bool is_chmod_mode(const std::string &mode);

} // namespace shellwarden::security
