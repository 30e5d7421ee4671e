#pragma once

#include "shellwarden/common/result.hpp"
#include "shellwarden/tools/tool.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shellwarden::tools {

/// Tools whose calls run commands or touch external state. Every call to one of
/// these goes through the command filter before it may execute.
inline constexpr std::array<std::string_view, 6> kGatedToolNames = {
    "shell",          "grep",           "view", "search_documents_for",
    "get_url_content", "str_replace_based_edit_tool"};

struct ShellArgs {
  std::vector<std::string> command;
  std::optional<std::string> workdir;
  std::optional<int> timeout;
};

struct GrepArgs {
  std::string query;
  bool match_string = false;
  bool case_sensitive = false;
  std::optional<int> context_lines;
  std::optional<std::string> include_files;
  std::optional<std::string> exclude_files;
  std::optional<int> max_results;
};

struct ViewArgs {
  std::string path;
};

struct SearchDocumentsArgs {
  std::string query;
  std::string url;
};

struct GetUrlContentArgs {
  std::string url;
};

struct TextEditorArgs {
  std::string command;
  std::string path;
};

using GatedToolArgs = std::variant<ShellArgs, GrepArgs, ViewArgs, SearchDocumentsArgs,
                                   GetUrlContentArgs, TextEditorArgs>;

/// Human-readable description plus the command string sent to the risk assessor.
struct FormattedCommand {
  std::string description;
  std::string command;
};

[[nodiscard]] bool is_gated_tool(std::string_view name);

/// Decode a gated call's arguments. Fails for non-gated tools and for arguments that
/// do not fit the tool's schema.
[[nodiscard]] common::Result<GatedToolArgs> parse_gated_tool_call(const ToolCall &call);

/// Quote a token for POSIX sh when it contains whitespace or shell metacharacters.
[[nodiscard]] std::string shell_quote(const std::string &token);

[[nodiscard]] std::string format_shell_command(const std::vector<std::string> &tokens,
                                               const std::optional<std::string> &workdir);
[[nodiscard]] std::vector<std::string> format_grep_command(const GrepArgs &args);

[[nodiscard]] FormattedCommand format_command(std::string_view tool_name,
                                              const GatedToolArgs &args);

/// Format a call, falling back to its raw arguments when they cannot be decoded.
[[nodiscard]] FormattedCommand format_tool_call(const ToolCall &call);

} // namespace shellwarden::tools
