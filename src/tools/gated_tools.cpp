#include "shellwarden/tools/gated_tools.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/common/json_util.hpp"

#include <algorithm>
#include <charconv>
#include <type_traits>

namespace shellwarden::tools {

namespace {

using Fields = common::JsonFlatMap;

constexpr std::string_view kShellMetacharacters = " \t\n\r'\"\\$`;&|<>()*?[]{}!#~";

std::optional<std::string> optional_field(const Fields &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second == "null") {
    return std::nullopt;
  }
  return it->second;
}

common::Result<std::string> required_field(const Fields &fields, const std::string &key) {
  auto value = optional_field(fields, key);
  if (!value.has_value()) {
    return common::Result<std::string>::failure("missing required argument: " + key);
  }
  return common::Result<std::string>::success(std::move(*value));
}

std::optional<int> optional_int(const Fields &fields, const std::string &key) {
  const auto raw = optional_field(fields, key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  int parsed = 0;
  const auto *first = raw->data();
  const auto *last = raw->data() + raw->size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

bool optional_bool(const Fields &fields, const std::string &key) {
  const auto raw = optional_field(fields, key);
  return raw.has_value() && *raw == "true";
}

common::Result<GatedToolArgs> parse_shell(const Fields &fields) {
  const auto raw = optional_field(fields, "command");
  if (!raw.has_value()) {
    return common::Result<GatedToolArgs>::failure("missing required argument: command");
  }
  auto tokens = common::json_parse_string_array(*raw);
  if (!tokens.has_value()) {
    return common::Result<GatedToolArgs>::failure("shell command must be an array of strings");
  }
  ShellArgs args;
  args.command = std::move(*tokens);
  args.workdir = optional_field(fields, "workdir");
  args.timeout = optional_int(fields, "timeout");
  return common::Result<GatedToolArgs>::success(std::move(args));
}

common::Result<GatedToolArgs> parse_grep(const Fields &fields) {
  auto query = required_field(fields, "query");
  if (!query.ok()) {
    return common::Result<GatedToolArgs>::failure(query.error());
  }
  GrepArgs args;
  args.query = query.value();
  args.match_string = optional_bool(fields, "match_string");
  args.case_sensitive = optional_bool(fields, "case_sensitive");
  args.context_lines = optional_int(fields, "context_lines");
  args.include_files = optional_field(fields, "include_files");
  args.exclude_files = optional_field(fields, "exclude_files");
  args.max_results = optional_int(fields, "max_results");
  return common::Result<GatedToolArgs>::success(std::move(args));
}

} // namespace

bool is_gated_tool(const std::string_view name) {
  return std::find(kGatedToolNames.begin(), kGatedToolNames.end(), name) !=
         kGatedToolNames.end();
}

common::Result<GatedToolArgs> parse_gated_tool_call(const ToolCall &call) {
  const std::string args_json = common::trim(call.args_json);
  if (args_json.empty() || args_json.front() != '{') {
    return common::Result<GatedToolArgs>::failure("arguments for " + call.name +
                                                  " must be a JSON object");
  }
  const auto fields = common::json_parse_flat(args_json);

  if (call.name == "shell") {
    return parse_shell(fields);
  }
  if (call.name == "grep") {
    return parse_grep(fields);
  }
  if (call.name == "view") {
    auto path = required_field(fields, "path");
    if (!path.ok()) {
      return common::Result<GatedToolArgs>::failure(path.error());
    }
    return common::Result<GatedToolArgs>::success(ViewArgs{.path = path.value()});
  }
  if (call.name == "search_documents_for") {
    auto query = required_field(fields, "query");
    auto url = required_field(fields, "url");
    if (!query.ok() || !url.ok()) {
      return common::Result<GatedToolArgs>::failure(!query.ok() ? query.error() : url.error());
    }
    return common::Result<GatedToolArgs>::success(
        SearchDocumentsArgs{.query = query.value(), .url = url.value()});
  }
  if (call.name == "get_url_content") {
    auto url = required_field(fields, "url");
    if (!url.ok()) {
      return common::Result<GatedToolArgs>::failure(url.error());
    }
    return common::Result<GatedToolArgs>::success(GetUrlContentArgs{.url = url.value()});
  }
  if (call.name == "str_replace_based_edit_tool") {
    auto command = required_field(fields, "command");
    auto path = required_field(fields, "path");
    if (!command.ok() || !path.ok()) {
      return common::Result<GatedToolArgs>::failure(!command.ok() ? command.error()
                                                                  : path.error());
    }
    return common::Result<GatedToolArgs>::success(
        TextEditorArgs{.command = command.value(), .path = path.value()});
  }
  return common::Result<GatedToolArgs>::failure("not a gated tool: " + call.name);
}

std::string shell_quote(const std::string &token) {
  if (!token.empty() && token.find_first_of(kShellMetacharacters) == std::string::npos) {
    return token;
  }
  std::string out = "'";
  for (const char ch : token) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out += "'";
  return out;
}

std::string format_shell_command(const std::vector<std::string> &tokens,
                                 const std::optional<std::string> &workdir) {
  std::string out;
  for (const auto &token : tokens) {
    if (!out.empty()) {
      out += " ";
    }
    out += shell_quote(token);
  }
  if (workdir.has_value() && !workdir->empty()) {
    out += " [workdir: " + *workdir + "]";
  }
  return out;
}

std::vector<std::string> format_grep_command(const GrepArgs &args) {
  std::vector<std::string> out = {"rg", "--color=never", "--line-number"};
  if (!args.case_sensitive) {
    out.emplace_back("-i");
  }
  if (args.match_string) {
    out.emplace_back("--fixed-strings");
  }
  if (args.context_lines.has_value() && *args.context_lines > 0) {
    out.emplace_back("-C");
    out.push_back(std::to_string(*args.context_lines));
  }
  if (args.max_results.has_value() && *args.max_results > 0) {
    out.emplace_back("--max-count");
    out.push_back(std::to_string(*args.max_results));
  }
  if (args.include_files.has_value() && !args.include_files->empty()) {
    out.emplace_back("--glob");
    out.push_back(shell_quote(*args.include_files));
  }
  if (args.exclude_files.has_value() && !args.exclude_files->empty()) {
    out.emplace_back("--glob");
    out.push_back(shell_quote("!" + *args.exclude_files));
  }
  out.emplace_back("--");
  out.push_back(shell_quote(args.query));
  return out;
}

FormattedCommand format_command(const std::string_view tool_name, const GatedToolArgs &args) {
  const std::string name(tool_name);
  return std::visit(
      [&name](const auto &value) -> FormattedCommand {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, ShellArgs>) {
          const auto command = format_shell_command(value.command, value.workdir);
          return {.description = name + " - " + command, .command = command};
        } else if constexpr (std::is_same_v<T, GrepArgs>) {
          std::string command;
          for (const auto &token : format_grep_command(value)) {
            command += command.empty() ? token : " " + token;
          }
          return {.description = name + " - searching for \"" + value.query + "\"",
                  .command = command};
        } else if constexpr (std::is_same_v<T, ViewArgs>) {
          return {.description = name + " - viewing " + value.path,
                  .command = "cat " + shell_quote(value.path)};
        } else if constexpr (std::is_same_v<T, SearchDocumentsArgs>) {
          return {.description = name + " - searching documents for \"" + value.query +
                                 "\" in " + value.url,
                  .command = "curl -sL " + shell_quote(value.url) + " | grep -i " +
                             shell_quote(value.query)};
        } else if constexpr (std::is_same_v<T, GetUrlContentArgs>) {
          return {.description = name + " - fetching content from " + value.url,
                  .command = "curl -sL " + shell_quote(value.url)};
        } else {
          static_assert(std::is_same_v<T, TextEditorArgs>, "unhandled gated tool");
          const auto command = value.command + " " + value.path;
          return {.description = name + " - " + command, .command = command};
        }
      },
      args);
}

FormattedCommand format_tool_call(const ToolCall &call) {
  auto parsed = parse_gated_tool_call(call);
  if (parsed.ok()) {
    return format_command(call.name, parsed.value());
  }
  const std::string raw = common::trim(call.args_json);
  return {.description = call.name + " - " + raw, .command = raw};
}

} // namespace shellwarden::tools
