#include "shellwarden/tools/tool.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/common/json_util.hpp"

namespace shellwarden::tools {

common::Result<std::vector<ToolCall>> parse_tool_calls(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '[') {
    return common::Result<std::vector<ToolCall>>::failure("expected a JSON array of tool calls");
  }
  const auto end = common::json_find_matching_token(trimmed, 0, '[', ']');
  if (end == std::string::npos) {
    return common::Result<std::vector<ToolCall>>::failure("unterminated JSON array");
  }

  std::vector<ToolCall> calls;
  for (const auto &object : common::json_split_top_level_objects(trimmed)) {
    const auto fields = common::json_parse_flat(object);
    const auto name_it = fields.find("name");
    if (name_it == fields.end() || name_it->second.empty()) {
      return common::Result<std::vector<ToolCall>>::failure("tool call #" +
                                                            std::to_string(calls.size()) +
                                                            " has no name");
    }

    ToolCall call;
    call.name = name_it->second;
    if (const auto id_it = fields.find("id"); id_it != fields.end()) {
      call.id = id_it->second;
    }
    if (const auto args_it = fields.find("args"); args_it != fields.end()) {
      call.args_json = args_it->second;
    } else if (const auto input_it = fields.find("arguments"); input_it != fields.end()) {
      call.args_json = input_it->second;
    }
    calls.push_back(std::move(call));
  }
  return common::Result<std::vector<ToolCall>>::success(std::move(calls));
}

std::string tool_call_to_json(const ToolCall &call) {
  const std::string args = common::trim(call.args_json);
  std::string out = "{\"id\":\"" + common::json_escape(call.id) + "\",\"name\":\"" +
                    common::json_escape(call.name) + "\",\"args\":";
  if (!args.empty() && (args.front() == '{' || args.front() == '[')) {
    out += args;
  } else {
    // Non-object args (e.g. a bare string) are re-quoted.
    out += "\"" + common::json_escape(args) + "\"";
  }
  out += "}";
  return out;
}

std::string tool_calls_to_json(const std::vector<ToolCall> &calls) {
  std::string out = "[";
  for (std::size_t i = 0; i < calls.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += tool_call_to_json(calls[i]);
  }
  out += "]";
  return out;
}

} // namespace shellwarden::tools
