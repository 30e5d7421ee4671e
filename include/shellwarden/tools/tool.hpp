#pragma once

#include "shellwarden/common/result.hpp"

#include <string>
#include <vector>

namespace shellwarden::tools {

/// A tool invocation proposed by the agent. args_json holds the raw JSON object
/// exactly as received so that approved calls are forwarded untouched.
struct ToolCall {
  std::string id;
  std::string name;
  std::string args_json = "{}";
};

/// Parse a JSON array of {"id", "name", "args"} objects. "args" may be omitted.
[[nodiscard]] common::Result<std::vector<ToolCall>> parse_tool_calls(const std::string &json);

[[nodiscard]] std::string tool_call_to_json(const ToolCall &call);
[[nodiscard]] std::string tool_calls_to_json(const std::vector<ToolCall> &calls);

} // namespace shellwarden::tools
