#pragma once

#include "shellwarden/security/risk_assessor.hpp"
#include "shellwarden/tools/tool.hpp"

#include <string>
#include <vector>

namespace shellwarden::security {

struct CommandEvaluation {
  tools::ToolCall call;
  std::string command;
  std::string description;
  bool is_safe = false;
  std::string reasoning;
  RiskLevel risk_level = RiskLevel::High;
};

struct FilterOutcome {
  /// Known-safe calls, then assessor-approved calls, then non-gated calls.
  std::vector<tools::ToolCall> filtered_tool_calls;
  bool was_filtered = false;
  /// One verdict per call sent to the assessor, approved or not.
  std::vector<CommandEvaluation> evaluations;
};

/// Assess one call. Never fails: an assessor error or exception yields the
/// fail-closed verdict.
[[nodiscard]] CommandEvaluation evaluate_command(const tools::ToolCall &call,
                                                 IRiskAssessor &assessor);

/// Drop gated tool calls that are neither known-safe nor approved by the assessor.
/// Assessments run concurrently, one task per call.
[[nodiscard]] FilterOutcome filter_unsafe_commands(const std::vector<tools::ToolCall> &calls,
                                                   IRiskAssessor &assessor);

/// Known-safe check for an arbitrary call. Only well-formed shell calls qualify.
[[nodiscard]] bool is_known_safe_tool_call(const tools::ToolCall &call);

} // namespace shellwarden::security
