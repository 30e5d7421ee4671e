#include "shellwarden/security/command_filter.hpp"

#include "shellwarden/observability/global.hpp"
#include "shellwarden/security/command_safety.hpp"
#include "shellwarden/tools/gated_tools.hpp"

#include <exception>
#include <future>
#include <string>
#include <utility>
#include <variant>

namespace shellwarden::security {

namespace {

CommandEvaluation rejected_evaluation(CommandEvaluation evaluation) {
  const auto verdict = fail_closed_assessment();
  evaluation.is_safe = verdict.is_safe;
  evaluation.reasoning = verdict.reasoning;
  evaluation.risk_level = verdict.risk_level;
  return evaluation;
}

} // namespace

bool is_known_safe_tool_call(const tools::ToolCall &call) {
  if (call.name != "shell") {
    return false;
  }
  const auto parsed = tools::parse_gated_tool_call(call);
  if (!parsed.ok()) {
    return false;
  }
  const auto &shell = std::get<tools::ShellArgs>(parsed.value());
  return is_known_safe_command(shell.command, shell.workdir);
}

CommandEvaluation evaluate_command(const tools::ToolCall &call, IRiskAssessor &assessor) {
  const auto formatted = tools::format_tool_call(call);
  CommandEvaluation evaluation{
      .call = call, .command = formatted.command, .description = formatted.description};

  const RiskAssessmentRequest request{
      .command = formatted.command, .tool_name = call.name, .args_json = call.args_json};
  try {
    const auto assessment = assessor.assess(request);
    if (!assessment.ok()) {
      observability::record_error("risk_assessor",
                                  "assessment of " + formatted.description +
                                      " failed: " + assessment.error());
      return rejected_evaluation(std::move(evaluation));
    }
    evaluation.is_safe = assessment.value().is_safe;
    evaluation.reasoning = assessment.value().reasoning;
    evaluation.risk_level = assessment.value().risk_level;
    return evaluation;
  } catch (const std::exception &e) {
    observability::record_error("risk_assessor",
                                "assessment of " + formatted.description + " threw: " + e.what());
    return rejected_evaluation(std::move(evaluation));
  } catch (...) {
    observability::record_error("risk_assessor", "assessment of " + formatted.description +
                                                     " threw a non-standard exception");
    return rejected_evaluation(std::move(evaluation));
  }
}

FilterOutcome filter_unsafe_commands(const std::vector<tools::ToolCall> &calls,
                                     IRiskAssessor &assessor) {
  std::vector<tools::ToolCall> known_safe;
  std::vector<tools::ToolCall> needs_assessment;
  std::vector<tools::ToolCall> pass_through;

  for (const auto &call : calls) {
    if (!tools::is_gated_tool(call.name)) {
      pass_through.push_back(call);
    } else if (is_known_safe_tool_call(call)) {
      known_safe.push_back(call);
    } else {
      needs_assessment.push_back(call);
    }
  }

  const std::size_t gated = known_safe.size() + needs_assessment.size();
  if (gated == 0) {
    return FilterOutcome{.filtered_tool_calls = calls, .was_filtered = false, .evaluations = {}};
  }

  std::vector<std::future<CommandEvaluation>> pending;
  pending.reserve(needs_assessment.size());
  for (const auto &call : needs_assessment) {
    pending.push_back(std::async(std::launch::async, [&call, &assessor]() {
      return evaluate_command(call, assessor);
    }));
  }

  FilterOutcome outcome;
  outcome.filtered_tool_calls = known_safe;
  std::size_t rejected = 0;
  for (auto &future : pending) {
    auto evaluation = future.get();
    if (evaluation.is_safe) {
      outcome.filtered_tool_calls.push_back(evaluation.call);
    } else {
      ++rejected;
      observability::record_command_rejected(evaluation.call.name, evaluation.description,
                                             evaluation.reasoning,
                                             risk_level_to_string(evaluation.risk_level));
    }
    outcome.evaluations.push_back(std::move(evaluation));
  }

  const std::size_t approved = outcome.filtered_tool_calls.size();
  outcome.filtered_tool_calls.insert(outcome.filtered_tool_calls.end(), pass_through.begin(),
                                     pass_through.end());
  outcome.was_filtered = approved != gated;

  observability::record_event(observability::CommandFilterEvent{.gated = gated,
                                                                .known_safe = known_safe.size(),
                                                                .assessed = needs_assessment.size(),
                                                                .rejected = rejected});
  if (outcome.was_filtered) {
    observability::log_info("Filtered out " + std::to_string(gated - approved) +
                            " unsafe commands");
  }
  return outcome;
}

} // namespace shellwarden::security
