#include "shellwarden/security/risk_assessor.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/common/json_util.hpp"
#include "shellwarden/observability/global.hpp"

#include <chrono>

namespace shellwarden::security {

std::string risk_level_to_string(const RiskLevel level) {
  switch (level) {
  case RiskLevel::Low:
    return "low";
  case RiskLevel::Medium:
    return "medium";
  case RiskLevel::High:
    return "high";
  }
  return "high";
}

common::Result<RiskLevel> risk_level_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "low") {
    return common::Result<RiskLevel>::success(RiskLevel::Low);
  }
  if (normalized == "medium") {
    return common::Result<RiskLevel>::success(RiskLevel::Medium);
  }
  if (normalized == "high") {
    return common::Result<RiskLevel>::success(RiskLevel::High);
  }
  return common::Result<RiskLevel>::failure("Invalid risk level: " + value);
}

RiskAssessment fail_closed_assessment() {
  return RiskAssessment{
      .is_safe = false, .reasoning = kFailClosedReasoning, .risk_level = RiskLevel::High};
}

common::Result<RiskAssessment> parse_risk_assessment(const std::string &reply) {
  const std::string object = common::json_extract_first_object(reply);
  if (object.empty()) {
    return common::Result<RiskAssessment>::failure("no JSON object in assessor reply");
  }
  const auto fields = common::json_parse_flat(object);

  const auto safe_it = fields.find("is_safe");
  if (safe_it == fields.end() || (safe_it->second != "true" && safe_it->second != "false")) {
    return common::Result<RiskAssessment>::failure("assessor reply has no boolean is_safe");
  }

  RiskAssessment assessment;
  assessment.is_safe = safe_it->second == "true";
  if (const auto it = fields.find("reasoning"); it != fields.end()) {
    assessment.reasoning = it->second;
  }
  if (const auto it = fields.find("risk_level"); it != fields.end()) {
    auto level = risk_level_from_string(it->second);
    if (!level.ok()) {
      return common::Result<RiskAssessment>::failure(level.error());
    }
    assessment.risk_level = level.value();
  }
  return common::Result<RiskAssessment>::success(std::move(assessment));
}

ProviderRiskAssessor::ProviderRiskAssessor(std::shared_ptr<providers::Provider> provider,
                                           std::string model, const double temperature)
    : provider_(std::move(provider)), model_(std::move(model)), temperature_(temperature) {}

const std::string &ProviderRiskAssessor::system_prompt() {
  static const std::string prompt =
      "You review commands that an autonomous coding agent wants to run inside a "
      "sandboxed container holding a checked-out repository.\n"
      "Decide whether the command is safe to run without a human looking at it.\n"
      "\n"
      "Treat as UNSAFE anything that:\n"
      "- deletes or overwrites files outside the task's obvious scope, or deletes "
      "recursively (rm -rf, find -delete, git clean -fdx)\n"
      "- rewrites version control history or pushes (git push, git reset --hard, "
      "git rebase, force flags)\n"
      "- reads or exfiltrates secrets, credentials, SSH keys or environment tokens\n"
      "- downloads and executes remote code (curl | sh, wget -O- | bash)\n"
      "- changes system configuration, users, permissions of system paths, or "
      "installs system packages\n"
      "- opens network listeners, reverse shells or tunnels\n"
      "- attempts to escape the container or tamper with the container runtime\n"
      "\n"
      "Reading files, searching, building, running tests and editing files inside "
      "the repository are normally SAFE.\n"
      "\n"
      "Respond with a single JSON object and nothing else:\n"
      "{\"is_safe\": true|false, \"reasoning\": \"<one or two sentences>\", "
      "\"risk_level\": \"low\"|\"medium\"|\"high\"}";
  return prompt;
}

common::Result<RiskAssessment> ProviderRiskAssessor::assess(const RiskAssessmentRequest &request) {
  if (!provider_) {
    return common::Result<RiskAssessment>::failure("risk assessor has no provider");
  }

  std::string message = "Tool: " + request.tool_name + "\n";
  message += "Command: " + request.command + "\n";
  if (!request.args_json.empty()) {
    message += "Arguments: " + request.args_json + "\n";
  }

  const auto started = std::chrono::steady_clock::now();
  const auto reply = provider_->chat_with_system(system_prompt(), message, model_, temperature_);
  observability::record_metric(observability::AssessorLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});

  if (!reply.ok()) {
    return common::Result<RiskAssessment>::failure(reply.error());
  }
  return parse_risk_assessment(reply.value());
}

common::Result<RiskAssessment> DenyAllRiskAssessor::assess(const RiskAssessmentRequest &request) {
  (void)request;
  return common::Result<RiskAssessment>::success(RiskAssessment{
      .is_safe = false, .reasoning = "Risk assessment is disabled", .risk_level = RiskLevel::High});
}

} // namespace shellwarden::security
