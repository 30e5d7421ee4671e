#pragma once

#include "shellwarden/common/result.hpp"
#include "shellwarden/providers/traits.hpp"

#include <memory>
#include <string>

namespace shellwarden::security {

enum class RiskLevel { Low, Medium, High };

[[nodiscard]] std::string risk_level_to_string(RiskLevel level);
[[nodiscard]] common::Result<RiskLevel> risk_level_from_string(const std::string &value);

struct RiskAssessmentRequest {
  std::string command;
  std::string tool_name;
  std::string args_json;
};

struct RiskAssessment {
  bool is_safe = false;
  std::string reasoning;
  RiskLevel risk_level = RiskLevel::High;
};

inline constexpr const char *kFailClosedReasoning =
    "Failed to evaluate safety - defaulting to unsafe";

/// The verdict used whenever an assessment cannot be obtained.
[[nodiscard]] RiskAssessment fail_closed_assessment();

/// Judges whether a single tool call may run. Implementations may be called from
/// several threads at once.
class IRiskAssessor {
public:
  virtual ~IRiskAssessor() = default;

  [[nodiscard]] virtual common::Result<RiskAssessment>
  assess(const RiskAssessmentRequest &request) = 0;
};

/// Parse a model reply. The first JSON object in the text must carry a boolean
/// "is_safe"; "risk_level" defaults to high when absent.
[[nodiscard]] common::Result<RiskAssessment> parse_risk_assessment(const std::string &reply);

/// Asks a chat model for a verdict.
class ProviderRiskAssessor final : public IRiskAssessor {
public:
  ProviderRiskAssessor(std::shared_ptr<providers::Provider> provider, std::string model,
                       double temperature);

  [[nodiscard]] common::Result<RiskAssessment>
  assess(const RiskAssessmentRequest &request) override;

  [[nodiscard]] static const std::string &system_prompt();

private:
  std::shared_ptr<providers::Provider> provider_;
  std::string model_;
  double temperature_;
};

/// Rejects every call without consulting anything. Used when the assessor is disabled.
class DenyAllRiskAssessor final : public IRiskAssessor {
public:
  [[nodiscard]] common::Result<RiskAssessment>
  assess(const RiskAssessmentRequest &request) override;
};

} // namespace shellwarden::security
