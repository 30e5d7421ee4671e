#include "shellwarden/sandbox/types.hpp"

#include "shellwarden/common/fs.hpp"

namespace shellwarden::sandbox {

std::string_view exec_outcome_to_string(const ExecOutcome outcome) {
  switch (outcome) {
  case ExecOutcome::Completed:
    return "completed";
  case ExecOutcome::TimedOut:
    return "timed_out";
  case ExecOutcome::SecurityViolation:
    return "security_violation";
  }
  return "completed";
}

ExecResult make_exec_result(const int exit_code, std::string stdout_text, std::string stderr_text,
                            const ExecOutcome outcome) {
  ExecResult result;
  result.exit_code = exit_code;
  result.result = common::trim(stdout_text);
  result.artifacts = ExecArtifacts{.stdout_text = stdout_text, .stderr_text = stderr_text};
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.outcome = outcome;
  return result;
}

} // namespace shellwarden::sandbox
