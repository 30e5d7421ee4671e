#pragma once

#include "shellwarden/common/result.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace shellwarden::sandbox {

inline constexpr double kDefaultCpuCount = 2.0;
inline constexpr std::int64_t kDefaultMemoryBytes = 2LL * 1024 * 1024 * 1024;
inline constexpr std::int64_t kDefaultPidsLimit = 512;
inline constexpr std::int64_t kDefaultTimeoutSec = 900;
// Longer timeouts are clamped so they stay representable as nanoseconds.
inline constexpr std::int64_t kMaxTimeoutSec = 365LL * 24 * 60 * 60;
inline constexpr int kTimeoutExitCode = 124;
inline constexpr int kSecurityViolationExitCode = 126;
inline constexpr const char *kDefaultUser = "1000:1000";
inline constexpr const char *kDefaultTmpfsOptions = "rw,nosuid,nodev,noexec,size=64m";
inline constexpr const char *kDefaultWorkingDir = "/workspace/src";
inline constexpr const char *kDefaultNetworkMode = "none";
inline constexpr const char *kSandboxLabel = "shellwarden.sandbox=local-docker";

struct SandboxResourceLimits {
  std::optional<double> cpu_count;
  std::optional<std::int64_t> memory_bytes;
  std::optional<std::int64_t> pids_limit;

  bool operator==(const SandboxResourceLimits &) const = default;
};

struct SandboxMetadata {
  std::string container_id;
  std::string container_name;
  std::string image;
  std::string mount_path;
  SandboxResourceLimits requested_resources;
  // Read back from the runtime after start; may differ from what was requested.
  SandboxResourceLimits applied_resources;
};

struct ExecOptions {
  std::optional<std::string> cwd;
  std::map<std::string, std::string> env;
  std::optional<std::int64_t> timeout_sec;
};

enum class ExecOutcome { Completed, TimedOut, SecurityViolation };

[[nodiscard]] std::string_view exec_outcome_to_string(ExecOutcome outcome);

struct ExecArtifacts {
  std::string stdout_text;
  std::string stderr_text;
};

struct ExecResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  /// stdout with surrounding whitespace removed.
  std::string result;
  ExecArtifacts artifacts;
  ExecOutcome outcome = ExecOutcome::Completed;
};

[[nodiscard]] ExecResult make_exec_result(int exit_code, std::string stdout_text,
                                          std::string stderr_text,
                                          ExecOutcome outcome = ExecOutcome::Completed);

/// Command execution capability bound to one sandbox.
class ISandboxProcess {
public:
  virtual ~ISandboxProcess() = default;

  [[nodiscard]] virtual common::Result<ExecResult>
  execute_command(const std::string &command, const ExecOptions &options = {}) = 0;
};

struct SandboxHandle {
  std::string id;
  SandboxMetadata metadata;
  std::shared_ptr<ISandboxProcess> process;
};

} // namespace shellwarden::sandbox
