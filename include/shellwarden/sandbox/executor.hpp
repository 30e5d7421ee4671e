#pragma once

#include "shellwarden/common/result.hpp"
#include "shellwarden/sandbox/docker.hpp"
#include "shellwarden/sandbox/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shellwarden::sandbox {

struct ExecutorOptions {
  std::string working_dir = kDefaultWorkingDir;
  std::optional<std::int64_t> default_timeout_sec;
  /// Timeout for the lifecycle calls around an exec (kill, wait, start).
  std::chrono::milliseconds docker_timeout{60'000};
  /// Extra time the docker client gets beyond the command timeout before it is killed locally.
  std::chrono::milliseconds exec_grace{10'000};
};

/// Effective timeout: the per-call value, else the provider default, else 900s,
/// capped at kMaxTimeoutSec. A result <= 0 means the command runs without a timer.
[[nodiscard]] std::int64_t resolve_timeout_sec(std::optional<std::int64_t> requested,
                                               std::optional<std::int64_t> provider_default);

/// True when the runtime error text carries one of the known policy-denial fingerprints.
[[nodiscard]] bool matches_security_fingerprint(const std::string &message);

/// True when the docker client failed on its own behalf rather than relaying the
/// command's exit status.
[[nodiscard]] bool is_runtime_error(const DockerProcessResult &result);

[[nodiscard]] std::vector<std::string> build_exec_args(const std::string &container_id,
                                                       const std::string &command,
                                                       const std::string &cwd,
                                                       const std::map<std::string, std::string> &env);

/// Runs commands inside existing containers.
///
/// Each call ends in one of three ExecResults (completed, timed out with the
/// container restarted, or security violation) or in a failed Result when the
/// container runtime itself misbehaves.
class ContainerExecutor {
public:
  ContainerExecutor(std::shared_ptr<IDockerRunner> docker_runner, ExecutorOptions options);

  [[nodiscard]] common::Result<ExecResult> exec(const std::string &container_id,
                                                const std::string &command,
                                                const ExecOptions &options) const;

  /// Kill, wait for not-running, start. Leaves the container usable after a timeout.
  [[nodiscard]] common::Status recover_after_timeout(const std::string &container_id) const;

  [[nodiscard]] const ExecutorOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<ExecResult> classify_runtime_error(const std::string &message) const;

  std::shared_ptr<IDockerRunner> docker_runner_;
  ExecutorOptions options_;
};

} // namespace shellwarden::sandbox
