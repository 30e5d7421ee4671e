#pragma once

#include "shellwarden/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace shellwarden::sandbox {

struct DockerCommandOptions {
  bool allow_failure = false;
  /// nullopt waits for the process indefinitely.
  std::optional<std::chrono::milliseconds> timeout = std::chrono::milliseconds{30'000};
};

struct DockerProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
};

/// Runs one `docker <args...>` invocation. Implementations must be safe to call
/// from several threads at once.
class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

class DockerCliRunner final : public IDockerRunner {
public:
  explicit DockerCliRunner(std::string binary = "docker") : binary_(std::move(binary)) {}

  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;

private:
  std::string binary_;
};

[[nodiscard]] std::string join_docker_args(const std::vector<std::string> &args);

} // namespace shellwarden::sandbox
