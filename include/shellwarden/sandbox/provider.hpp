#pragma once

#include "shellwarden/common/result.hpp"
#include "shellwarden/config/schema.hpp"
#include "shellwarden/sandbox/docker.hpp"
#include "shellwarden/sandbox/executor.hpp"
#include "shellwarden/sandbox/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shellwarden::sandbox {

class ISandboxProvider {
public:
  virtual ~ISandboxProvider() = default;

  [[nodiscard]] virtual common::Result<std::shared_ptr<const SandboxHandle>>
  create_sandbox(const std::string &image,
                 const std::optional<std::string> &mount_path = std::nullopt) = 0;
  [[nodiscard]] virtual std::shared_ptr<const SandboxHandle>
  get_sandbox(const std::string &id) const = 0;
  [[nodiscard]] virtual std::vector<std::shared_ptr<const SandboxHandle>> list_sandboxes() const = 0;
  [[nodiscard]] virtual common::Result<std::string> stop_sandbox(const std::string &id) = 0;
  [[nodiscard]] virtual common::Result<bool> delete_sandbox(const std::string &id) = 0;

  [[nodiscard]] virtual common::Result<ExecResult>
  exec(const SandboxHandle &target, const std::string &command, const ExecOptions &options = {}) = 0;
  [[nodiscard]] virtual common::Result<ExecResult>
  exec(const std::string &id, const std::string &command, const ExecOptions &options = {}) = 0;
};

struct WritableMount {
  std::string source;
  std::string target;
};

struct SandboxProviderOptions {
  std::optional<std::string> default_mount_path;
  std::string working_dir = kDefaultWorkingDir;
  std::string user = kDefaultUser;
  std::string network_mode = kDefaultNetworkMode;
  std::string tmpfs_options = kDefaultTmpfsOptions;
  std::optional<double> cpu_count;
  std::optional<std::int64_t> memory_bytes;
  std::optional<std::int64_t> pids_limit;
  std::optional<std::int64_t> default_timeout_sec;
  /// Create missing writable mount sources instead of failing.
  bool ensure_mounts_exist = true;
  std::vector<WritableMount> writable_mounts;
  std::map<std::string, std::string> env;
  std::string container_name_prefix = "shellwarden-sbx-";
  std::chrono::milliseconds docker_timeout{60'000};
  /// `docker create` may pull the image first.
  std::chrono::milliseconds create_timeout{600'000};
};

[[nodiscard]] SandboxProviderOptions options_from_config(const config::SandboxConfig &config);

/// Requested limits with the documented defaults filled in.
[[nodiscard]] SandboxResourceLimits effective_limits(const SandboxProviderOptions &options);

[[nodiscard]] std::vector<std::string>
build_create_args(const SandboxProviderOptions &options, const std::string &container_name,
                  const std::string &image, const std::vector<std::string> &binds,
                  const SandboxResourceLimits &limits);

struct InspectedContainer {
  std::string id;
  std::string name;
  SandboxResourceLimits applied;
};

/// Parses `{{.Id}}|{{.Name}}|{{.HostConfig.NanoCpus}}|{{.HostConfig.Memory}}|{{.HostConfig.PidsLimit}}`.
[[nodiscard]] common::Result<InspectedContainer> parse_inspect_line(const std::string &line);

class DockerSandboxProvider final : public ISandboxProvider {
public:
  explicit DockerSandboxProvider(SandboxProviderOptions options = {},
                                 std::shared_ptr<IDockerRunner> docker_runner =
                                     std::make_shared<DockerCliRunner>());

  [[nodiscard]] common::Result<std::shared_ptr<const SandboxHandle>>
  create_sandbox(const std::string &image,
                 const std::optional<std::string> &mount_path = std::nullopt) override;
  [[nodiscard]] std::shared_ptr<const SandboxHandle>
  get_sandbox(const std::string &id) const override;
  [[nodiscard]] std::vector<std::shared_ptr<const SandboxHandle>> list_sandboxes() const override;
  [[nodiscard]] common::Result<std::string> stop_sandbox(const std::string &id) override;
  [[nodiscard]] common::Result<bool> delete_sandbox(const std::string &id) override;

  [[nodiscard]] common::Result<ExecResult> exec(const SandboxHandle &target,
                                                const std::string &command,
                                                const ExecOptions &options = {}) override;
  [[nodiscard]] common::Result<ExecResult> exec(const std::string &id, const std::string &command,
                                                const ExecOptions &options = {}) override;

  [[nodiscard]] const SandboxProviderOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<std::filesystem::path>
  resolve_mount_path(const std::optional<std::string> &mount_path) const;
  [[nodiscard]] common::Result<std::vector<std::string>>
  prepare_binds(const std::filesystem::path &repo_path) const;
  [[nodiscard]] common::Status safe_stop(const std::string &container_id) const;
  [[nodiscard]] common::Status safe_remove(const std::string &container_id) const;

  SandboxProviderOptions options_;
  std::shared_ptr<IDockerRunner> docker_runner_;
  std::shared_ptr<ContainerExecutor> executor_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const SandboxHandle>> sandboxes_;
};

} // namespace shellwarden::sandbox
