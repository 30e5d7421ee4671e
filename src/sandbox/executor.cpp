#include "shellwarden/sandbox/executor.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/observability/global.hpp"

#include <algorithm>
#include <array>
#include <future>
#include <initializer_list>
#include <string_view>

namespace shellwarden::sandbox {

namespace {

constexpr std::array<std::string_view, 8> kSecurityFingerprints = {
    "operation not permitted",
    "permission denied",
    "read-only file system",
    "apparmor",
    "seccomp",
    "security profile",
    "no new privileges",
    "capability",
};

bool contains_any(const std::string &haystack, std::initializer_list<std::string_view> needles) {
  for (const auto needle : needles) {
    if (haystack.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string describe_failure(const common::Result<DockerProcessResult> &result) {
  if (!result.ok()) {
    return result.error();
  }
  const std::string stderr_text = common::trim(result.value().stderr_text);
  return stderr_text.empty() ? "exit code " + std::to_string(result.value().exit_code)
                             : stderr_text;
}

} // namespace

std::int64_t resolve_timeout_sec(const std::optional<std::int64_t> requested,
                                 const std::optional<std::int64_t> provider_default) {
  const std::int64_t timeout = requested.value_or(provider_default.value_or(kDefaultTimeoutSec));
  return std::min(timeout, kMaxTimeoutSec);
}

bool matches_security_fingerprint(const std::string &message) {
  const std::string lowered = common::to_lower(message);
  for (const auto fingerprint : kSecurityFingerprints) {
    if (lowered.find(fingerprint) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool is_runtime_error(const DockerProcessResult &result) {
  if (result.exit_code == 125 || result.exit_code < 0) {
    return true;
  }
  if (result.exit_code == 0) {
    return false;
  }
  const std::string stderr_text = common::trim(result.stderr_text);
  return common::starts_with(stderr_text, "Error response from daemon") ||
         common::starts_with(stderr_text, "Cannot connect to the Docker daemon") ||
         common::starts_with(stderr_text, "OCI runtime");
}

std::vector<std::string> build_exec_args(const std::string &container_id,
                                         const std::string &command, const std::string &cwd,
                                         const std::map<std::string, std::string> &env) {
  std::vector<std::string> args = {"exec", "-w", cwd};
  for (const auto &[key, value] : env) {
    args.push_back("-e");
    args.push_back(key + "=" + value);
  }
  args.push_back(container_id);
  args.push_back("/bin/sh");
  args.push_back("-lc");
  args.push_back(command);
  return args;
}

ContainerExecutor::ContainerExecutor(std::shared_ptr<IDockerRunner> docker_runner,
                                     ExecutorOptions options)
    : docker_runner_(std::move(docker_runner)), options_(std::move(options)) {}

common::Result<ExecResult> ContainerExecutor::exec(const std::string &container_id,
                                                   const std::string &command,
                                                   const ExecOptions &options) const {
  if (!docker_runner_) {
    return common::Result<ExecResult>::failure("docker runner unavailable");
  }

  const std::string cwd =
      options.cwd.has_value() && !options.cwd->empty() ? *options.cwd : options_.working_dir;
  const auto args = build_exec_args(container_id, command, cwd, options.env);
  const std::int64_t timeout_sec = resolve_timeout_sec(options.timeout_sec, options_.default_timeout_sec);

  DockerCommandOptions run_options{.allow_failure = true, .timeout = std::nullopt};
  if (timeout_sec > 0) {
    run_options.timeout = std::chrono::seconds(timeout_sec) + options_.exec_grace;
  }

  auto task = std::async(std::launch::async, [runner = docker_runner_, args, run_options]() {
    return runner->run(args, run_options);
  });

  if (timeout_sec > 0 &&
      task.wait_for(std::chrono::seconds(timeout_sec)) == std::future_status::timeout) {
    const auto recovered = recover_after_timeout(container_id);
    // The killed exec session returns on its own; its partial output is discarded.
    task.wait();
    if (!recovered.ok()) {
      return common::Result<ExecResult>::failure("Command timed out after " +
                                                 std::to_string(timeout_sec) +
                                                 " seconds and the sandbox could not be "
                                                 "restarted: " +
                                                 recovered.error());
    }
    observability::log_warn("sandbox " + container_id + ": command timed out after " +
                            std::to_string(timeout_sec) + "s, container restarted");
    return common::Result<ExecResult>::success(
        make_exec_result(kTimeoutExitCode, "",
                         "Command timed out after " + std::to_string(timeout_sec) + " seconds",
                         ExecOutcome::TimedOut));
  }

  const auto run = task.get();
  if (!run.ok() || is_runtime_error(run.value())) {
    return classify_runtime_error(describe_failure(run));
  }

  auto process = run.value();
  return common::Result<ExecResult>::success(make_exec_result(
      process.exit_code, std::move(process.stdout_text), std::move(process.stderr_text)));
}

common::Result<ExecResult> ContainerExecutor::classify_runtime_error(const std::string &message) const {
  if (matches_security_fingerprint(message)) {
    return common::Result<ExecResult>::success(
        make_exec_result(kSecurityViolationExitCode, "", message, ExecOutcome::SecurityViolation));
  }
  return common::Result<ExecResult>::failure("Sandbox exec failed: " + message);
}

common::Status ContainerExecutor::recover_after_timeout(const std::string &container_id) const {
  const DockerCommandOptions lifecycle{.allow_failure = true, .timeout = options_.docker_timeout};

  const auto killed = docker_runner_->run({"kill", "--signal", "KILL", container_id}, lifecycle);
  if (!killed.ok() || killed.value().exit_code != 0) {
    const std::string message = describe_failure(killed);
    if (!contains_any(common::to_lower(message), {"is not running"})) {
      return common::Status::error("kill failed: " + message);
    }
  }

  // `docker wait` blocks until the container is no longer running.
  const auto waited = docker_runner_->run({"wait", container_id}, lifecycle);
  if (!waited.ok() || waited.value().exit_code != 0) {
    return common::Status::error("wait failed: " + describe_failure(waited));
  }

  const auto started = docker_runner_->run({"start", container_id}, lifecycle);
  if (!started.ok() || started.value().exit_code != 0) {
    const std::string message = describe_failure(started);
    if (!contains_any(common::to_lower(message), {"already running", "already started"})) {
      return common::Status::error("restart failed: " + message);
    }
  }
  return common::Status::success();
}

} // namespace shellwarden::sandbox
