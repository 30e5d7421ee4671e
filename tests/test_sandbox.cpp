#include "test_framework.hpp"

#include "shellwarden/config/schema.hpp"
#include "shellwarden/sandbox/executor.hpp"
#include "shellwarden/sandbox/provider.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

using shellwarden::testing::FakeDockerRunner;
using shellwarden::testing::ScopedCapture;
using shellwarden::testing::TempWorkspace;
using shellwarden::tests::require;
using shellwarden::tests::require_contains;
using shellwarden::tests::TestCase;

namespace sandbox = shellwarden::sandbox;
namespace obs = shellwarden::observability;

bool has_pair(const std::vector<std::string> &args, const std::string &flag,
              const std::string &value) {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag && args[i + 1] == value) {
      return true;
    }
  }
  return false;
}

bool has_arg(const std::vector<std::string> &args, const std::string &value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

struct Fixture {
  TempWorkspace repo;
  std::shared_ptr<FakeDockerRunner> docker = std::make_shared<FakeDockerRunner>();
  sandbox::DockerSandboxProvider provider;

  explicit Fixture(sandbox::SandboxProviderOptions options = {})
      : provider(std::move(options), docker) {}

  std::shared_ptr<const sandbox::SandboxHandle> create() {
    const auto created = provider.create_sandbox("node:20", repo.path().string());
    require(created.ok(), "sandbox should be created: " + created.error());
    return created.value();
  }
};

} // namespace

void register_sandbox_tests(std::vector<TestCase> &tests) {
  tests.push_back({"sandbox_create_locks_down_container", [] {
                     Fixture fx;
                     fx.create();
                     const auto create = fx.docker->last("create");
                     require(create.has_value(), "docker create issued");
                     const auto &args = *create;
                     require(has_arg(args, "--read-only"), "read-only rootfs");
                     require(has_pair(args, "--cap-drop", "ALL"), "all capabilities dropped");
                     require(has_pair(args, "--security-opt", "no-new-privileges"),
                             "no new privileges");
                     require(has_pair(args, "--network", "none"), "no network");
                     require(has_pair(args, "--user", "1000:1000"), "unprivileged user");
                     require(has_pair(args, "--cpus", "2.00"), "cpu limit");
                     require(has_pair(args, "--memory", "2147483648"), "memory limit");
                     require(has_pair(args, "--pids-limit", "512"), "pids limit");
                     require(has_pair(args, "--tmpfs", "/tmp:rw,nosuid,nodev,noexec,size=64m"),
                             "tmpfs for /tmp");
                     require(has_pair(args, "-v", fx.repo.path().string() + ":/workspace/src:ro"),
                             "repository mounted read-only");
                     require(has_pair(args, "--workdir", "/workspace/src"), "working dir");
                     require(args.back() == "tail -f /dev/null", "keep-alive command");
                     require(fx.docker->subcommands() ==
                                 std::vector<std::string>{"create", "start", "inspect"},
                             "create, start, inspect");
                   }});

  tests.push_back({"sandbox_create_zero_limits_fall_back_to_defaults", [] {
                     shellwarden::config::SandboxConfig cfg;
                     cfg.cpu_count = 0.0;
                     cfg.memory_bytes = 0;
                     cfg.pids_limit = -1;
                     Fixture fx(sandbox::options_from_config(cfg));
                     const auto handle = fx.create();
                     const auto args = *fx.docker->last("create");
                     require(has_pair(args, "--cpus", "2.00"), "default cpu limit");
                     require(has_pair(args, "--memory", "2147483648"), "default memory limit");
                     require(has_pair(args, "--pids-limit", "512"), "default pids limit");
                     require(handle->metadata.requested_resources.memory_bytes ==
                                 std::optional<std::int64_t>(2147483648LL),
                             "requested memory reports the default");
                   }});

  tests.push_back({"sandbox_create_records_metadata", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     require(handle->id == "c0ffee1234567890", "id from inspect");
                     require(handle->metadata.container_name == "shellwarden-sbx-test",
                             "leading slash stripped from name");
                     require(handle->metadata.image == "node:20", "image");
                     require(handle->metadata.mount_path == fx.repo.path().string(), "mount path");
                     require(handle->metadata.requested_resources.cpu_count ==
                                 std::optional<double>(2.0),
                             "requested cpus");
                     require(handle->metadata.applied_resources ==
                                 handle->metadata.requested_resources,
                             "applied limits read back");
                     require(fx.provider.get_sandbox(handle->id) == handle, "registered");
                     require(fx.provider.list_sandboxes().size() == 1, "listed");
                   }});

  tests.push_back({"sandbox_create_reports_applied_limits_separately", [] {
                     Fixture fx;
                     fx.docker->inspect_limits = "1000000000|0|0";
                     const auto handle = fx.create();
                     require(handle->metadata.applied_resources.cpu_count ==
                                 std::optional<double>(1.0),
                             "applied cpus from runtime");
                     require(!handle->metadata.applied_resources.memory_bytes.has_value(),
                             "unlimited memory reads back as unset");
                     require(handle->metadata.requested_resources.memory_bytes ==
                                 std::optional<std::int64_t>(2147483648LL),
                             "requested memory unchanged");
                   }});

  tests.push_back({"sandbox_create_validates_inputs", [] {
                     Fixture fx;
                     auto missing = fx.provider.create_sandbox("node:20");
                     require(!missing.ok() &&
                                 missing.error() == "A mount path must be provided either "
                                                    "explicitly or via defaultMountPath",
                             "no mount path: " + missing.error());

                     const std::string absent = (fx.repo.path() / "absent").string();
                     auto bad = fx.provider.create_sandbox("node:20", absent);
                     require(!bad.ok() && bad.error() == "Mount path does not exist: " + absent,
                             "missing mount path: " + bad.error());

                     auto no_image = fx.provider.create_sandbox(" ", fx.repo.path().string());
                     require(!no_image.ok(), "image required");
                     require(fx.docker->calls().empty(), "docker never invoked");
                   }});

  tests.push_back({"sandbox_create_uses_default_mount_path", [] {
                     TempWorkspace other;
                     sandbox::SandboxProviderOptions options;
                     options.default_mount_path = other.path().string();
                     Fixture fx(options);
                     const auto created = fx.provider.create_sandbox("node:20");
                     require(created.ok(), "default mount path used");
                     require(created.value()->metadata.mount_path == other.path().string(),
                             "mount path from options");
                   }});

  tests.push_back({"sandbox_writable_mounts_are_created_and_deduped", [] {
                     TempWorkspace scratch;
                     const auto out_dir = scratch.path() / "out";
                     sandbox::SandboxProviderOptions options;
                     options.writable_mounts = {
                         {.source = out_dir.string(), .target = "/workspace/out"},
                         {.source = scratch.path().string(), .target = "/workspace/src/"}};
                     Fixture fx(options);
                     fx.create();
                     require(std::filesystem::is_directory(out_dir), "missing source created");
                     const auto args = *fx.docker->last("create");
                     require(has_pair(args, "-v", scratch.path().string() + ":/workspace/src/:rw"),
                             "writable bind wins over read-only repo bind");
                     require(!has_pair(args, "-v",
                                       fx.repo.path().string() + ":/workspace/src:ro"),
                             "read-only duplicate dropped");
                     require(has_pair(args, "-v", out_dir.string() + ":/workspace/out:rw"),
                             "output mount");
                   }});

  tests.push_back({"sandbox_writable_mount_must_exist_when_not_ensured", [] {
                     TempWorkspace scratch;
                     sandbox::SandboxProviderOptions options;
                     options.ensure_mounts_exist = false;
                     options.writable_mounts = {
                         {.source = (scratch.path() / "nope").string(), .target = "/out"}};
                     Fixture fx(options);
                     const auto created = fx.provider.create_sandbox("node:20",
                                                                     fx.repo.path().string());
                     require(!created.ok() && created.error().find("Mount path does not exist") == 0,
                             "missing writable mount: " + created.error());
                   }});

  tests.push_back({"sandbox_create_failure_cleans_up", [] {
                     Fixture fx;
                     fx.docker->fail("start", "port is already allocated");
                     const auto created = fx.provider.create_sandbox("node:20",
                                                                     fx.repo.path().string());
                     require(!created.ok(), "start failure surfaces");
                     require(created.error() ==
                                 "Failed to start sandbox container: port is already allocated",
                             "error: " + created.error());
                     require(fx.docker->count("rm") == 1, "container removed");
                     require(fx.provider.list_sandboxes().empty(), "nothing registered");

                     Fixture bad_inspect;
                     bad_inspect.docker->respond("inspect", 0, "garbage\n");
                     const auto inspected = bad_inspect.provider.create_sandbox(
                         "node:20", bad_inspect.repo.path().string());
                     require(!inspected.ok(), "unparseable inspect fails");
                     require(bad_inspect.docker->count("rm") == 1, "cleaned up after inspect");
                   }});

  tests.push_back({"sandbox_exec_runs_shell_in_container", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     fx.docker->respond("exec", 0, "  hello\n", "");
                     sandbox::ExecOptions options;
                     options.cwd = "/workspace/src/pkg";
                     options.env = {{"CI", "1"}};
                     const auto result = fx.provider.exec(*handle, "echo hello", options);
                     require(result.ok(), "exec succeeds");
                     require(result.value().exit_code == 0, "exit 0");
                     require(result.value().result == "hello", "trimmed result");
                     require(result.value().stdout_text == "  hello\n", "raw stdout kept");
                     require(result.value().outcome == sandbox::ExecOutcome::Completed, "completed");

                     const auto args = *fx.docker->last("exec");
                     require(args == std::vector<std::string>{"exec", "-w", "/workspace/src/pkg",
                                                              "-e", "CI=1", "c0ffee1234567890",
                                                              "/bin/sh", "-lc", "echo hello"},
                             "exec arguments");
                   }});

  tests.push_back({"sandbox_exec_passes_through_nonzero_exit", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     fx.docker->respond("exec", 1, "", "touch: /etc/x: Read-only file system\n");
                     const auto result = fx.provider.exec(handle->id, "touch /etc/x");
                     require(result.ok(), "ordinary failure is a result");
                     require(result.value().exit_code == 1, "command exit code kept");
                     require(result.value().outcome == sandbox::ExecOutcome::Completed,
                             "not a security violation");
                   }});

  tests.push_back({"sandbox_exec_timeout_restarts_container", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     fx.docker->block_exec_until_kill(true);
                     sandbox::ExecOptions options;
                     options.timeout_sec = 1;
                     const auto result = fx.provider.exec(*handle, "sleep 60", options);
                     require(result.ok(), "timeout is a result");
                     require(result.value().exit_code == sandbox::kTimeoutExitCode, "exit 124");
                     require(result.value().outcome == sandbox::ExecOutcome::TimedOut,
                             "timed out");
                     require(result.value().stderr_text == "Command timed out after 1 seconds",
                             "timeout message");

                     const auto subcommands = fx.docker->subcommands();
                     const auto kill = std::find(subcommands.begin(), subcommands.end(), "kill");
                     const auto wait = std::find(kill, subcommands.end(), "wait");
                     const auto start = std::find(wait, subcommands.end(), "start");
                     require(kill != subcommands.end() && wait != subcommands.end() &&
                                 start != subcommands.end(),
                             "kill, wait, start in order");

                     fx.docker->block_exec_until_kill(false);
                     fx.docker->respond("exec", 0, "ok\n");
                     const auto after = fx.provider.exec(*handle, "echo ok");
                     require(after.ok() && after.value().exit_code == 0 &&
                                 after.value().result == "ok",
                             "sandbox usable after timeout");
                   }});

  tests.push_back({"sandbox_exec_timeout_with_failed_restart_is_an_error", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     fx.docker->block_exec_until_kill(true);
                     fx.docker->respond("start", 1, "", "Error response from daemon: gone");
                     sandbox::ExecOptions options;
                     options.timeout_sec = 1;
                     const auto result = fx.provider.exec(*handle, "sleep 60", options);
                     require(!result.ok(), "failed recovery is a failure");
                     require_contains(result.error(), "could not be restarted", "restart failure");
                   }});

  tests.push_back({"sandbox_exec_security_violation", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     fx.docker->respond("exec", 126, "",
                                        "OCI runtime exec failed: exec failed: unable to start "
                                        "container process: open /etc/passwd: read-only file "
                                        "system: unknown\n");
                     ScopedCapture capture;
                     const auto result = fx.provider.exec(*handle, "echo x > /etc/passwd");
                     require(result.ok(), "violation is a result");
                     require(result.value().exit_code == sandbox::kSecurityViolationExitCode,
                             "exit 126");
                     require(result.value().outcome == sandbox::ExecOutcome::SecurityViolation,
                             "security violation");
                     require_contains(result.value().stderr_text, "read-only file system",
                                      "runtime message kept");

                     bool recorded = false;
                     for (const auto &event : capture.observer().events()) {
                       if (const auto *exec = std::get_if<obs::SandboxExecEvent>(&event)) {
                         recorded = exec->outcome == "security_violation" && exec->exit_code == 126;
                       }
                     }
                     require(recorded, "exec event recorded");
                   }});

  tests.push_back({"sandbox_exec_runtime_failure_is_an_error", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     fx.docker->respond("exec", 1, "",
                                        "Cannot connect to the Docker daemon at "
                                        "unix:///var/run/docker.sock. Is the docker daemon "
                                        "running?\n");
                     const auto result = fx.provider.exec(*handle, "ls");
                     require(!result.ok(), "daemon failure is an error");
                     require(result.error().find("Sandbox exec failed: Cannot connect") == 0,
                             "error: " + result.error());

                     fx.docker->fail("exec", "docker binary not found");
                     const auto missing = fx.provider.exec(*handle, "ls");
                     require(!missing.ok(), "runner failure is an error");
                   }});

  tests.push_back({"sandbox_unknown_ids", [] {
                     Fixture fx;
                     const auto exec = fx.provider.exec("nope", "ls");
                     require(!exec.ok() && exec.error() == "Sandbox nope not found", "exec");
                     const auto stop = fx.provider.stop_sandbox("nope");
                     require(!stop.ok() && stop.error() == "Sandbox nope not found", "stop");
                     const auto removed = fx.provider.delete_sandbox("nope");
                     require(removed.ok() && !removed.value(), "delete returns false");
                     require(fx.provider.get_sandbox("nope") == nullptr, "get returns null");
                   }});

  tests.push_back({"sandbox_stop_and_delete", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     const auto stopped = fx.provider.stop_sandbox(handle->id);
                     require(stopped.ok() && stopped.value() == handle->id, "stop returns id");
                     require(*fx.docker->last("stop") ==
                                 std::vector<std::string>{"stop", "-t", "0", "c0ffee1234567890"},
                             "stop arguments");
                     require(fx.provider.get_sandbox(handle->id) != nullptr,
                             "stopped sandbox still registered");

                     fx.docker->respond("stop", 1, "", "Error: container is not running");
                     const auto removed = fx.provider.delete_sandbox(handle->id);
                     require(removed.ok() && removed.value(), "delete succeeds");
                     require(fx.provider.list_sandboxes().empty(), "deregistered");
                     const auto again = fx.provider.delete_sandbox(handle->id);
                     require(again.ok() && !again.value(), "second delete is harmless");
                   }});

  tests.push_back({"sandbox_delete_tolerates_missing_container", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     fx.docker->respond("rm", 1, "", "Error: No such container: c0ffee");
                     const auto removed = fx.provider.delete_sandbox(handle->id);
                     require(removed.ok() && removed.value(), "already gone is fine");

                     const auto second = fx.create();
                     fx.docker->respond("rm", 1, "", "Error response from daemon: busy");
                     const auto failed = fx.provider.delete_sandbox(second->id);
                     require(!failed.ok(), "real rm failure surfaces");
                     require(fx.provider.get_sandbox(second->id) != nullptr,
                             "still registered after failed delete");
                   }});

  tests.push_back({"sandbox_handle_process_executes", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     fx.docker->respond("exec", 3, "partial", "boom");
                     const auto result = handle->process->execute_command("false");
                     require(result.ok() && result.value().exit_code == 3, "exit propagated");
                     require(result.value().artifacts.stderr_text == "boom", "artifacts");
                   }});

  tests.push_back({"sandbox_resolve_timeout", [] {
                     require(sandbox::resolve_timeout_sec(5, 30) == 5, "per-call wins");
                     require(sandbox::resolve_timeout_sec(std::nullopt, 30) == 30,
                             "provider default");
                     require(sandbox::resolve_timeout_sec(std::nullopt, std::nullopt) == 900,
                             "900 seconds");
                     require(sandbox::resolve_timeout_sec(0, 30) == 0, "zero disables");
                     require(sandbox::resolve_timeout_sec(10'000'000'000LL, std::nullopt) ==
                                 sandbox::kMaxTimeoutSec,
                             "huge per-call timeout capped");
                     require(sandbox::resolve_timeout_sec(std::nullopt, 10'000'000'000LL) ==
                                 sandbox::kMaxTimeoutSec,
                             "huge default capped");
                   }});

  tests.push_back({"sandbox_exec_with_huge_timeout_completes", [] {
                     Fixture fx;
                     const auto handle = fx.create();
                     fx.docker->respond("exec", 0, "done\n", "");
                     sandbox::ExecOptions options;
                     options.timeout_sec = 10'000'000'000LL;
                     const auto result = fx.provider.exec(*handle, "true", options);
                     require(result.ok(), "exec succeeds");
                     require(result.value().exit_code == 0 &&
                                 result.value().outcome == sandbox::ExecOutcome::Completed,
                             "not reported as a timeout");
                     require(!fx.docker->last("kill").has_value(), "container not killed");
                   }});

  tests.push_back({"sandbox_security_fingerprints", [] {
                     require(sandbox::matches_security_fingerprint("Operation not permitted"),
                             "eperm");
                     require(sandbox::matches_security_fingerprint("apparmor policy denied"),
                             "apparmor");
                     require(sandbox::matches_security_fingerprint("blocked by SECCOMP"), "seccomp");
                     require(!sandbox::matches_security_fingerprint("No such file or directory"),
                             "ordinary error");

                     require(sandbox::is_runtime_error({.exit_code = 125}), "125");
                     require(sandbox::is_runtime_error({.exit_code = -1}), "negative");
                     require(!sandbox::is_runtime_error({.exit_code = 1, .stderr_text = "nope"}),
                             "command failure");
                     require(sandbox::is_runtime_error(
                                 {.exit_code = 1, .stderr_text = "Error response from daemon: x"}),
                             "daemon error");
                   }});

  tests.push_back({"sandbox_parse_inspect_line", [] {
                     const auto parsed =
                         sandbox::parse_inspect_line("abc|/name|1500000000|1024|64\n");
                     require(parsed.ok(), "parses");
                     require(parsed.value().id == "abc" && parsed.value().name == "name", "ids");
                     require(parsed.value().applied.cpu_count == std::optional<double>(1.5), "cpus");
                     require(parsed.value().applied.memory_bytes == std::optional<std::int64_t>(1024),
                             "memory");
                     require(parsed.value().applied.pids_limit == std::optional<std::int64_t>(64),
                             "pids");
                     require(!sandbox::parse_inspect_line("abc|name").ok(), "too few fields");
                     const auto unlimited = sandbox::parse_inspect_line("abc|n|0|0|-1");
                     require(unlimited.ok() && !unlimited.value().applied.pids_limit.has_value(),
                             "non-positive limits are unset");
                   }});

  tests.push_back({"sandbox_options_from_config", [] {
                     shellwarden::config::SandboxConfig cfg;
                     cfg.default_mount_path = "/repo";
                     cfg.network_mode = "bridge";
                     cfg.writable_mounts = {"/tmp/a:/out", "invalid"};
                     cfg.docker_timeout_sec = 5;
                     const auto options = sandbox::options_from_config(cfg);
                     require(options.default_mount_path == std::optional<std::string>("/repo"),
                             "mount path");
                     require(options.network_mode == "bridge", "network");
                     require(options.writable_mounts.size() == 1 &&
                                 options.writable_mounts[0].target == "/out",
                             "valid mounts only");
                     require(options.docker_timeout == std::chrono::seconds(5), "docker timeout");
                     require(options.default_timeout_sec == std::optional<std::int64_t>(900),
                             "exec timeout");

                     const auto limits = sandbox::effective_limits(sandbox::SandboxProviderOptions{});
                     require(limits.cpu_count == std::optional<double>(2.0) &&
                                 limits.pids_limit == std::optional<std::int64_t>(512),
                             "defaults fill unset limits");
                   }});
}
