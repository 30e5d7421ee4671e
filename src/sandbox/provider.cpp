#include "shellwarden/sandbox/provider.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/observability/global.hpp"
#include "shellwarden/sandbox/binds.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <initializer_list>
#include <iomanip>
#include <random>
#include <sstream>
#include <string_view>

namespace shellwarden::sandbox {

namespace {

std::string random_suffix() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream out;
  out << std::hex << std::setw(12) << std::setfill('0') << (rng() & 0xffffffffffffULL);
  return out.str();
}

std::optional<std::int64_t> parse_positive(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::int64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || parsed <= 0) {
    return std::nullopt;
  }
  return parsed;
}

bool mentions(const std::string &message, std::initializer_list<std::string_view> needles) {
  const std::string lowered = common::to_lower(message);
  for (const auto needle : needles) {
    if (lowered.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string failure_text(const common::Result<DockerProcessResult> &result) {
  if (!result.ok()) {
    return result.error();
  }
  return common::trim(result.value().stderr_text);
}

common::Result<ExecResult> run_and_record(const ContainerExecutor &executor,
                                          const std::string &sandbox_id,
                                          const std::string &container_id,
                                          const std::string &command, const ExecOptions &options) {
  const auto started = std::chrono::steady_clock::now();
  auto result = executor.exec(container_id, command, options);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (result.ok()) {
    observability::record_sandbox_exec(sandbox_id,
                                       std::string(exec_outcome_to_string(result.value().outcome)),
                                       result.value().exit_code, elapsed);
  } else {
    observability::record_error("sandbox", sandbox_id + ": " + result.error());
  }
  return result;
}

class ContainerProcess final : public ISandboxProcess {
public:
  ContainerProcess(std::shared_ptr<ContainerExecutor> executor, std::string sandbox_id,
                   std::string container_id)
      : executor_(std::move(executor)), sandbox_id_(std::move(sandbox_id)),
        container_id_(std::move(container_id)) {}

  [[nodiscard]] common::Result<ExecResult> execute_command(const std::string &command,
                                                           const ExecOptions &options) override {
    return run_and_record(*executor_, sandbox_id_, container_id_, command, options);
  }

private:
  std::shared_ptr<ContainerExecutor> executor_;
  std::string sandbox_id_;
  std::string container_id_;
};

// A missing or non-positive limit means "use the default", never "unlimited".
template <typename T> T positive_or(const std::optional<T> &requested, T fallback) {
  return requested.has_value() && *requested > 0 ? *requested : fallback;
}

} // namespace

SandboxProviderOptions options_from_config(const config::SandboxConfig &config) {
  SandboxProviderOptions options;
  if (!common::trim(config.default_mount_path).empty()) {
    options.default_mount_path = config.default_mount_path;
  }
  options.working_dir = config.working_dir;
  options.user = config.user;
  options.network_mode = config.network_mode;
  options.cpu_count = config.cpu_count;
  options.memory_bytes = config.memory_bytes;
  options.pids_limit = config.pids_limit;
  options.default_timeout_sec = config.default_timeout_sec;
  options.ensure_mounts_exist = config.ensure_mounts_exist;
  for (const auto &entry : config.writable_mounts) {
    if (const auto bind = parse_bind(entry); bind.has_value()) {
      options.writable_mounts.push_back(WritableMount{.source = bind->host, .target = bind->container});
    }
  }
  options.docker_timeout = std::chrono::seconds(static_cast<std::int64_t>(
      std::min<std::uint64_t>(config.docker_timeout_sec, kMaxTimeoutSec)));
  return options;
}

SandboxResourceLimits effective_limits(const SandboxProviderOptions &options) {
  return SandboxResourceLimits{
      .cpu_count = positive_or(options.cpu_count, kDefaultCpuCount),
      .memory_bytes = positive_or(options.memory_bytes, kDefaultMemoryBytes),
      .pids_limit = positive_or(options.pids_limit, kDefaultPidsLimit),
  };
}

std::vector<std::string> build_create_args(const SandboxProviderOptions &options,
                                           const std::string &container_name,
                                           const std::string &image,
                                           const std::vector<std::string> &binds,
                                           const SandboxResourceLimits &limits) {
  std::vector<std::string> args = {"create", "--name", container_name, "--label", kSandboxLabel};
  args.push_back("--user");
  args.push_back(options.user);
  args.push_back("--read-only");
  args.push_back("--tmpfs");
  args.push_back("/tmp:" + options.tmpfs_options);
  args.push_back("--network");
  args.push_back(common::trim(options.network_mode).empty() ? std::string(kDefaultNetworkMode)
                                                            : options.network_mode);
  args.push_back("--cap-drop");
  args.push_back("ALL");
  args.push_back("--security-opt");
  args.push_back("no-new-privileges");

  if (limits.cpu_count.has_value() && *limits.cpu_count > 0) {
    std::ostringstream cpu;
    cpu << std::fixed << std::setprecision(2) << *limits.cpu_count;
    args.push_back("--cpus");
    args.push_back(cpu.str());
  }
  if (limits.memory_bytes.has_value() && *limits.memory_bytes > 0) {
    args.push_back("--memory");
    args.push_back(std::to_string(*limits.memory_bytes));
  }
  if (limits.pids_limit.has_value() && *limits.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(*limits.pids_limit));
  }

  for (const auto &[key, value] : options.env) {
    args.push_back("--env");
    args.push_back(key + "=" + value);
  }
  for (const auto &bind : binds) {
    args.push_back("-v");
    args.push_back(bind);
  }

  args.push_back("--workdir");
  args.push_back(options.working_dir);
  args.push_back(image);
  args.push_back("/bin/sh");
  args.push_back("-c");
  args.push_back("tail -f /dev/null");
  return args;
}

common::Result<InspectedContainer> parse_inspect_line(const std::string &line) {
  std::vector<std::string> fields;
  std::stringstream stream(common::trim(line));
  std::string field;
  while (std::getline(stream, field, '|')) {
    fields.push_back(common::trim(field));
  }
  if (fields.size() != 5 || fields[0].empty()) {
    return common::Result<InspectedContainer>::failure("unexpected docker inspect output: " + line);
  }

  InspectedContainer inspected;
  inspected.id = fields[0];
  inspected.name = common::starts_with(fields[1], "/") ? fields[1].substr(1) : fields[1];
  if (const auto nano_cpus = parse_positive(fields[2]); nano_cpus.has_value()) {
    inspected.applied.cpu_count = static_cast<double>(*nano_cpus) / 1e9;
  }
  inspected.applied.memory_bytes = parse_positive(fields[3]);
  inspected.applied.pids_limit = parse_positive(fields[4]);
  return common::Result<InspectedContainer>::success(std::move(inspected));
}

DockerSandboxProvider::DockerSandboxProvider(SandboxProviderOptions options,
                                             std::shared_ptr<IDockerRunner> docker_runner)
    : options_(std::move(options)), docker_runner_(std::move(docker_runner)) {
  executor_ = std::make_shared<ContainerExecutor>(
      docker_runner_, ExecutorOptions{.working_dir = options_.working_dir,
                                      .default_timeout_sec = options_.default_timeout_sec,
                                      .docker_timeout = options_.docker_timeout});
}

common::Result<std::filesystem::path>
DockerSandboxProvider::resolve_mount_path(const std::optional<std::string> &mount_path) const {
  std::string repo = mount_path.value_or("");
  if (common::trim(repo).empty()) {
    repo = options_.default_mount_path.value_or("");
  }
  if (common::trim(repo).empty()) {
    return common::Result<std::filesystem::path>::failure(
        "A mount path must be provided either explicitly or via defaultMountPath");
  }

  std::error_code ec;
  const auto repo_path = std::filesystem::absolute(common::expand_path(repo), ec);
  if (ec || !std::filesystem::exists(repo_path, ec)) {
    return common::Result<std::filesystem::path>::failure("Mount path does not exist: " + repo);
  }
  return common::Result<std::filesystem::path>::success(repo_path);
}

common::Result<std::vector<std::string>>
DockerSandboxProvider::prepare_binds(const std::filesystem::path &repo_path) const {
  std::vector<std::string> binds = {repo_path.string() + ":" + options_.working_dir + ":ro"};
  for (const auto &mount : options_.writable_mounts) {
    std::error_code ec;
    const auto source = std::filesystem::absolute(common::expand_path(mount.source), ec);
    if (ec) {
      return common::Result<std::vector<std::string>>::failure("Mount path does not exist: " +
                                                               mount.source);
    }
    if (!std::filesystem::exists(source, ec)) {
      if (!options_.ensure_mounts_exist) {
        return common::Result<std::vector<std::string>>::failure("Mount path does not exist: " +
                                                                 source.string());
      }
      const auto created = common::ensure_dir(source);
      if (!created.ok()) {
        return common::Result<std::vector<std::string>>::failure(created.error());
      }
    }
    binds.push_back(source.string() + ":" + mount.target + ":rw");
  }
  return common::Result<std::vector<std::string>>::success(dedupe_binds_prefer_rw(binds));
}

common::Result<std::shared_ptr<const SandboxHandle>>
DockerSandboxProvider::create_sandbox(const std::string &image,
                                      const std::optional<std::string> &mount_path) {
  using HandleResult = common::Result<std::shared_ptr<const SandboxHandle>>;
  if (!docker_runner_) {
    return HandleResult::failure("docker runner unavailable");
  }
  if (common::trim(image).empty()) {
    return HandleResult::failure("An image must be provided");
  }

  const auto repo_path = resolve_mount_path(mount_path);
  if (!repo_path.ok()) {
    return HandleResult::failure(repo_path.error());
  }
  const auto binds = prepare_binds(repo_path.value());
  if (!binds.ok()) {
    return HandleResult::failure(binds.error());
  }

  const SandboxResourceLimits requested = effective_limits(options_);
  const std::string container_name = options_.container_name_prefix + random_suffix();
  const auto args = build_create_args(options_, container_name, image, binds.value(), requested);

  const auto created =
      docker_runner_->run(args, DockerCommandOptions{.timeout = options_.create_timeout});
  if (!created.ok()) {
    return HandleResult::failure("Failed to create sandbox container: " + created.error());
  }
  const auto create_lines = common::split_whitespace(created.value().stdout_text);
  const std::string created_id = create_lines.empty() ? container_name : create_lines.back();

  const DockerCommandOptions lifecycle{.timeout = options_.docker_timeout};
  const auto cleanup = [this, &created_id]() {
    if (const auto removed = safe_remove(created_id); !removed.ok()) {
      observability::record_error("sandbox", "cleanup of " + created_id + " failed: " +
                                                 removed.error());
    }
  };

  const auto started = docker_runner_->run({"start", created_id}, lifecycle);
  if (!started.ok()) {
    cleanup();
    return HandleResult::failure("Failed to start sandbox container: " + started.error());
  }

  const auto inspected_raw = docker_runner_->run(
      {"inspect", "-f",
       "{{.Id}}|{{.Name}}|{{.HostConfig.NanoCpus}}|{{.HostConfig.Memory}}|{{.HostConfig.PidsLimit}}",
       created_id},
      lifecycle);
  if (!inspected_raw.ok()) {
    cleanup();
    return HandleResult::failure("Failed to inspect sandbox container: " + inspected_raw.error());
  }
  const auto inspected = parse_inspect_line(inspected_raw.value().stdout_text);
  if (!inspected.ok()) {
    cleanup();
    return HandleResult::failure(inspected.error());
  }

  const std::string id = inspected.value().id;
  auto handle = std::make_shared<SandboxHandle>();
  handle->id = id;
  handle->metadata = SandboxMetadata{
      .container_id = id,
      .container_name = inspected.value().name.empty() ? container_name : inspected.value().name,
      .image = image,
      .mount_path = repo_path.value().string(),
      .requested_resources = requested,
      .applied_resources = inspected.value().applied,
  };
  handle->process = std::make_shared<ContainerProcess>(executor_, id, id);

  if (requested != inspected.value().applied) {
    observability::log_info("sandbox " + id + ": runtime applied limits differ from requested");
  }

  std::shared_ptr<const SandboxHandle> stored = handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sandboxes_[id] = stored;
  }
  observability::record_sandbox_lifecycle("created", id, image);
  return HandleResult::success(std::move(stored));
}

std::shared_ptr<const SandboxHandle> DockerSandboxProvider::get_sandbox(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sandboxes_.find(id);
  return it == sandboxes_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<const SandboxHandle>> DockerSandboxProvider::list_sandboxes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<const SandboxHandle>> out;
  out.reserve(sandboxes_.size());
  for (const auto &[id, handle] : sandboxes_) {
    out.push_back(handle);
  }
  return out;
}

common::Status DockerSandboxProvider::safe_stop(const std::string &container_id) const {
  const auto stopped = docker_runner_->run(
      {"stop", "-t", "0", container_id},
      DockerCommandOptions{.allow_failure = true, .timeout = options_.docker_timeout});
  if (stopped.ok() && stopped.value().exit_code == 0) {
    return common::Status::success();
  }
  const std::string message = failure_text(stopped);
  if (mentions(message, {"is not running", "no such container"})) {
    return common::Status::success();
  }
  return common::Status::error(message);
}

common::Status DockerSandboxProvider::safe_remove(const std::string &container_id) const {
  const auto removed = docker_runner_->run(
      {"rm", "-f", container_id},
      DockerCommandOptions{.allow_failure = true, .timeout = options_.docker_timeout});
  if (removed.ok() && removed.value().exit_code == 0) {
    return common::Status::success();
  }
  const std::string message = failure_text(removed);
  if (mentions(message, {"no such container"})) {
    return common::Status::success();
  }
  return common::Status::error(message);
}

common::Result<std::string> DockerSandboxProvider::stop_sandbox(const std::string &id) {
  const auto handle = get_sandbox(id);
  if (!handle) {
    return common::Result<std::string>::failure("Sandbox " + id + " not found");
  }
  const auto stopped = safe_stop(handle->metadata.container_id);
  if (!stopped.ok()) {
    return common::Result<std::string>::failure("Failed to stop sandbox " + id + ": " +
                                                stopped.error());
  }
  observability::record_sandbox_lifecycle("stopped", id);
  return common::Result<std::string>::success(id);
}

common::Result<bool> DockerSandboxProvider::delete_sandbox(const std::string &id) {
  const auto handle = get_sandbox(id);
  if (!handle) {
    return common::Result<bool>::success(false);
  }

  if (const auto stopped = safe_stop(handle->metadata.container_id); !stopped.ok()) {
    observability::log_warn("sandbox " + id + ": stop before delete failed: " + stopped.error());
  }
  const auto removed = safe_remove(handle->metadata.container_id);
  if (!removed.ok()) {
    return common::Result<bool>::failure("Failed to delete sandbox " + id + ": " + removed.error());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    sandboxes_.erase(id);
  }
  observability::record_sandbox_lifecycle("deleted", id);
  return common::Result<bool>::success(true);
}

common::Result<ExecResult> DockerSandboxProvider::exec(const SandboxHandle &target,
                                                       const std::string &command,
                                                       const ExecOptions &options) {
  return exec(target.id, command, options);
}

common::Result<ExecResult> DockerSandboxProvider::exec(const std::string &id,
                                                       const std::string &command,
                                                       const ExecOptions &options) {
  const auto handle = get_sandbox(id);
  if (!handle) {
    return common::Result<ExecResult>::failure("Sandbox " + id + " not found");
  }
  return run_and_record(*executor_, handle->id, handle->metadata.container_id, command, options);
}

} // namespace shellwarden::sandbox
