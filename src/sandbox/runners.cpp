#include "shellwarden/sandbox/runners.hpp"

#include "shellwarden/common/fs.hpp"

namespace shellwarden::sandbox {

namespace {

std::string join_command(const std::vector<std::string> &parts) {
  std::string out;
  for (const auto &part : parts) {
    if (common::trim(part).empty()) {
      continue;
    }
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += part;
  }
  return out;
}

bool has_override(const std::optional<std::string> &command_override) {
  return command_override.has_value() && !common::trim(*command_override).empty();
}

} // namespace

std::optional<NodePackageManager> parse_node_package_manager(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "npm") {
    return NodePackageManager::Npm;
  }
  if (normalized == "yarn") {
    return NodePackageManager::Yarn;
  }
  if (normalized == "pnpm") {
    return NodePackageManager::Pnpm;
  }
  return std::nullopt;
}

std::optional<JavaBuildTool> parse_java_build_tool(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "maven" || normalized == "mvn") {
    return JavaBuildTool::Maven;
  }
  if (normalized == "gradle") {
    return JavaBuildTool::Gradle;
  }
  return std::nullopt;
}

std::string build_node_install_command(const NodeInstallOptions &options) {
  if (has_override(options.command_override)) {
    return *options.command_override;
  }

  std::vector<std::string> parts;
  switch (options.manager) {
  case NodePackageManager::Npm:
    parts = {"npm", options.frozen_lockfile ? "ci" : "install"};
    break;
  case NodePackageManager::Yarn:
    parts = {"yarn", "install"};
    if (options.frozen_lockfile) {
      parts.emplace_back("--frozen-lockfile");
    }
    break;
  case NodePackageManager::Pnpm:
    parts = {"pnpm", "install"};
    if (options.frozen_lockfile) {
      parts.emplace_back("--frozen-lockfile");
    }
    break;
  }
  parts.insert(parts.end(), options.additional_args.begin(), options.additional_args.end());
  return join_command(parts);
}

std::string build_python_test_command(const PythonTestOptions &options) {
  if (has_override(options.command_override)) {
    return *options.command_override;
  }

  std::vector<std::string> parts = {
      common::trim(options.python_path).empty() ? std::string("python") : options.python_path,
      "-m", "pytest"};
  parts.insert(parts.end(), options.pytest_args.begin(), options.pytest_args.end());
  parts.insert(parts.end(), options.test_files.begin(), options.test_files.end());
  return join_command(parts);
}

std::string build_java_test_command(const JavaTestOptions &options) {
  if (has_override(options.command_override)) {
    return *options.command_override;
  }

  std::vector<std::string> parts;
  if (options.tool == JavaBuildTool::Maven) {
    parts = {"mvn", "test"};
  } else {
    parts = {options.use_wrapper ? "./gradlew" : "gradle", "test"};
  }
  parts.insert(parts.end(), options.extra_args.begin(), options.extra_args.end());
  return join_command(parts);
}

common::Result<ExecResult> exec_in_sandbox(const SandboxHandle &handle, const std::string &command,
                                           const ExecOptions &options) {
  if (!handle.process) {
    return common::Result<ExecResult>::failure("Sandbox " + handle.id +
                                               " has no process capability");
  }
  return handle.process->execute_command(command, options);
}

common::Result<ExecResult> exec_in_sandbox(ISandboxProvider &provider,
                                           const std::string &sandbox_id,
                                           const std::string &command,
                                           const ExecOptions &options) {
  return provider.exec(sandbox_id, command, options);
}

} // namespace shellwarden::sandbox
