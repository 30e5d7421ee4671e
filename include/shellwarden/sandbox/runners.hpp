#pragma once

#include "shellwarden/common/result.hpp"
#include "shellwarden/sandbox/provider.hpp"
#include "shellwarden/sandbox/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shellwarden::sandbox {

enum class NodePackageManager { Npm, Yarn, Pnpm };
enum class JavaBuildTool { Maven, Gradle };

struct NodeInstallOptions {
  NodePackageManager manager = NodePackageManager::Npm;
  bool frozen_lockfile = false;
  std::vector<std::string> additional_args;
  std::optional<std::string> command_override;
};

struct PythonTestOptions {
  std::string python_path = "python";
  std::vector<std::string> pytest_args;
  std::vector<std::string> test_files;
  std::optional<std::string> command_override;
};

struct JavaTestOptions {
  JavaBuildTool tool = JavaBuildTool::Maven;
  bool use_wrapper = true;
  std::vector<std::string> extra_args;
  std::optional<std::string> command_override;
};

[[nodiscard]] std::optional<NodePackageManager> parse_node_package_manager(const std::string &name);
[[nodiscard]] std::optional<JavaBuildTool> parse_java_build_tool(const std::string &name);

[[nodiscard]] std::string build_node_install_command(const NodeInstallOptions &options);
[[nodiscard]] std::string build_python_test_command(const PythonTestOptions &options);
[[nodiscard]] std::string build_java_test_command(const JavaTestOptions &options);

/// Runs through the handle's own process capability.
[[nodiscard]] common::Result<ExecResult> exec_in_sandbox(const SandboxHandle &handle,
                                                         const std::string &command,
                                                         const ExecOptions &options = {});

/// Resolves the sandbox by id on the provider.
[[nodiscard]] common::Result<ExecResult> exec_in_sandbox(ISandboxProvider &provider,
                                                         const std::string &sandbox_id,
                                                         const std::string &command,
                                                         const ExecOptions &options = {});

} // namespace shellwarden::sandbox
