#include "shellwarden/cli/commands.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/config/config.hpp"
#include "shellwarden/observability/factory.hpp"
#include "shellwarden/observability/global.hpp"
#include "shellwarden/providers/factory.hpp"
#include "shellwarden/sandbox/provider.hpp"
#include "shellwarden/sandbox/runners.hpp"
#include "shellwarden/security/command_filter.hpp"
#include "shellwarden/security/command_safety.hpp"
#include "shellwarden/tools/gated_tools.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace shellwarden::cli {

namespace {

std::string version_string() {
#ifdef SHELLWARDEN_VERSION
  std::string version = SHELLWARDEN_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "shellwarden " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

std::optional<std::int64_t> parse_int64(const std::string &value) {
  std::int64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

// Loads config and installs the configured observer. Returns nullopt after printing
// the error.
std::optional<config::Config> load_runtime_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return std::nullopt;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cerr << "invalid configuration: " << validated.error() << "\n";
    return std::nullopt;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  for (const auto &warning : validated.value()) {
    observability::log_warn(warning);
  }
  return cfg.value();
}

std::unique_ptr<security::IRiskAssessor> make_assessor(const config::Config &cfg,
                                                       std::string &error) {
  if (!cfg.risk_assessor.enabled) {
    observability::log_warn("Risk assessor disabled; every gated command that is not known-safe "
                            "will be rejected");
    return std::make_unique<security::DenyAllRiskAssessor>();
  }
  auto provider = providers::create_reliable_provider(
      cfg.risk_assessor.provider, cfg.risk_assessor.api_key, cfg.reliability);
  if (!provider.ok()) {
    error = provider.error();
    return nullptr;
  }
  return std::make_unique<security::ProviderRiskAssessor>(
      provider.value(), cfg.risk_assessor.model, cfg.risk_assessor.temperature);
}

int run_check(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: shellwarden check <command tokens...>\n";
    return 2;
  }
  const bool safe = security::is_known_safe_command(args);
  std::cout << (safe ? "safe" : "needs-assessment") << "\n";
  return safe ? 0 : 1;
}

int run_filter(std::vector<std::string> args) {
  std::string file;
  const bool from_file = take_option(args, "--file", "-f", file);

  std::string input;
  if (from_file) {
    std::ifstream stream(file);
    if (!stream) {
      std::cerr << "Unable to open " << file << "\n";
      return 1;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    input = buffer.str();
  } else {
    input = read_stdin_all();
  }

  auto calls = tools::parse_tool_calls(input);
  if (!calls.ok()) {
    std::cerr << "invalid tool calls: " << calls.error() << "\n";
    return 1;
  }

  const auto cfg = load_runtime_config();
  if (!cfg.has_value()) {
    return 1;
  }
  std::string error;
  auto assessor = make_assessor(*cfg, error);
  if (assessor == nullptr) {
    std::cerr << "cannot create risk assessor: " << error << "\n";
    return 1;
  }

  const auto outcome = security::filter_unsafe_commands(calls.value(), *assessor);
  std::cout << tools::tool_calls_to_json(outcome.filtered_tool_calls) << "\n";
  return 0;
}

int run_exec(std::vector<std::string> args) {
  std::string repo;
  std::string image;
  std::string timeout;
  std::string cwd;
  const bool has_repo = take_option(args, "--repo", "-r", repo);
  const bool has_image = take_option(args, "--image", "", image);
  const bool has_timeout = take_option(args, "--timeout", "-t", timeout);
  const bool has_cwd = take_option(args, "--cwd", "", cwd);
  const bool keep = take_flag(args, "--keep");

  sandbox::ExecOptions exec_options;
  std::string env_entry;
  while (take_option(args, "--env", "-e", env_entry)) {
    const auto eq = env_entry.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "invalid --env value (expected KEY=VALUE): " << env_entry << "\n";
      return 2;
    }
    exec_options.env[env_entry.substr(0, eq)] = env_entry.substr(eq + 1);
  }
  if (has_timeout) {
    const auto parsed = parse_int64(timeout);
    if (!parsed.has_value()) {
      std::cerr << "invalid --timeout value: " << timeout << "\n";
      return 2;
    }
    exec_options.timeout_sec = *parsed;
  }
  if (has_cwd) {
    exec_options.cwd = cwd;
  }

  if (!args.empty() && args.front() == "--") {
    args.erase(args.begin());
  }
  if (args.empty()) {
    std::cerr << "usage: shellwarden exec --repo <path> [--image i] [--timeout n] [--cwd d] "
                 "[--env K=V]... [--keep] -- <command>\n";
    return 2;
  }

  const auto cfg = load_runtime_config();
  if (!cfg.has_value()) {
    return 1;
  }

  sandbox::DockerSandboxProvider provider(sandbox::options_from_config(cfg->sandbox));
  const std::optional<std::string> mount =
      has_repo ? std::optional<std::string>(repo) : std::nullopt;
  auto handle = provider.create_sandbox(has_image ? image : cfg->sandbox.image, mount);
  if (!handle.ok()) {
    std::cerr << handle.error() << "\n";
    return 1;
  }

  // A single argument is taken as a complete shell string; several are quoted and joined.
  const std::string command =
      args.size() == 1 ? args.front() : tools::format_shell_command(args, std::nullopt);
  auto result = sandbox::exec_in_sandbox(*handle.value(), command, exec_options);

  int exit_code = 1;
  if (result.ok()) {
    std::cout << result.value().stdout_text;
    std::cerr << result.value().stderr_text;
    exit_code = result.value().exit_code;
  } else {
    std::cerr << result.error() << "\n";
  }

  if (keep) {
    std::cerr << "sandbox kept: " << handle.value()->id << "\n";
  } else {
    auto deleted = provider.delete_sandbox(handle.value()->id);
    if (!deleted.ok()) {
      std::cerr << "failed to delete sandbox " << handle.value()->id << ": " << deleted.error()
                << "\n";
    }
  }
  return exit_code;
}

int run_config(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    if (auto path = config::config_path(); path.ok()) {
      std::cout << "# " << path.value().string()
                << (config::config_exists() ? "" : " (not found, showing defaults)") << "\n";
    }
    std::cout << config::config_to_toml(cfg.value());
    const auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "error: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cerr << "warning: " << warning << "\n";
    }
    return 0;
  }

  if (args[0] == "get") {
    if (args.size() < 2) {
      std::cerr << "usage: shellwarden config get <key>\n";
      return 1;
    }
    auto value = config::get_config_value(cfg.value(), args[1]);
    if (!value.ok()) {
      std::cerr << value.error() << "\n";
      return 1;
    }
    std::cout << value.value() << "\n";
    return 0;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: shellwarden config set <key> <value>\n";
      return 1;
    }
    auto status = config::set_config_value(cfg.value(), args[1], args[2]);
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
    auto saved = config::save_config(cfg.value());
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return 0;
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 1;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  ShellWarden" << RESET << DIM
            << "  sandboxed command execution for coding agents" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "shellwarden [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "check" << RESET << " TOKENS..." << DIM
            << "      Classify a shell command without the risk assessor" << RESET << "\n";
  std::cout << "  " << GREEN << "filter" << RESET << " [--file F]" << DIM
            << "     Filter a JSON array of tool calls read from stdin or F" << RESET << "\n";
  std::cout << "  " << GREEN << "exec" << RESET << " --repo P -- CMD" << DIM
            << " Run CMD in a fresh sandbox mounting P read-only" << RESET << "\n";
  std::cout << DIM << "       [--image I] [--timeout N] [--cwd D] [--env K=V]... [--keep]"
            << RESET << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM
            << "          Display current configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config get" << RESET << " KEY" << DIM << "       Print one value"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config set" << RESET << " KEY VAL" << DIM
            << "   Update and save one value" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM
            << "          Print the config file location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "              Show version" << RESET
            << "\n\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "check") {
    return run_check(args);
  }
  if (subcommand == "filter") {
    return run_filter(std::move(args));
  }
  if (subcommand == "exec") {
    return run_exec(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace shellwarden::cli
