#include "shellwarden/config/config.hpp"

#include "shellwarden/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace shellwarden::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".shellwarden";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SHELLWARDEN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // Never clobber the real environment.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("SHELLWARDEN_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string double_to_string(const double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

bool parse_bool(const std::string &value, bool &out) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes") {
    out = true;
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no") {
    out = false;
    return true;
  }
  return false;
}

template <typename Int> bool parse_int(const std::string &value, Int &out) {
  const std::string normalized = common::trim(value);
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && !normalized.empty();
}

bool parse_double(const std::string &value, double &out) {
  const std::string normalized = common::trim(value);
  if (normalized.empty()) {
    return false;
  }
  char *end = nullptr;
  out = std::strtod(normalized.c_str(), &end);
  return end == normalized.c_str() + normalized.size();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *image = non_empty_env("SHELLWARDEN_SANDBOX_IMAGE"); image != nullptr) {
    config.sandbox.image = image;
  }
  if (const char *network = non_empty_env("SHELLWARDEN_SANDBOX_NETWORK"); network != nullptr) {
    config.sandbox.network_mode = network;
  }
  if (const char *timeout = non_empty_env("SHELLWARDEN_SANDBOX_TIMEOUT"); timeout != nullptr) {
    std::int64_t parsed = 0;
    if (parse_int(timeout, parsed)) {
      config.sandbox.default_timeout_sec = parsed;
    }
  }
  if (const char *provider = non_empty_env("SHELLWARDEN_ASSESSOR_PROVIDER"); provider != nullptr) {
    config.risk_assessor.provider = provider;
  }
  if (const char *model = non_empty_env("SHELLWARDEN_ASSESSOR_MODEL"); model != nullptr) {
    config.risk_assessor.model = model;
  }
  if (const char *api_key = non_empty_env("SHELLWARDEN_API_KEY"); api_key != nullptr) {
    config.risk_assessor.api_key = std::string(api_key);
  }
  if (const char *backend = non_empty_env("SHELLWARDEN_OBSERVABILITY"); backend != nullptr) {
    config.observability.backend = backend;
  }
}

Config config_from_toml(const common::TomlDocument &doc) {
  Config config;

  auto &sandbox = config.sandbox;
  sandbox.image = expand_config_value(doc.get_string("sandbox.image", sandbox.image));
  sandbox.network_mode = doc.get_string("sandbox.network_mode", sandbox.network_mode);
  sandbox.default_mount_path =
      expand_config_value(doc.get_string("sandbox.default_mount_path", sandbox.default_mount_path));
  sandbox.working_dir = doc.get_string("sandbox.working_dir", sandbox.working_dir);
  sandbox.user = doc.get_string("sandbox.user", sandbox.user);
  sandbox.cpu_count = doc.get_double("sandbox.cpu_count", sandbox.cpu_count);
  sandbox.memory_bytes = doc.get_i64("sandbox.memory_bytes", sandbox.memory_bytes);
  sandbox.pids_limit = doc.get_i64("sandbox.pids_limit", sandbox.pids_limit);
  sandbox.default_timeout_sec =
      doc.get_i64("sandbox.default_timeout_sec", sandbox.default_timeout_sec);
  sandbox.ensure_mounts_exist =
      doc.get_bool("sandbox.ensure_mounts_exist", sandbox.ensure_mounts_exist);
  sandbox.writable_mounts = doc.get_string_array("sandbox.writable_mounts");
  for (auto &mount : sandbox.writable_mounts) {
    mount = expand_config_value(mount);
  }
  sandbox.docker_timeout_sec = doc.get_u64("sandbox.docker_timeout_sec", sandbox.docker_timeout_sec);

  auto &assessor = config.risk_assessor;
  assessor.enabled = doc.get_bool("risk_assessor.enabled", assessor.enabled);
  assessor.provider = doc.get_string("risk_assessor.provider", assessor.provider);
  assessor.model = doc.get_string("risk_assessor.model", assessor.model);
  assessor.temperature = doc.get_double("risk_assessor.temperature", assessor.temperature);
  if (doc.has("risk_assessor.api_key")) {
    assessor.api_key = expand_config_value(doc.get_string("risk_assessor.api_key"));
  }

  auto &reliability = config.reliability;
  reliability.provider_retries = static_cast<std::uint32_t>(
      doc.get_u64("reliability.provider_retries", reliability.provider_retries));
  reliability.provider_backoff_ms =
      doc.get_u64("reliability.provider_backoff_ms", reliability.provider_backoff_ms);
  reliability.fallback_providers = doc.get_string_array("reliability.fallback_providers");

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.verbose =
      doc.get_bool("observability.verbose", config.observability.verbose);

  return config;
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = config_from_toml(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string config_to_toml(const Config &config) {
  std::ostringstream out;
  const auto &sandbox = config.sandbox;
  out << "[sandbox]\n";
  out << "image = " << common::quote_toml_string(sandbox.image) << "\n";
  out << "network_mode = " << common::quote_toml_string(sandbox.network_mode) << "\n";
  if (!sandbox.default_mount_path.empty()) {
    out << "default_mount_path = " << common::quote_toml_string(sandbox.default_mount_path)
        << "\n";
  }
  out << "working_dir = " << common::quote_toml_string(sandbox.working_dir) << "\n";
  out << "user = " << common::quote_toml_string(sandbox.user) << "\n";
  out << "cpu_count = " << double_to_string(sandbox.cpu_count) << "\n";
  out << "memory_bytes = " << sandbox.memory_bytes << "\n";
  out << "pids_limit = " << sandbox.pids_limit << "\n";
  out << "default_timeout_sec = " << sandbox.default_timeout_sec << "\n";
  out << "ensure_mounts_exist = " << bool_to_toml(sandbox.ensure_mounts_exist) << "\n";
  out << "writable_mounts = " << common::toml_string_array(sandbox.writable_mounts) << "\n";
  out << "docker_timeout_sec = " << sandbox.docker_timeout_sec << "\n";

  const auto &assessor = config.risk_assessor;
  out << "\n[risk_assessor]\n";
  out << "enabled = " << bool_to_toml(assessor.enabled) << "\n";
  out << "provider = " << common::quote_toml_string(assessor.provider) << "\n";
  out << "model = " << common::quote_toml_string(assessor.model) << "\n";
  out << "temperature = " << double_to_string(assessor.temperature) << "\n";
  if (assessor.api_key.has_value()) {
    out << "api_key = " << common::quote_toml_string(*assessor.api_key) << "\n";
  }

  out << "\n[reliability]\n";
  out << "provider_retries = " << config.reliability.provider_retries << "\n";
  out << "provider_backoff_ms = " << config.reliability.provider_backoff_ms << "\n";
  out << "fallback_providers = "
      << common::toml_string_array(config.reliability.fallback_providers) << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "verbose = " << bool_to_toml(config.observability.verbose) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }
  file << config_to_toml(config);
  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &sandbox = config.sandbox;

  if (common::trim(sandbox.image).empty()) {
    return common::Result<std::vector<std::string>>::failure("sandbox.image must not be empty");
  }
  if (common::trim(sandbox.network_mode).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.network_mode must not be empty");
  }
  if (sandbox.cpu_count < 0.0) {
    return common::Result<std::vector<std::string>>::failure("sandbox.cpu_count must be >= 0");
  }
  if (sandbox.memory_bytes < 0) {
    return common::Result<std::vector<std::string>>::failure("sandbox.memory_bytes must be >= 0");
  }
  if (sandbox.pids_limit < 0) {
    return common::Result<std::vector<std::string>>::failure("sandbox.pids_limit must be >= 0");
  }
  if (!common::starts_with(sandbox.working_dir, "/")) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.working_dir must be an absolute container path");
  }
  for (const auto &mount : sandbox.writable_mounts) {
    const auto colon = mount.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= mount.size()) {
      return common::Result<std::vector<std::string>>::failure(
          "sandbox.writable_mounts entry must be host:container: " + mount);
    }
  }

  if (common::to_lower(sandbox.network_mode) == "host") {
    warnings.push_back("sandbox.network_mode=host shares the host network stack with sandboxes");
  }
  if (sandbox.default_timeout_sec <= 0) {
    warnings.push_back("sandbox.default_timeout_sec <= 0 disables command timeouts");
  }
  if (sandbox.docker_timeout_sec == 0) {
    warnings.push_back("sandbox.docker_timeout_sec = 0 makes every docker call time out");
  }

  const auto &assessor = config.risk_assessor;
  if (assessor.temperature < 0.0 || assessor.temperature > 2.0) {
    warnings.push_back("risk_assessor.temperature should be between 0.0 and 2.0");
  }
  if (!assessor.enabled) {
    warnings.push_back(
        "risk_assessor is disabled; every command outside the known-safe set will be rejected");
  }
  if (common::trim(assessor.model).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "risk_assessor.model must not be empty");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

common::Result<std::string> get_config_value(const Config &config, const std::string &key) {
  const auto &sandbox = config.sandbox;
  const auto &assessor = config.risk_assessor;
  if (key == "sandbox.image") {
    return common::Result<std::string>::success(sandbox.image);
  }
  if (key == "sandbox.network_mode") {
    return common::Result<std::string>::success(sandbox.network_mode);
  }
  if (key == "sandbox.default_mount_path") {
    return common::Result<std::string>::success(sandbox.default_mount_path);
  }
  if (key == "sandbox.working_dir") {
    return common::Result<std::string>::success(sandbox.working_dir);
  }
  if (key == "sandbox.cpu_count") {
    return common::Result<std::string>::success(double_to_string(sandbox.cpu_count));
  }
  if (key == "sandbox.memory_bytes") {
    return common::Result<std::string>::success(std::to_string(sandbox.memory_bytes));
  }
  if (key == "sandbox.pids_limit") {
    return common::Result<std::string>::success(std::to_string(sandbox.pids_limit));
  }
  if (key == "sandbox.default_timeout_sec") {
    return common::Result<std::string>::success(std::to_string(sandbox.default_timeout_sec));
  }
  if (key == "sandbox.ensure_mounts_exist") {
    return common::Result<std::string>::success(bool_to_toml(sandbox.ensure_mounts_exist));
  }
  if (key == "risk_assessor.enabled") {
    return common::Result<std::string>::success(bool_to_toml(assessor.enabled));
  }
  if (key == "risk_assessor.provider") {
    return common::Result<std::string>::success(assessor.provider);
  }
  if (key == "risk_assessor.model") {
    return common::Result<std::string>::success(assessor.model);
  }
  if (key == "risk_assessor.temperature") {
    return common::Result<std::string>::success(double_to_string(assessor.temperature));
  }
  if (key == "observability.backend") {
    return common::Result<std::string>::success(config.observability.backend);
  }
  return common::Result<std::string>::failure("unknown key: " + key);
}

common::Status set_config_value(Config &config, const std::string &key, const std::string &value) {
  auto &sandbox = config.sandbox;
  auto &assessor = config.risk_assessor;
  const auto invalid = [&key, &value]() {
    return common::Status::error("invalid value for " + key + ": " + value);
  };

  if (key == "sandbox.image") {
    sandbox.image = value;
  } else if (key == "sandbox.network_mode") {
    sandbox.network_mode = value;
  } else if (key == "sandbox.default_mount_path") {
    sandbox.default_mount_path = value;
  } else if (key == "sandbox.working_dir") {
    sandbox.working_dir = value;
  } else if (key == "sandbox.cpu_count") {
    if (!parse_double(value, sandbox.cpu_count)) {
      return invalid();
    }
  } else if (key == "sandbox.memory_bytes") {
    if (!parse_int(value, sandbox.memory_bytes)) {
      return invalid();
    }
  } else if (key == "sandbox.pids_limit") {
    if (!parse_int(value, sandbox.pids_limit)) {
      return invalid();
    }
  } else if (key == "sandbox.default_timeout_sec") {
    if (!parse_int(value, sandbox.default_timeout_sec)) {
      return invalid();
    }
  } else if (key == "sandbox.ensure_mounts_exist") {
    if (!parse_bool(value, sandbox.ensure_mounts_exist)) {
      return invalid();
    }
  } else if (key == "risk_assessor.enabled") {
    if (!parse_bool(value, assessor.enabled)) {
      return invalid();
    }
  } else if (key == "risk_assessor.provider") {
    assessor.provider = value;
  } else if (key == "risk_assessor.model") {
    assessor.model = value;
  } else if (key == "risk_assessor.temperature") {
    if (!parse_double(value, assessor.temperature)) {
      return invalid();
    }
  } else if (key == "observability.backend") {
    config.observability.backend = value;
  } else {
    return common::Status::error("unknown key: " + key);
  }
  return common::Status::success();
}

} // namespace shellwarden::config
