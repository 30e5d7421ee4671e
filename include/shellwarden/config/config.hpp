#pragma once

#include "shellwarden/common/result.hpp"
#include "shellwarden/common/toml.hpp"
#include "shellwarden/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shellwarden::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] Config config_from_toml(const common::TomlDocument &doc);
[[nodiscard]] std::string config_to_toml(const Config &config);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Dotted-key access used by `shellwarden config get/set`.
[[nodiscard]] common::Result<std::string> get_config_value(const Config &config,
                                                           const std::string &key);
[[nodiscard]] common::Status set_config_value(Config &config, const std::string &key,
                                              const std::string &value);

} // namespace shellwarden::config
