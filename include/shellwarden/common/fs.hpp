#pragma once

#include "shellwarden/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace shellwarden::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_whitespace(const std::string &value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace shellwarden::common
