#include "shellwarden/providers/factory.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/observability/global.hpp"
#include "shellwarden/providers/compatible.hpp"
#include "shellwarden/providers/reliable.hpp"

#include <cctype>
#include <cstdlib>
#include <unordered_map>
#include <vector>

namespace shellwarden::providers {

namespace {

struct CompatibleRoute {
  std::string base_url;
  std::vector<const char *> key_env;
  bool require_api_key = true;
  HttpHeaders extra_headers;
};

const std::unordered_map<std::string, CompatibleRoute> &compatible_routes() {
  static const std::unordered_map<std::string, CompatibleRoute> routes = {
      {"openai", {.base_url = "https://api.openai.com/v1", .key_env = {"OPENAI_API_KEY"}}},
      {"openrouter",
       {.base_url = "https://openrouter.ai/api/v1",
        .key_env = {"OPENROUTER_API_KEY"},
        .extra_headers = {{"HTTP-Referer", "https://github.com/shellwarden/shellwarden"},
                          {"X-Title", "ShellWarden"}}}},
      {"ollama",
       {.base_url = "http://localhost:11434/v1",
        .key_env = {"OLLAMA_API_KEY"},
        .require_api_key = false}},
      {"nvidia", {.base_url = "https://integrate.api.nvidia.com/v1", .key_env = {"NVIDIA_API_KEY"}}},
      {"groq", {.base_url = "https://api.groq.com/openai/v1", .key_env = {"GROQ_API_KEY"}}},
      {"together", {.base_url = "https://api.together.xyz/v1", .key_env = {"TOGETHER_API_KEY"}}},
  };
  return routes;
}

std::optional<std::string> read_env(const char *name) {
  if (name == nullptr || *name == '\0') {
    return std::nullopt;
  }
  const char *value = std::getenv(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string provider_env_prefix(const std::string &provider) {
  std::string prefix;
  prefix.reserve(provider.size());
  for (const char ch : provider) {
    if (std::isalnum(static_cast<unsigned char>(ch)) != 0) {
      prefix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    } else {
      prefix.push_back('_');
    }
  }
  return prefix;
}

// <PROVIDER>_BASE_URL, then SHELLWARDEN_<PROVIDER>_BASE_URL.
std::string resolve_base_url(const std::string &provider, const std::string &default_base_url) {
  const std::string prefix = provider_env_prefix(provider);
  const std::string local_var = prefix + "_BASE_URL";
  const std::string global_var = "SHELLWARDEN_" + prefix + "_BASE_URL";
  if (const auto local = read_env(local_var.c_str()); local.has_value()) {
    return *local;
  }
  if (const auto global = read_env(global_var.c_str()); global.has_value()) {
    return *global;
  }
  return default_base_url;
}

std::optional<std::string> resolve_api_key(const std::vector<const char *> &key_env,
                                           const std::optional<std::string> &api_key) {
  if (api_key.has_value()) {
    const std::string trimmed = common::trim(*api_key);
    if (!trimmed.empty()) {
      return trimmed;
    }
  }
  for (const auto *name : key_env) {
    if (auto value = read_env(name); value.has_value()) {
      return value;
    }
  }
  return read_env("SHELLWARDEN_API_KEY");
}

} // namespace

std::string normalize_provider_id(const std::string &name) {
  return common::to_lower(common::trim(name));
}

common::Result<std::shared_ptr<Provider>>
create_provider(const std::string &name, const std::optional<std::string> &api_key,
                std::shared_ptr<HttpClient> http_client) {
  const std::string normalized = normalize_provider_id(name);

  const auto &routes = compatible_routes();
  if (const auto it = routes.find(normalized); it != routes.end()) {
    const auto &route = it->second;
    const auto key = resolve_api_key(route.key_env, api_key);
    return common::Result<std::shared_ptr<Provider>>::success(std::make_shared<CompatibleProvider>(
        normalized, resolve_base_url(normalized, route.base_url), key.value_or(""),
        std::move(http_client), route.require_api_key, route.extra_headers));
  }

  if (common::starts_with(normalized, "custom:")) {
    const std::string url = common::trim(common::trim(name).substr(7));
    if (url.empty() ||
        (!common::starts_with(url, "http://") && !common::starts_with(url, "https://"))) {
      return common::Result<std::shared_ptr<Provider>>::failure(
          "Custom provider requires URL format custom:https://...");
    }
    const auto key = resolve_api_key({}, api_key);
    return common::Result<std::shared_ptr<Provider>>::success(std::make_shared<CompatibleProvider>(
        "custom", url, key.value_or(""), std::move(http_client), false));
  }

  return common::Result<std::shared_ptr<Provider>>::failure("Unknown provider: " + name);
}

common::Result<std::shared_ptr<Provider>> create_reliable_provider(
    const std::string &primary_name, const std::optional<std::string> &api_key,
    const config::ReliabilityConfig &reliability, std::shared_ptr<HttpClient> http_client) {
  const auto primary = create_provider(primary_name, api_key, http_client);
  if (!primary.ok()) {
    return common::Result<std::shared_ptr<Provider>>::failure(primary.error());
  }

  std::vector<std::shared_ptr<Provider>> fallbacks;
  for (const auto &fallback_name : reliability.fallback_providers) {
    if (normalize_provider_id(fallback_name) == normalize_provider_id(primary_name)) {
      continue;
    }
    auto fallback = create_provider(fallback_name, std::nullopt, http_client);
    if (!fallback.ok()) {
      observability::log_warn("Ignoring fallback provider " + fallback_name + ": " +
                              fallback.error());
      continue;
    }
    fallbacks.push_back(fallback.value());
  }

  return common::Result<std::shared_ptr<Provider>>::success(std::make_shared<ReliableProvider>(
      primary.value(), std::move(fallbacks), reliability.provider_retries,
      reliability.provider_backoff_ms));
}

} // namespace shellwarden::providers
