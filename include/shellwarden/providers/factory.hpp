#pragma once

#include "shellwarden/common/result.hpp"
#include "shellwarden/config/schema.hpp"
#include "shellwarden/providers/traits.hpp"

#include <memory>
#include <optional>
#include <string>

namespace shellwarden::providers {

[[nodiscard]] std::string normalize_provider_id(const std::string &name);

/// openai, openrouter, ollama, nvidia, groq, together or custom:<url>. The API key is
/// taken from api_key, then the provider's own env var, then SHELLWARDEN_API_KEY.
[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const std::string &name, const std::optional<std::string> &api_key,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_reliable_provider(const std::string &primary_name, const std::optional<std::string> &api_key,
                         const config::ReliabilityConfig &reliability,
                         std::shared_ptr<HttpClient> http_client =
                             std::make_shared<CurlHttpClient>());

} // namespace shellwarden::providers
