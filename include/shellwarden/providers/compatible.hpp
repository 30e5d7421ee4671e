#pragma once

#include "shellwarden/providers/traits.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace shellwarden::providers {

/// Any endpoint speaking the OpenAI /chat/completions protocol.
class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     bool require_api_key = true, HttpHeaders extra_headers = {},
                     std::uint64_t request_timeout_ms = 30'000);

  [[nodiscard]] common::Result<std::string>
  chat_with_system(const std::optional<std::string> &system_prompt, const std::string &message,
                   const std::string &model, double temperature) override;

  [[nodiscard]] std::string name() const override;

  [[nodiscard]] const std::string &base_url() const { return base_url_; }

private:
  [[nodiscard]] std::string build_body(const std::optional<std::string> &system_prompt,
                                       const std::string &message, const std::string &model,
                                       double temperature) const;

  [[nodiscard]] common::Result<std::string> handle_response(const HttpResponse &response) const;
  [[nodiscard]] common::Status validate_response_status(const HttpResponse &response) const;

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  bool require_api_key_ = true;
  HttpHeaders extra_headers_;
  std::uint64_t request_timeout_ms_;
};

} // namespace shellwarden::providers
