#pragma once

#include "shellwarden/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace shellwarden::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
};

/// libcurl-backed client. One easy handle per request.
class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
};

/// Chat-completion model used by the risk assessor.
class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual common::Result<std::string>
  chat(const std::string &message, const std::string &model, double temperature) {
    return chat_with_system(std::nullopt, message, model, temperature);
  }

  [[nodiscard]] virtual common::Result<std::string>
  chat_with_system(const std::optional<std::string> &system_prompt, const std::string &message,
                   const std::string &model, double temperature) = 0;

  [[nodiscard]] virtual std::string name() const = 0;
};

/// choices[0].message.content from an OpenAI-style chat completion body.
[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);

} // namespace shellwarden::providers
