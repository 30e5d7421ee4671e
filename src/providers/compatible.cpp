#include "shellwarden/providers/compatible.hpp"

#include "shellwarden/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace shellwarden::providers {

namespace {

common::Result<std::string> provider_error_result(const ProviderError &error) {
  return common::Result<std::string>::failure(error.to_string());
}

std::optional<std::uint64_t> parse_retry_after(const std::string &value) {
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       const bool require_api_key, HttpHeaders extra_headers,
                                       const std::uint64_t request_timeout_ms)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), require_api_key_(require_api_key),
      extra_headers_(std::move(extra_headers)), request_timeout_ms_(request_timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleProvider::build_body(const std::optional<std::string> &system_prompt,
                                           const std::string &message, const std::string &model,
                                           const double temperature) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model) << "\",";
  body << "\"messages\":[";
  if (system_prompt.has_value()) {
    body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(*system_prompt)
         << "\"},";
  }
  body << "{\"role\":\"user\",\"content\":\"" << common::json_escape(message) << "\"}";
  body << "],";
  body << "\"temperature\":" << temperature << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Status CompatibleProvider::validate_response_status(const HttpResponse &response) const {
  if (response.timeout) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"}
            .to_string());
  }

  if (response.network_error) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message}
                                     .to_string());
  }

  if (response.status == 401 || response.status == 403) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::AuthError,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }

  if (response.status == 404) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ModelNotFound,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }

  if (response.status == 429) {
    ProviderError error{.code = ProviderErrorCode::RateLimitError,
                        .status = response.status,
                        .message = response.body};
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      error.retry_after = parse_retry_after(it->second);
    }
    return common::Status::error(error.to_string());
  }

  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ApiError,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }

  return common::Status::success();
}

common::Result<std::string> CompatibleProvider::handle_response(const HttpResponse &response) const {
  auto status = validate_response_status(response);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }

  auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return provider_error_result(
        {.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()});
  }
  return parsed;
}

common::Result<std::string>
CompatibleProvider::chat_with_system(const std::optional<std::string> &system_prompt,
                                     const std::string &message, const std::string &model,
                                     const double temperature) {
  if (require_api_key_ && api_key_.empty()) {
    return provider_error_result(
        {.code = ProviderErrorCode::AuthError, .message = "missing API key"});
  }

  HttpHeaders headers = {{"Content-Type", "application/json"}};
  if (!api_key_.empty()) {
    headers["Authorization"] = "Bearer " + api_key_;
  }
  for (const auto &[key, value] : extra_headers_) {
    headers[key] = value;
  }

  const auto response =
      http_client_->post_json(base_url_ + "/chat/completions", headers,
                              build_body(system_prompt, message, model, temperature),
                              request_timeout_ms_);
  return handle_response(response);
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace shellwarden::providers
