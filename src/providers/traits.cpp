#include "shellwarden/providers/traits.hpp"

#include "shellwarden/common/fs.hpp"
#include "shellwarden/common/json_util.hpp"

#include <curl/curl.h>

#include <sstream>

namespace shellwarden::providers {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    (*headers)[key] = common::trim(header.substr(separator + 1));
  }
  return total;
}

HttpResponse post_request(const std::string &url, const HttpHeaders &headers,
                          const std::string &body, const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "ShellWarden/0.1");

  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return post_request(url, headers, body, timeout_ms);
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  const auto top = common::json_parse_flat(response);
  const auto choices_it = top.find("choices");
  if (choices_it == top.end()) {
    return common::Result<std::string>::failure("choices field missing");
  }
  const auto choices = common::json_split_top_level_objects(choices_it->second);
  if (choices.empty()) {
    return common::Result<std::string>::failure("choices array is empty");
  }

  const auto choice = common::json_parse_flat(choices.front());
  const auto message_it = choice.find("message");
  if (message_it == choice.end()) {
    return common::Result<std::string>::failure("choices[0].message missing");
  }
  const auto message = common::json_parse_flat(message_it->second);
  const auto content_it = message.find("content");
  if (content_it == message.end() || content_it->second == "null") {
    return common::Result<std::string>::failure("choices[0].message.content missing");
  }
  return common::Result<std::string>::success(content_it->second);
}

} // namespace shellwarden::providers
