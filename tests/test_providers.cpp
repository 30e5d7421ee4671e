#include "test_framework.hpp"

#include "shellwarden/providers/compatible.hpp"
#include "shellwarden/providers/factory.hpp"
#include "shellwarden/providers/reliable.hpp"
#include "shellwarden/security/risk_assessor.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using shellwarden::common::Result;
using shellwarden::testing::EnvGuard;
using shellwarden::testing::FakeHttpClient;
using shellwarden::testing::MockProvider;
using shellwarden::tests::require;
using shellwarden::tests::require_contains;
using shellwarden::tests::TestCase;

namespace providers = shellwarden::providers;
namespace security = shellwarden::security;

std::string completion(const std::string &content) {
  return R"({"id":"x","choices":[{"index":0,"message":{"role":"assistant","content":")" +
         content + R"("}}]})";
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

std::shared_ptr<providers::CompatibleProvider>
as_compatible(const std::shared_ptr<providers::Provider> &provider) {
  return std::dynamic_pointer_cast<providers::CompatibleProvider>(provider);
}

} // namespace

void register_provider_tests(std::vector<TestCase> &tests) {
  tests.push_back({"provider_parse_openai_content", [] {
                     const auto parsed = providers::parse_openai_content(completion("hi\\nthere"));
                     require(parsed.ok() && parsed.value() == "hi\nthere", "content extracted");
                     require(!providers::parse_openai_content("{}").ok(), "missing choices");
                     require(!providers::parse_openai_content(R"({"choices":[]})").ok(),
                             "empty choices");
                     require(!providers::parse_openai_content(
                                  R"({"choices":[{"message":{"content":null}}]})")
                                  .ok(),
                             "null content");
                   }});

  tests.push_back({"provider_compatible_sends_auth_and_body", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next.status = 200;
                     http->next.body = completion("ok");
                     providers::CompatibleProvider provider("openai", "https://api.example.com/v1/",
                                                            "sk-123", http);
                     const auto reply =
                         provider.chat_with_system(std::string("be careful"), "ls?", "m1", 0.0);
                     require(reply.ok() && reply.value() == "ok", "reply content");
                     require(http->last_url == "https://api.example.com/v1/chat/completions",
                             "trailing slash trimmed: " + http->last_url);
                     require(http->last_headers.at("Authorization") == "Bearer sk-123",
                             "bearer token");
                     require_contains(http->last_body, R"("role":"system","content":"be careful")", "system prompt sent");
                     require_contains(http->last_body, R"("model":"m1")", "model sent");
                     require_contains(http->last_body, R"("stream":false)", "non-streaming");
                   }});

  tests.push_back({"provider_compatible_requires_key", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     providers::CompatibleProvider provider("openai", "https://x/v1", "", http);
                     const auto reply = provider.chat("hi", "m", 0.0);
                     require(!reply.ok() && contains(reply.error(), "[auth]"), "missing key");
                     require(http->last_url.empty(), "no request sent");

                     providers::CompatibleProvider local("ollama", "http://localhost:11434/v1", "",
                                                         http, false);
                     http->next.status = 200;
                     http->next.body = completion("local");
                     const auto local_reply = local.chat("hi", "m", 0.0);
                     require(local_reply.ok(), "keyless provider works");
                     require(!http->last_headers.contains("Authorization"), "no auth header");
                   }});

  tests.push_back({"provider_compatible_maps_http_errors", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     providers::CompatibleProvider provider("openai", "https://x/v1", "k", http);

                     http->next = providers::HttpResponse{.status = 401, .body = "bad key"};
                     auto reply = provider.chat("hi", "m", 0.0);
                     require(!reply.ok() && contains(reply.error(), "[auth] status=401 bad key"),
                             "401: " + reply.error());

                     http->next = providers::HttpResponse{
                         .status = 429, .body = "slow down", .headers = {{"retry-after", "7"}}};
                     reply = provider.chat("hi", "m", 0.0);
                     require(!reply.ok() && contains(reply.error(), "retry_after=7"),
                             "429: " + reply.error());

                     http->next = providers::HttpResponse{.status = 200, .body = "not json"};
                     reply = provider.chat("hi", "m", 0.0);
                     require(!reply.ok() && contains(reply.error(), "[invalid_response]"),
                             "garbage body: " + reply.error());

                     http->next = providers::HttpResponse{.timeout = true, .network_error = true};
                     reply = provider.chat("hi", "m", 0.0);
                     require(!reply.ok() && contains(reply.error(), "[timeout]"), "timeout");
                   }});

  tests.push_back({"provider_compatible_reports_network_errors", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     providers::CompatibleProvider provider("openai", "https://x/v1", "k", http);
                     http->next = providers::HttpResponse{.network_error = true,
                                                          .network_error_message = "refused"};
                     const auto reply = provider.chat("hi", "m", 0.0);
                     require(!reply.ok() && contains(reply.error(), "[network]") &&
                                 contains(reply.error(), "refused"),
                             "network failure surfaces: " + reply.error());
                   }});

  tests.push_back({"provider_reliable_retries_then_succeeds", [] {
                     auto primary = std::make_shared<MockProvider>();
                     primary->queue_responses({Result<std::string>::failure("flaky"),
                                               Result<std::string>::success("second try")});
                     providers::ReliableProvider reliable(primary, {}, 2, 0);
                     const auto reply = reliable.chat("hi", "m", 0.0);
                     require(reply.ok() && reply.value() == "second try", "retry succeeded");
                     require(primary->calls() == 2, "two attempts");
                     require(reliable.name() == "reliable(mock)", "name wraps primary");
                   }});

  tests.push_back({"provider_reliable_falls_back", [] {
                     auto primary = std::make_shared<MockProvider>();
                     primary->set_error("down");
                     auto fallback = std::make_shared<MockProvider>();
                     fallback->set_response("from fallback");
                     providers::ReliableProvider reliable(primary, {fallback}, 1, 0);
                     const auto reply = reliable.chat_with_system(std::string("sys"), "hi", "m", 0.0);
                     require(reply.ok() && reply.value() == "from fallback", "fallback answered");
                     require(primary->calls() == 2, "primary tried max_retries + 1 times");
                     require(fallback->last_system_prompt() == std::optional<std::string>("sys"),
                             "system prompt forwarded");
                   }});

  tests.push_back({"provider_reliable_reports_last_error", [] {
                     auto primary = std::make_shared<MockProvider>();
                     primary->set_error("primary down");
                     auto fallback = std::make_shared<MockProvider>();
                     fallback->set_error("fallback down");
                     providers::ReliableProvider reliable(primary, {fallback}, 0, 0);
                     const auto reply = reliable.chat("hi", "m", 0.0);
                     require(!reply.ok() && reply.error() == "fallback down", "last error wins");

                     providers::ReliableProvider empty(nullptr, {}, 0, 0);
                     require(!empty.chat("hi", "m", 0.0).ok(), "no primary");
                   }});

  tests.push_back({"provider_factory_routes", [] {
                     EnvGuard openai_url("OPENAI_BASE_URL", std::nullopt);
                     EnvGuard global_url("SHELLWARDEN_OPENAI_BASE_URL", std::nullopt);
                     EnvGuard ollama_url("OLLAMA_BASE_URL", std::nullopt);
                     EnvGuard global_ollama_url("SHELLWARDEN_OLLAMA_BASE_URL", std::nullopt);
                     auto http = std::make_shared<FakeHttpClient>();

                     const auto openai = providers::create_provider(" OpenAI ", "k", http);
                     require(openai.ok(), "openai route");
                     require(openai.value()->name() == "openai", "normalized name");
                     require(as_compatible(openai.value())->base_url() ==
                                 "https://api.openai.com/v1",
                             "openai base url");

                     const auto ollama = providers::create_provider("ollama", std::nullopt, http);
                     require(ollama.ok() && as_compatible(ollama.value())->base_url() ==
                                                "http://localhost:11434/v1",
                             "ollama base url");

                     const auto custom =
                         providers::create_provider("custom:https://llm.internal/v1", std::nullopt,
                                                    http);
                     require(custom.ok() && as_compatible(custom.value())->base_url() ==
                                                "https://llm.internal/v1",
                             "custom url");
                     require(!providers::create_provider("custom:ftp://x", std::nullopt, http).ok(),
                             "custom requires http(s)");

                     const auto unknown = providers::create_provider("acme", std::nullopt, http);
                     require(!unknown.ok() && unknown.error() == "Unknown provider: acme",
                             "unknown provider");
                   }});

  tests.push_back({"provider_factory_base_url_and_key_from_env", [] {
                     EnvGuard local_url("GROQ_BASE_URL", std::string("http://proxy:8080/v1"));
                     EnvGuard groq_key("GROQ_API_KEY", std::nullopt);
                     EnvGuard global_key("SHELLWARDEN_API_KEY", std::string("global-key"));
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next = providers::HttpResponse{.status = 200, .body = completion("y")};

                     const auto groq = providers::create_provider("groq", std::nullopt, http);
                     require(groq.ok(), "groq route");
                     require(as_compatible(groq.value())->base_url() == "http://proxy:8080/v1",
                             "base url overridden by env");
                     require(groq.value()->chat("hi", "m", 0.0).ok(), "chat works");
                     require(http->last_headers.at("Authorization") == "Bearer global-key",
                             "falls back to SHELLWARDEN_API_KEY");
                   }});

  tests.push_back({"provider_factory_reliable_skips_bad_fallbacks", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     shellwarden::config::ReliabilityConfig reliability;
                     reliability.fallback_providers = {"openai", "acme", "ollama"};
                     const auto provider =
                         providers::create_reliable_provider("openai", "k", reliability, http);
                     require(provider.ok(), "reliable provider created");
                     require(provider.value()->name() == "reliable(openai)", "wraps primary");
                     require(!providers::create_reliable_provider("acme", "k", reliability, http)
                                  .ok(),
                             "unknown primary fails");
                   }});

  tests.push_back({"risk_assessment_parses_fenced_reply", [] {
                     const auto parsed = security::parse_risk_assessment(
                         "Sure.\n```json\n{\"is_safe\": true, \"reasoning\": \"read only\", "
                         "\"risk_level\": \"LOW\"}\n```");
                     require(parsed.ok(), "parses");
                     require(parsed.value().is_safe, "safe");
                     require(parsed.value().reasoning == "read only", "reasoning");
                     require(parsed.value().risk_level == security::RiskLevel::Low, "level");
                   }});

  tests.push_back({"risk_assessment_rejects_bad_replies", [] {
                     require(!security::parse_risk_assessment("I think it is fine").ok(),
                             "no JSON object");
                     const auto stringly =
                         security::parse_risk_assessment(R"({"is_safe":"yes"})");
                     require(!stringly.ok() &&
                                 stringly.error() == "assessor reply has no boolean is_safe",
                             "is_safe must be boolean");
                     const auto level = security::parse_risk_assessment(
                         R"({"is_safe":false,"risk_level":"catastrophic"})");
                     require(!level.ok() && level.error() == "Invalid risk level: catastrophic",
                             "unknown level");
                     const auto defaulted =
                         security::parse_risk_assessment(R"({"is_safe":false})");
                     require(defaulted.ok() &&
                                 defaulted.value().risk_level == security::RiskLevel::High,
                             "missing level defaults to high");
                   }});

  tests.push_back({"risk_assessor_prompts_the_provider", [] {
                     auto provider = std::make_shared<MockProvider>();
                     provider->set_response(
                         R"({"is_safe":false,"reasoning":"wipes the repo","risk_level":"high"})");
                     security::ProviderRiskAssessor assessor(provider, "m", 0.0);
                     const auto verdict = assessor.assess(security::RiskAssessmentRequest{
                         .command = "rm -rf .",
                         .tool_name = "shell",
                         .args_json = R"({"command":["rm","-rf","."]})"});
                     require(verdict.ok() && !verdict.value().is_safe, "unsafe verdict");
                     require(verdict.value().reasoning == "wipes the repo", "reasoning kept");
                     require_contains(provider->last_message(), "Tool: shell\n", "tool line");
                     require_contains(provider->last_message(), "Command: rm -rf .\n", "command line");
                     require(provider->last_system_prompt() ==
                                 std::optional<std::string>(
                                     security::ProviderRiskAssessor::system_prompt()),
                             "system prompt used");
                   }});

  tests.push_back({"risk_assessor_surfaces_provider_failures", [] {
                     auto provider = std::make_shared<MockProvider>();
                     provider->set_error("quota exceeded");
                     security::ProviderRiskAssessor assessor(provider, "m", 0.0);
                     const auto verdict =
                         assessor.assess(security::RiskAssessmentRequest{.command = "make"});
                     require(!verdict.ok() && verdict.error() == "quota exceeded",
                             "provider error returned");

                     security::ProviderRiskAssessor orphan(nullptr, "m", 0.0);
                     require(!orphan.assess(security::RiskAssessmentRequest{}).ok(),
                             "no provider");
                   }});

  tests.push_back({"risk_assessor_deny_all", [] {
                     security::DenyAllRiskAssessor deny;
                     const auto verdict =
                         deny.assess(security::RiskAssessmentRequest{.command = "make"});
                     require(verdict.ok() && !verdict.value().is_safe, "always unsafe");
                     require(verdict.value().risk_level == security::RiskLevel::High, "high");
                   }});

  tests.push_back({"risk_level_strings", [] {
                     require(security::risk_level_to_string(security::RiskLevel::Medium) ==
                                 "medium",
                             "to string");
                     require(security::risk_level_from_string(" High ").value() ==
                                 security::RiskLevel::High,
                             "from string is lenient");
                     require(security::fail_closed_assessment().reasoning ==
                                 security::kFailClosedReasoning,
                             "fail-closed reasoning");
                   }});
}
