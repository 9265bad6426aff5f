#include "test_framework.hpp"

#include "calx/config/schema.hpp"
#include "calx/providers/anthropic.hpp"
#include "calx/providers/compatible.hpp"
#include "calx/providers/factory.hpp"
#include "calx/providers/traits.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <optional>

namespace {

calx::providers::GenerationConfig test_generation() {
  return calx::providers::GenerationConfig{
      .model = "model-a", .temperature = 0.5, .max_tokens = 625, .timeout_ms = 1234};
}

} // namespace

void register_provider_tests(std::vector<calx::tests::TestCase> &tests) {
  using calx::tests::require;
  using calx::testing::EnvGuard;
  using calx::testing::FakeHttpClient;
  namespace p = calx::providers;

  tests.push_back({"compatible_success_parse", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next_post = {.status = 200,
                                        .body = R"({"choices":[{"message":{"content":"hello"}}]})"};
                     p::CompatibleProvider provider("test", "https://example.com/v1/", "key", http);
                     auto result = provider.generate("hi", test_generation());
                     require(result.ok(), result.error().to_string());
                     require(result.value() == "hello", "content parse mismatch");
                     require(http->last_url == "https://example.com/v1/chat/completions",
                             "url: " + http->last_url);
                     require(http->last_headers["Authorization"] == "Bearer key", "bearer header");
                     require(http->last_timeout_ms == 1234, "timeout should be forwarded");
                   }});

  tests.push_back({"compatible_request_body_carries_limits", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next_post = {.status = 200,
                                        .body = R"({"choices":[{"message":{"content":"ok"}}]})"};
                     p::CompatibleProvider provider("test", "https://example.com/v1", "key", http);
                     (void)provider.generate("say \"hi\"", test_generation());
                     require(http->last_body.find(R"("model":"model-a")") != std::string::npos,
                             "model missing: " + http->last_body);
                     require(http->last_body.find(R"("max_tokens":625)") != std::string::npos,
                             "max_tokens missing");
                     require(http->last_body.find(R"("content":"say \"hi\"")") != std::string::npos,
                             "prompt should be escaped");
                     require(http->last_body.find(R"("stream":false)") != std::string::npos,
                             "stream flag missing");
                   }});

  tests.push_back({"compatible_missing_key_is_auth_error", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     p::CompatibleProvider provider("test", "https://example.com/v1", "", http);
                     auto result = provider.generate("hi", test_generation());
                     require(!result.ok(), "missing key should fail");
                     require(result.error().code == p::ProviderErrorCode::AuthError, "auth error");
                     require(http->post_count == 0, "no request without a key");
                   }});

  tests.push_back({"compatible_keyless_endpoint_allowed", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next_post = {.status = 200,
                                        .body = R"({"choices":[{"message":{"content":"local"}}]})"};
                     p::CompatibleProvider provider("custom", "http://localhost:8000/v1", "", http,
                                                    false);
                     auto result = provider.generate("hi", test_generation());
                     require(result.ok(), result.error().to_string());
                     require(http->last_headers.count("Authorization") == 0,
                             "no Authorization header without a key");
                   }});

  tests.push_back({"compatible_invalid_body_is_invalid_response", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next_post = {.status = 200, .body = R"({"unexpected":true})"};
                     p::CompatibleProvider provider("test", "https://example.com/v1", "key", http);
                     auto result = provider.generate("hi", test_generation());
                     require(!result.ok(), "malformed body should fail");
                     require(result.error().code == p::ProviderErrorCode::InvalidResponse,
                             "invalid response expected");
                   }});

  tests.push_back({"classify_response_status_mapping", [] {
                     p::HttpResponse timeout;
                     timeout.timeout = true;
                     timeout.network_error = true;
                     require(p::classify_response(timeout)->code == p::ProviderErrorCode::Timeout,
                             "timeout");

                     p::HttpResponse network;
                     network.network_error = true;
                     network.network_error_message = "refused";
                     require(p::classify_response(network)->code ==
                                 p::ProviderErrorCode::NetworkError,
                             "network");

                     require(p::classify_response({.status = 401})->code ==
                                 p::ProviderErrorCode::AuthError,
                             "401");
                     require(p::classify_response({.status = 404})->code ==
                                 p::ProviderErrorCode::ModelNotFound,
                             "404");
                     require(p::classify_response({.status = 500})->code ==
                                 p::ProviderErrorCode::ApiError,
                             "500");
                     require(!p::classify_response({.status = 200}).has_value(), "200 is fine");
                   }});

  tests.push_back({"classify_response_rate_limit_retry_after", [] {
                     p::HttpResponse limited{.status = 429, .body = "slow down"};
                     limited.headers["retry-after"] = "17";
                     const auto error = p::classify_response(limited);
                     require(error.has_value(), "error expected");
                     require(error->code == p::ProviderErrorCode::RateLimitError, "rate limit");
                     require(error->retry_after.has_value() && *error->retry_after == 17,
                             "retry-after should be parsed");
                     require(error->to_string().find("rate_limit") != std::string::npos,
                             "to_string should name the code");
                   }});

  tests.push_back({"anthropic_request_and_parse", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next_post = {
                         .status = 200,
                         .body = R"({"content":[{"type":"text","text":"bonjour"}],"role":"assistant"})"};
                     p::AnthropicProvider provider("anthropic-key", http);
                     auto result = provider.generate("hi", test_generation());
                     require(result.ok(), result.error().to_string());
                     require(result.value() == "bonjour", "text parse mismatch");
                     require(http->last_url == "https://api.anthropic.com/v1/messages",
                             "url: " + http->last_url);
                     require(http->last_headers["x-api-key"] == "anthropic-key", "x-api-key");
                     require(http->last_headers["anthropic-version"] == "2023-06-01", "version");
                     require(http->last_headers.size() == 3, "only content type, version and key");
                     require(!http->last_headers.contains("Authorization"), "no bearer header");
                   }});

  tests.push_back({"parse_openai_content_handles_escapes", [] {
                     auto parsed = p::parse_openai_content(
                         R"({"choices":[{"message":{"role":"assistant","content":"line\nnext é"}}]})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value() == "line\nnext é", "unescape mismatch");
                   }});

  tests.push_back({"factory_builds_known_providers", [] {
                     const EnvGuard base_url("OPENAI_BASE_URL", std::nullopt);
                     const EnvGuard global_base_url("CALX_OPENAI_BASE_URL", std::nullopt);
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next_post = {.status = 200,
                                        .body = R"({"choices":[{"message":{"content":"x"}}]})"};

                     auto provider = p::create_provider("openai", std::string("k"), http);
                     require(provider.ok(), provider.error());
                     require(provider.value()->name() == "openai", "name mismatch");
                     (void)provider.value()->generate("hi", test_generation());
                     require(http->last_url == "https://api.openai.com/v1/chat/completions",
                             "url: " + http->last_url);

                     for (const auto *name : {"anthropic", "gemini", "deepseek", "perplexity",
                                              "groq", "openrouter"}) {
                       require(p::create_provider(name, std::string("k"), http).ok(),
                               std::string("provider should build: ") + name);
                     }
                   }});

  tests.push_back({"factory_base_url_env_override", [] {
                     const EnvGuard base_url("GROQ_BASE_URL", std::string("http://proxy.local/v1"));
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next_post = {.status = 200,
                                        .body = R"({"choices":[{"message":{"content":"x"}}]})"};
                     auto provider = p::create_provider("groq", std::string("k"), http);
                     require(provider.ok(), provider.error());
                     (void)provider.value()->generate("hi", test_generation());
                     require(http->last_url == "http://proxy.local/v1/chat/completions",
                             "url: " + http->last_url);
                   }});

  tests.push_back({"factory_reads_provider_env_key", [] {
                     const EnvGuard key("DEEPSEEK_API_KEY", std::string("env-key"));
                     const EnvGuard base_url("DEEPSEEK_BASE_URL", std::nullopt);
                     const EnvGuard global_base_url("CALX_DEEPSEEK_BASE_URL", std::nullopt);
                     auto http = std::make_shared<FakeHttpClient>();
                     http->next_post = {.status = 200,
                                        .body = R"({"choices":[{"message":{"content":"x"}}]})"};
                     auto provider = p::create_provider("deepseek", std::nullopt, http);
                     require(provider.ok(), provider.error());
                     (void)provider.value()->generate("hi", test_generation());
                     require(http->last_headers["Authorization"] == "Bearer env-key",
                             "env key should be used");
                   }});

  tests.push_back({"factory_custom_and_unknown", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     auto custom = p::create_provider("custom:http://localhost:11434/v1",
                                                      std::nullopt, http);
                     require(custom.ok(), custom.error());
                     require(custom.value()->name() == "custom", "custom name");

                     require(!p::create_provider("custom:ftp://nope", std::nullopt, http).ok(),
                             "custom needs http(s)");
                     require(!p::create_provider("nonexistent", std::nullopt, http).ok(),
                             "unknown provider should fail");
                     require(!p::create_provider("openai", std::nullopt, nullptr).ok(),
                             "null http client should fail");
                   }});

  tests.push_back({"factory_default_models_and_generation_config", [] {
                     require(p::default_model_for("perplexity") ==
                                 "llama-3.1-sonar-small-128k-online",
                             "perplexity default");
                     require(p::default_model_for("groq") == "llama-3.1-70b-versatile",
                             "groq default");
                     require(p::default_model_for("gemini") == "gemini-1.5-flash", "gemini alias");

                     calx::config::ProviderConfig config;
                     config.name = "openrouter";
                     config.model = " ";
                     config.max_output_chars = 1000;
                     config.timeout_ms = 5000;
                     const auto generation = p::generation_config(config);
                     require(generation.model == "openai/gpt-4o-mini", "openrouter default model");
                     require(generation.max_tokens == 250, "max tokens from char budget");
                     require(generation.timeout_ms == 5000, "timeout");
                     require(p::max_tokens_for_chars(3) == 1, "token budget floor");
                   }});
}
