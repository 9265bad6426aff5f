#include "calx/providers/anthropic.hpp"

#include "calx/common/json_util.hpp"

#include <sstream>

namespace calx::providers {

namespace {

constexpr const char *kAnthropicVersion = "2023-06-01";

std::string build_anthropic_body(const std::string &prompt, const GenerationConfig &config) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":" << common::json_quote(config.model) << ",";
  body << "\"max_tokens\":" << config.max_tokens << ",";
  body << "\"messages\":[{\"role\":\"user\",\"content\":" << common::json_quote(prompt) << "}],";
  body << "\"temperature\":" << config.temperature;
  body << "}";
  return body.str();
}

} // namespace

AnthropicProvider::AnthropicProvider(std::string api_key, std::shared_ptr<HttpClient> http_client)
    : AnthropicProvider("anthropic", std::move(api_key), "https://api.anthropic.com",
                        std::move(http_client)) {}

AnthropicProvider::AnthropicProvider(std::string name, std::string api_key, std::string base_url,
                                     std::shared_ptr<HttpClient> http_client)
    : name_(std::move(name)), api_key_(std::move(api_key)), base_url_(std::move(base_url)),
      http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

GenerateResult AnthropicProvider::generate(const std::string &prompt,
                                           const GenerationConfig &config) {
  if (api_key_.empty()) {
    return GenerateResult::failure(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"});
  }

  const auto response = http_client_->post_json(messages_url(), build_headers(),
                                                build_anthropic_body(prompt, config),
                                                config.timeout_ms);
  if (auto error = classify_response(response); error.has_value()) {
    return GenerateResult::failure(std::move(*error));
  }

  auto parsed = parse_anthropic_content(response.body);
  if (!parsed.ok()) {
    return GenerateResult::failure(
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()});
  }
  return GenerateResult::success(std::move(parsed.value()));
}

std::string AnthropicProvider::name() const { return name_; }

std::unordered_map<std::string, std::string> AnthropicProvider::build_headers() const {
  return {
      {"Content-Type", "application/json"},
      {"anthropic-version", kAnthropicVersion},
      {"x-api-key", api_key_},
  };
}

std::string AnthropicProvider::messages_url() const { return base_url_ + "/v1/messages"; }

} // namespace calx::providers
