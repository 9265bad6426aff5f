#include "calx/providers/compatible.hpp"

#include "calx/common/json_util.hpp"

#include <sstream>

namespace calx::providers {

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       const bool require_api_key,
                                       std::unordered_map<std::string, std::string> extra_headers)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), require_api_key_(require_api_key),
      extra_headers_(std::move(extra_headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleProvider::build_body(const std::string &prompt,
                                           const GenerationConfig &config) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":" << common::json_quote(config.model) << ",";
  body << "\"messages\":[{\"role\":\"user\",\"content\":" << common::json_quote(prompt) << "}],";
  body << "\"max_tokens\":" << config.max_tokens << ",";
  body << "\"temperature\":" << config.temperature << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

GenerateResult CompatibleProvider::generate(const std::string &prompt,
                                            const GenerationConfig &config) {
  if (require_api_key_ && api_key_.empty()) {
    return GenerateResult::failure(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"});
  }

  std::unordered_map<std::string, std::string> headers = {{"Content-Type", "application/json"}};
  if (!api_key_.empty()) {
    headers["Authorization"] = "Bearer " + api_key_;
  }
  for (const auto &[key, value] : extra_headers_) {
    headers[key] = value;
  }

  const auto response = http_client_->post_json(base_url_ + "/chat/completions", headers,
                                                build_body(prompt, config), config.timeout_ms);
  if (auto error = classify_response(response); error.has_value()) {
    return GenerateResult::failure(std::move(*error));
  }

  auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return GenerateResult::failure(
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()});
  }
  return GenerateResult::success(std::move(parsed.value()));
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace calx::providers
