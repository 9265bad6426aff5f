#pragma once

#include "calx/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace calx::providers {

class AnthropicProvider : public Provider {
public:
  explicit AnthropicProvider(std::string api_key,
                             std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());
  AnthropicProvider(std::string name, std::string api_key, std::string base_url,
                    std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] GenerateResult generate(const std::string &prompt,
                                        const GenerationConfig &config) override;
  [[nodiscard]] std::string name() const override;

private:
  [[nodiscard]] std::unordered_map<std::string, std::string> build_headers() const;
  [[nodiscard]] std::string messages_url() const;

  std::string name_ = "anthropic";
  std::string api_key_;
  std::string base_url_ = "https://api.anthropic.com";
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace calx::providers
