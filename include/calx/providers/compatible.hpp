#pragma once

#include "calx/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace calx::providers {

class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     bool require_api_key = true,
                     std::unordered_map<std::string, std::string> extra_headers = {});

  [[nodiscard]] GenerateResult generate(const std::string &prompt,
                                        const GenerationConfig &config) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] const std::string &base_url() const { return base_url_; }
  [[nodiscard]] std::string build_body(const std::string &prompt,
                                       const GenerationConfig &config) const;

private:
  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  bool require_api_key_ = true;
  std::unordered_map<std::string, std::string> extra_headers_;
};

} // namespace calx::providers
