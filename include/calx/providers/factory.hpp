#pragma once

#include "calx/common/result.hpp"
#include "calx/config/schema.hpp"
#include "calx/providers/traits.hpp"

#include <memory>
#include <optional>
#include <string>

namespace calx::providers {

/// Builds the adapter for `name` (openai, anthropic, gemini/google, deepseek,
/// perplexity, groq, openrouter, or custom:https://...). A missing api_key is
/// looked up in the provider's environment variables.
[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const std::string &name, const std::optional<std::string> &api_key,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

[[nodiscard]] std::string default_model_for(const std::string &name);

[[nodiscard]] GenerationConfig generation_config(const config::ProviderConfig &config);

} // namespace calx::providers
