#include "calx/providers/factory.hpp"

#include "calx/common/fs.hpp"
#include "calx/providers/anthropic.hpp"
#include "calx/providers/compatible.hpp"

#include <cctype>
#include <cstdlib>
#include <unordered_map>
#include <vector>

namespace calx::providers {

namespace {

struct CompatibleRoute {
  CompatibleRoute() = default;
  CompatibleRoute(std::string base, std::string model,
                  std::unordered_map<std::string, std::string> headers = {})
      : base_url(std::move(base)), default_model(std::move(model)),
        extra_headers(std::move(headers)) {}

  std::string base_url;
  std::string default_model;
  std::unordered_map<std::string, std::string> extra_headers;
};

constexpr const char *kAnthropicBaseUrl = "https://api.anthropic.com";
constexpr const char *kAnthropicDefaultModel = "claude-3-5-haiku-latest";

const std::unordered_map<std::string, CompatibleRoute> &compatible_routes() {
  static const std::unordered_map<std::string, CompatibleRoute> routes = {
      {"openai", {"https://api.openai.com/v1", "gpt-4o-mini"}},
      {"google", {"https://generativelanguage.googleapis.com/v1beta/openai", "gemini-1.5-flash"}},
      {"deepseek", {"https://api.deepseek.com/v1", "deepseek-chat"}},
      {"perplexity", {"https://api.perplexity.ai", "llama-3.1-sonar-small-128k-online"}},
      {"groq", {"https://api.groq.com/openai/v1", "llama-3.1-70b-versatile"}},
      {"openrouter",
       {"https://openrouter.ai/api/v1",
        "openai/gpt-4o-mini",
        {{"HTTP-Referer", "https://github.com/calx"}, {"X-Title", "calx"}}}},
  };
  return routes;
}

std::optional<std::string> read_env(const char *name) {
  if (name == nullptr || *name == '\0') {
    return std::nullopt;
  }
  const char *value = std::getenv(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::optional<std::string> read_first_env(const std::vector<const char *> &names) {
  for (const auto *name : names) {
    if (auto value = read_env(name); value.has_value()) {
      return value;
    }
  }
  return std::nullopt;
}

std::string provider_env_prefix(const std::string &provider) {
  std::string prefix;
  prefix.reserve(provider.size());
  for (const char ch : provider) {
    if (std::isalnum(static_cast<unsigned char>(ch)) != 0) {
      prefix.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
      continue;
    }
    prefix.push_back('_');
  }
  return prefix;
}

// <PROVIDER>_BASE_URL, then CALX_<PROVIDER>_BASE_URL, then the built-in route.
std::string resolve_base_url(const std::string &provider, const std::string &default_base_url) {
  const std::string prefix = provider_env_prefix(provider);
  const std::string local_var = prefix + "_BASE_URL";
  const std::string global_var = "CALX_" + prefix + "_BASE_URL";
  if (const auto local = read_env(local_var.c_str()); local.has_value()) {
    return *local;
  }
  if (const auto global = read_env(global_var.c_str()); global.has_value()) {
    return *global;
  }
  return default_base_url;
}

std::string normalize_provider_id(const std::string &name) {
  std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "gemini") {
    return "google";
  }
  return normalized;
}

std::optional<std::string> resolve_env_api_key(const std::string &provider) {
  static const std::unordered_map<std::string, std::vector<const char *>> env_map = {
      {"openai", {"OPENAI_API_KEY"}},
      {"anthropic", {"ANTHROPIC_API_KEY"}},
      {"google", {"GEMINI_API_KEY", "GOOGLE_AI_API_KEY"}},
      {"deepseek", {"DEEPSEEK_API_KEY"}},
      {"perplexity", {"PERPLEXITY_API_KEY"}},
      {"groq", {"GROQ_API_KEY"}},
      {"openrouter", {"OPENROUTER_API_KEY"}},
  };

  const auto it = env_map.find(provider);
  if (it == env_map.end()) {
    return std::nullopt;
  }
  return read_first_env(it->second);
}

std::optional<std::string> resolve_api_key(const std::string &provider,
                                           const std::optional<std::string> &api_key) {
  if (api_key.has_value()) {
    const std::string trimmed = common::trim(*api_key);
    if (!trimmed.empty()) {
      return trimmed;
    }
  }
  return resolve_env_api_key(provider);
}

} // namespace

common::Result<std::shared_ptr<Provider>>
create_provider(const std::string &name, const std::optional<std::string> &api_key,
                std::shared_ptr<HttpClient> http_client) {
  using ProviderResult = common::Result<std::shared_ptr<Provider>>;
  if (http_client == nullptr) {
    return ProviderResult::failure("http client is required");
  }

  const std::string normalized = normalize_provider_id(name);
  const auto resolved_key = resolve_api_key(normalized, api_key);

  if (normalized == "anthropic") {
    return ProviderResult::success(std::make_shared<AnthropicProvider>(
        "anthropic", resolved_key.value_or(""), resolve_base_url(normalized, kAnthropicBaseUrl),
        std::move(http_client)));
  }

  const auto &routes = compatible_routes();
  if (const auto it = routes.find(normalized); it != routes.end()) {
    const auto &route = it->second;
    return ProviderResult::success(std::make_shared<CompatibleProvider>(
        normalized, resolve_base_url(normalized, route.base_url), resolved_key.value_or(""),
        std::move(http_client), true, route.extra_headers));
  }

  const std::string trimmed_name = common::trim(name);
  if (common::starts_with(common::to_lower(trimmed_name), "custom:")) {
    const std::string url = common::trim(trimmed_name.substr(7));
    if (url.empty() ||
        (!common::starts_with(url, "http://") && !common::starts_with(url, "https://"))) {
      return ProviderResult::failure("Custom provider requires URL format custom:https://...");
    }
    return ProviderResult::success(std::make_shared<CompatibleProvider>(
        "custom", url, resolved_key.value_or(""), std::move(http_client), false));
  }

  return ProviderResult::failure("Unknown provider: " + name);
}

std::string default_model_for(const std::string &name) {
  const std::string normalized = normalize_provider_id(name);
  if (normalized == "anthropic") {
    return kAnthropicDefaultModel;
  }
  const auto &routes = compatible_routes();
  if (const auto it = routes.find(normalized); it != routes.end()) {
    return it->second.default_model;
  }
  return "";
}

GenerationConfig generation_config(const config::ProviderConfig &config) {
  const std::string model = common::trim(config.model);
  return GenerationConfig{.model = model.empty() ? default_model_for(config.name) : model,
                          .temperature = config.temperature,
                          .max_tokens = max_tokens_for_chars(config.max_output_chars),
                          .timeout_ms = config.timeout_ms};
}

} // namespace calx::providers
