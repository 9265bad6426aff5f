#pragma once

#include "calx/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace calx::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

struct GenerationConfig {
  std::string model;
  double temperature = 0.7;
  std::uint32_t max_tokens = 625;
  std::uint64_t timeout_ms = 30'000;
};

[[nodiscard]] constexpr std::uint32_t max_tokens_for_chars(std::uint32_t chars) {
  return chars / 4 == 0 ? 1 : chars / 4;
}

using GenerateResult = common::Result<std::string, ProviderError>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

/// Single-turn text generation. Implementations never retry; a failure is
/// reported once and the caller decides.
class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual GenerateResult generate(const std::string &prompt,
                                                const GenerationConfig &config) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

[[nodiscard]] std::optional<ProviderError> classify_response(const HttpResponse &response);

[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);
[[nodiscard]] common::Result<std::string> parse_anthropic_content(const std::string &response);

} // namespace calx::providers
