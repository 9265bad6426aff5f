#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace calx::config {

// Upper bound for continuation durations (ten years).
constexpr std::uint64_t kMaxDurationSeconds = 10ULL * 365 * 24 * 60 * 60;

struct ProviderConfig {
  std::string name = "openai";
  std::string model = "gpt-4o-mini";
  std::optional<std::string> api_key;
  double temperature = 0.7;
  std::uint32_t max_output_chars = 2500;
  std::uint64_t timeout_ms = 30'000;
};

struct ContinuationConfig {
  std::uint32_t max_fragment_size = 2500;
  std::uint64_t session_ttl_seconds = 3600;
  std::uint64_t sweep_interval_seconds = 60;
  std::size_t max_sessions = 10'000;
};

struct LimitsConfig {
  std::uint32_t prompt_max_chars = 2500;
  std::uint32_t prompt_hard_limit = 4000;
};

struct PolicyConfig {
  std::string backend = "allow_all"; // "allow_all" or "patterns"
  std::vector<std::string> blocked_patterns;
};

struct GatewayConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8080;
  bool allow_public_bind = false;
  bool require_device_auth = true;
  std::string device_token_secret;
  std::vector<std::string> device_tokens;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ProviderConfig provider;
  ContinuationConfig continuation;
  LimitsConfig limits;
  PolicyConfig policy;
  GatewayConfig gateway;
  ObservabilityConfig observability;
};

} // namespace calx::config
