#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>

namespace calx::testing {

config::Config mock_config() {
  config::Config config;
  config.provider.name = "openai";
  config.provider.model = "gpt-4o-mini";
  config.provider.api_key = "test-key";
  config.gateway.require_device_auth = false;
  config.observability.backend = "none";
  return config;
}

void MockProvider::set_response(std::string response) {
  std::lock_guard<std::mutex> lock(mutex_);
  response_ = std::move(response);
  error_.reset();
}

void MockProvider::set_error(providers::ProviderError error) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_ = std::move(error);
  response_.reset();
}

providers::GenerateResult MockProvider::generate(const std::string &prompt,
                                                 const providers::GenerationConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++calls_;
  last_prompt_ = prompt;
  last_config_ = config;
  if (error_.has_value()) {
    return providers::GenerateResult::failure(*error_);
  }
  return providers::GenerateResult::success(response_.value_or("mock-response"));
}

std::size_t MockProvider::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

std::string MockProvider::last_prompt() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_prompt_;
}

providers::GenerationConfig MockProvider::last_config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_config_;
}

providers::HttpResponse
FakeHttpClient::post_json(const std::string &url,
                          const std::unordered_map<std::string, std::string> &headers,
                          const std::string &body, const std::uint64_t timeout_ms) {
  ++post_count;
  last_url = url;
  last_headers = headers;
  last_body = body;
  last_timeout_ms = timeout_ms;
  return next_post;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("calx-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

std::string repeat(const char ch, const std::size_t count) { return std::string(count, ch); }

} // namespace calx::testing
