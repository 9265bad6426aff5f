#include "calx/config/config.hpp"

#include "calx/common/fs.hpp"
#include "calx/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <utility>
#include <vector>

namespace calx::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".calx";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CALX_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!key.empty()) {
      set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
    }
  }
}

// Earlier files win: CALX_ENV_FILE, then the config dir, then the working directory.
void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("CALX_ENV_FILE"); env_file != nullptr && *env_file) {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }

  static const std::regex host_re(
      R"(^(([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)*[a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?|((25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9])\.){3}(25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9])|::1|\[::1\])$)");
  return std::regex_match(host, host_re);
}

bool is_loopback_host(const std::string &host) {
  return host == "127.0.0.1" || host == "localhost" || host == "::1" || host == "[::1]";
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

bool provider_env_key_present(const std::string &provider) {
  static const std::vector<std::pair<std::string, std::string>> env_keys = {
      {"openai", "OPENAI_API_KEY"},         {"anthropic", "ANTHROPIC_API_KEY"},
      {"gemini", "GEMINI_API_KEY"},         {"google", "GEMINI_API_KEY"},
      {"google", "GOOGLE_AI_API_KEY"},      {"deepseek", "DEEPSEEK_API_KEY"},
      {"perplexity", "PERPLEXITY_API_KEY"}, {"groq", "GROQ_API_KEY"},
      {"openrouter", "OPENROUTER_API_KEY"}};
  const std::string normalized = common::to_lower(common::trim(provider));
  for (const auto &[name, env] : env_keys) {
    if (name != normalized) {
      continue;
    }
    if (const char *value = std::getenv(env.c_str()); value != nullptr && *value != '\0') {
      return true;
    }
  }
  return false;
}

template <typename T>
T get_unsigned(const common::TomlDocument &doc, const std::string &key, const T fallback) {
  return static_cast<T>(doc.get_u64(key, static_cast<std::uint64_t>(fallback)));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

bool is_known_provider(const std::string &provider) {
  const std::string normalized = common::to_lower(common::trim(provider));
  if (common::starts_with(normalized, "custom:")) {
    return true;
  }
  static const std::vector<std::string> known = {"openai",     "anthropic", "gemini",
                                                 "google",     "deepseek",  "perplexity",
                                                 "groq",       "openrouter"};
  for (const auto &name : known) {
    if (normalized == name) {
      return true;
    }
  }
  return false;
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *provider = std::getenv("CALX_PROVIDER"); provider != nullptr && *provider) {
    config.provider.name = provider;
  }
  if (const char *model = std::getenv("CALX_MODEL"); model != nullptr && *model) {
    config.provider.model = model;
  }
  if (const char *api_key = std::getenv("CALX_API_KEY"); api_key != nullptr && *api_key) {
    config.provider.api_key = std::string(api_key);
  }
  if (const char *secret = std::getenv("CALX_DEVICE_TOKEN_SECRET"); secret != nullptr && *secret) {
    config.gateway.device_token_secret = secret;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;

  auto &provider = config.provider;
  provider.name = expand_config_value(doc.get_string("provider.name", provider.name));
  provider.model = expand_config_value(doc.get_string("provider.model", provider.model));
  if (doc.has("provider.api_key")) {
    provider.api_key = expand_config_value(doc.get_string("provider.api_key"));
  }
  provider.temperature = doc.get_double("provider.temperature", provider.temperature);
  provider.max_output_chars =
      get_unsigned(doc, "provider.max_output_chars", provider.max_output_chars);
  provider.timeout_ms = doc.get_u64("provider.timeout_ms", provider.timeout_ms);

  auto &continuation = config.continuation;
  continuation.max_fragment_size =
      get_unsigned(doc, "continuation.max_fragment_size", continuation.max_fragment_size);
  continuation.session_ttl_seconds =
      doc.get_u64("continuation.session_ttl_seconds", continuation.session_ttl_seconds);
  continuation.sweep_interval_seconds =
      doc.get_u64("continuation.sweep_interval_seconds", continuation.sweep_interval_seconds);
  continuation.max_sessions =
      get_unsigned(doc, "continuation.max_sessions", continuation.max_sessions);

  config.limits.prompt_max_chars =
      get_unsigned(doc, "limits.prompt_max_chars", config.limits.prompt_max_chars);
  config.limits.prompt_hard_limit =
      get_unsigned(doc, "limits.prompt_hard_limit", config.limits.prompt_hard_limit);

  config.policy.backend = doc.get_string("policy.backend", config.policy.backend);
  config.policy.blocked_patterns = doc.get_string_array("policy.blocked_patterns");

  auto &gateway = config.gateway;
  gateway.host = doc.get_string("gateway.host", gateway.host);
  const auto port = doc.get_int("gateway.port", gateway.port);
  if (port < 0 || port > 65535) {
    return common::Result<Config>::failure("gateway.port must be 1-65535");
  }
  gateway.port = static_cast<std::uint16_t>(port);
  gateway.allow_public_bind = doc.get_bool("gateway.allow_public_bind", gateway.allow_public_bind);
  gateway.require_device_auth =
      doc.get_bool("gateway.require_device_auth", gateway.require_device_auth);
  gateway.device_token_secret =
      expand_config_value(doc.get_string("gateway.device_token_secret", gateway.device_token_secret));
  gateway.device_tokens = doc.get_string_array("gateway.device_tokens");

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << "[provider]\n";
  file << "name = " << common::quote_toml_string(config.provider.name) << "\n";
  file << "model = " << common::quote_toml_string(config.provider.model) << "\n";
  if (config.provider.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.provider.api_key) << "\n";
  }
  file << "temperature = " << config.provider.temperature << "\n";
  file << "max_output_chars = " << config.provider.max_output_chars << "\n";
  file << "timeout_ms = " << config.provider.timeout_ms << "\n";

  file << "\n[continuation]\n";
  file << "max_fragment_size = " << config.continuation.max_fragment_size << "\n";
  file << "session_ttl_seconds = " << config.continuation.session_ttl_seconds << "\n";
  file << "sweep_interval_seconds = " << config.continuation.sweep_interval_seconds << "\n";
  file << "max_sessions = " << config.continuation.max_sessions << "\n";

  file << "\n[limits]\n";
  file << "prompt_max_chars = " << config.limits.prompt_max_chars << "\n";
  file << "prompt_hard_limit = " << config.limits.prompt_hard_limit << "\n";

  file << "\n[policy]\n";
  file << "backend = " << common::quote_toml_string(config.policy.backend) << "\n";
  file << "blocked_patterns = " << string_array_to_toml(config.policy.blocked_patterns) << "\n";

  file << "\n[gateway]\n";
  file << "host = " << common::quote_toml_string(config.gateway.host) << "\n";
  file << "port = " << config.gateway.port << "\n";
  file << "allow_public_bind = " << bool_to_toml(config.gateway.allow_public_bind) << "\n";
  file << "require_device_auth = " << bool_to_toml(config.gateway.require_device_auth) << "\n";
  file << "device_token_secret = " << common::quote_toml_string(config.gateway.device_token_secret)
       << "\n";
  file << "device_tokens = " << string_array_to_toml(config.gateway.device_tokens) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed to write temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!is_known_provider(config.provider.name)) {
    return ValidationResult::failure("Unknown provider.name: " + config.provider.name);
  }
  if (config.provider.temperature < 0.0 || config.provider.temperature > 2.0) {
    return ValidationResult::failure("provider.temperature must be between 0.0 and 2.0");
  }
  if (config.provider.max_output_chars < 4) {
    return ValidationResult::failure("provider.max_output_chars must be >= 4");
  }
  if (config.provider.timeout_ms == 0) {
    return ValidationResult::failure("provider.timeout_ms must be > 0");
  }
  const bool api_key_missing =
      !config.provider.api_key.has_value() || common::trim(*config.provider.api_key).empty();
  if (api_key_missing && !provider_env_key_present(config.provider.name)) {
    warnings.push_back(
        "API key is missing (provider.api_key, CALX_API_KEY, or provider key env)");
  }

  if (config.continuation.max_fragment_size == 0) {
    return ValidationResult::failure("continuation.max_fragment_size must be > 0");
  }
  if (config.continuation.session_ttl_seconds == 0) {
    return ValidationResult::failure("continuation.session_ttl_seconds must be > 0");
  }
  if (config.continuation.session_ttl_seconds > kMaxDurationSeconds) {
    return ValidationResult::failure("continuation.session_ttl_seconds must be <= " +
                                     std::to_string(kMaxDurationSeconds));
  }
  if (config.continuation.sweep_interval_seconds == 0) {
    return ValidationResult::failure("continuation.sweep_interval_seconds must be > 0");
  }
  if (config.continuation.sweep_interval_seconds > kMaxDurationSeconds) {
    return ValidationResult::failure("continuation.sweep_interval_seconds must be <= " +
                                     std::to_string(kMaxDurationSeconds));
  }
  if (config.continuation.max_sessions == 0) {
    return ValidationResult::failure("continuation.max_sessions must be > 0");
  }
  if (config.continuation.sweep_interval_seconds > config.continuation.session_ttl_seconds) {
    warnings.push_back(
        "continuation.sweep_interval_seconds exceeds session_ttl_seconds; expired sessions "
        "linger until the next sweep");
  }

  if (config.limits.prompt_max_chars == 0) {
    return ValidationResult::failure("limits.prompt_max_chars must be > 0");
  }
  if (config.limits.prompt_hard_limit < config.limits.prompt_max_chars) {
    return ValidationResult::failure("limits.prompt_hard_limit must be >= limits.prompt_max_chars");
  }

  const std::string policy_backend = common::to_lower(common::trim(config.policy.backend));
  if (policy_backend != "allow_all" && policy_backend != "patterns") {
    return ValidationResult::failure("Invalid policy.backend: " + config.policy.backend);
  }
  if (policy_backend == "patterns" && config.policy.blocked_patterns.empty()) {
    warnings.push_back("policy.backend is patterns but policy.blocked_patterns is empty");
  }

  if (config.gateway.port == 0) {
    return ValidationResult::failure("gateway.port must be 1-65535");
  }
  if (!is_valid_host(config.gateway.host)) {
    return ValidationResult::failure("gateway.host is invalid: " + config.gateway.host);
  }
  if (!is_loopback_host(config.gateway.host) && !config.gateway.allow_public_bind) {
    return ValidationResult::failure("gateway.host " + config.gateway.host +
                                     " is not loopback; set gateway.allow_public_bind = true");
  }
  if (config.gateway.require_device_auth) {
    if (config.gateway.device_token_secret.empty()) {
      return ValidationResult::failure(
          "gateway.device_token_secret is required when require_device_auth is true");
    }
    if (config.gateway.device_tokens.empty()) {
      warnings.push_back("gateway.device_tokens is empty; every device request will be rejected");
    }
  } else {
    warnings.push_back("gateway.require_device_auth is false; device ids are taken from X-Device-Id");
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace calx::config
