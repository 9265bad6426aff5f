#include "test_framework.hpp"

#include "calx/common/fs.hpp"
#include "calx/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>

namespace {

namespace cfg = calx::config;
using calx::testing::EnvGuard;
using calx::testing::TempWorkspace;

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = cfg::config_path_override();
    if (next.has_value()) {
      cfg::set_config_path_override(*next);
    } else {
      cfg::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      cfg::set_config_path_override(*old_override);
    } else {
      cfg::clear_config_path_override();
    }
  }
};

// HOME points at a scratch directory and every CALX_* variable is cleared.
struct IsolatedHome {
  TempWorkspace home;
  EnvGuard home_env{"HOME", home.path().string()};
  EnvGuard config_path_env{"CALX_CONFIG_PATH", std::nullopt};
  EnvGuard env_file_env{"CALX_ENV_FILE", std::nullopt};
  EnvGuard provider_env{"CALX_PROVIDER", std::nullopt};
  EnvGuard model_env{"CALX_MODEL", std::nullopt};
  EnvGuard api_key_env{"CALX_API_KEY", std::nullopt};
  EnvGuard secret_env{"CALX_DEVICE_TOKEN_SECRET", std::nullopt};
  ConfigOverrideGuard override_guard;
};

bool contains_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  return std::any_of(warnings.begin(), warnings.end(), [&](const std::string &warning) {
    return warning.find(needle) != std::string::npos;
  });
}

cfg::Config valid_config() {
  cfg::Config config;
  config.provider.api_key = "sk-test";
  config.gateway.device_token_secret = "secret";
  config.gateway.device_tokens = {"esp32-kitchen:abc"};
  return config;
}

} // namespace

void register_config_tests(std::vector<calx::tests::TestCase> &tests) {
  using calx::tests::require;

  tests.push_back({"config_dir_is_under_home", [] {
                     IsolatedHome env;
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(dir.value() == env.home.path() / ".calx", "config dir mismatch");
                     require(std::filesystem::is_directory(dir.value()), "dir should be created");

                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value().filename() == "config.toml", "config filename");
                     require(!cfg::config_exists(), "fresh home has no config");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     IsolatedHome env;
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.provider.name == "openai", "default provider");
                     require(config.continuation.max_fragment_size == 2500, "default fragment size");
                     require(config.continuation.session_ttl_seconds == 3600, "default ttl");
                     require(config.limits.prompt_max_chars == 2500, "default prompt max");
                     require(config.gateway.host == "127.0.0.1", "default host");
                     require(config.gateway.require_device_auth, "auth on by default");
                   }});

  tests.push_back({"config_parses_all_sections", [] {
                     const auto parsed = cfg::parse_config(R"(
[provider]
name = "anthropic"
model = "claude-3-5-haiku-latest"
api_key = "sk-ant"
temperature = 0.2
max_output_chars = 1200
timeout_ms = 9000

[continuation]
max_fragment_size = 900
session_ttl_seconds = 600
sweep_interval_seconds = 15
max_sessions = 32

[limits]
prompt_max_chars = 1000
prompt_hard_limit = 2000

[policy]
backend = "patterns"
blocked_patterns = ["secret", "password"]

[gateway]
host = "0.0.0.0"
port = 9090
allow_public_bind = true
require_device_auth = true
device_token_secret = "s3cret"
device_tokens = ["esp32:aa", "m5:bb"] # two devices

[observability]
backend = "log,noop"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.provider.name == "anthropic", "provider name");
                     require(config.provider.api_key == std::optional<std::string>("sk-ant"),
                             "api key");
                     require(config.provider.temperature == 0.2, "temperature");
                     require(config.provider.max_output_chars == 1200, "max output chars");
                     require(config.provider.timeout_ms == 9000, "timeout");
                     require(config.continuation.max_fragment_size == 900, "fragment size");
                     require(config.continuation.session_ttl_seconds == 600, "ttl");
                     require(config.continuation.sweep_interval_seconds == 15, "sweep");
                     require(config.continuation.max_sessions == 32, "max sessions");
                     require(config.limits.prompt_hard_limit == 2000, "hard limit");
                     require(config.policy.blocked_patterns.size() == 2, "patterns");
                     require(config.gateway.port == 9090, "port");
                     require(config.gateway.allow_public_bind, "public bind");
                     require(config.gateway.device_tokens.size() == 2, "device tokens");
                     require(config.gateway.device_tokens[1] == "m5:bb", "second token");
                     require(config.observability.backend == "log,noop", "observability");
                   }});

  tests.push_back({"config_rejects_out_of_range_port", [] {
                     const auto parsed = cfg::parse_config("[gateway]\nport = 70000\n");
                     require(!parsed.ok(), "port above 65535 should fail");
                     require(parsed.error().find("gateway.port") != std::string::npos,
                             parsed.error());
                   }});

  tests.push_back({"validate_bounds_continuation_durations", [] {
                     const auto parsed = cfg::parse_config(
                         "[continuation]\nsession_ttl_seconds = 20000000000\n");
                     require(parsed.ok(), parsed.error());

                     auto config = valid_config();
                     config.continuation = parsed.value().continuation;
                     const auto ttl_result = cfg::validate_config(config);
                     require(!ttl_result.ok(), "ttl beyond ten years should fail");
                     require(ttl_result.error().find("session_ttl_seconds") != std::string::npos,
                             ttl_result.error());

                     config.continuation.session_ttl_seconds = cfg::kMaxDurationSeconds;
                     require(cfg::validate_config(config).ok(), "ten years is accepted");

                     config.continuation.sweep_interval_seconds = cfg::kMaxDurationSeconds + 1;
                     const auto sweep_result = cfg::validate_config(config);
                     require(!sweep_result.ok(), "sweep interval beyond ten years should fail");
                     require(sweep_result.error().find("sweep_interval_seconds") !=
                                 std::string::npos,
                             sweep_result.error());
                   }});

  tests.push_back({"config_expands_env_in_secret", [] {
                     const EnvGuard secret("CALX_TEST_SECRET_VALUE", std::string("from-env"));
                     const auto parsed = cfg::parse_config(
                         "[gateway]\ndevice_token_secret = \"${CALX_TEST_SECRET_VALUE}\"\n");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().gateway.device_token_secret == "from-env",
                             "secret should expand: " + parsed.value().gateway.device_token_secret);
                   }});

  tests.push_back({"config_env_overrides_file", [] {
                     IsolatedHome env;
                     env.home.create_file(".calx/config.toml",
                                          "[provider]\nname = \"openai\"\nmodel = \"gpt-4o\"\n");
                     const EnvGuard provider("CALX_PROVIDER", std::string("groq"));
                     const EnvGuard model("CALX_MODEL", std::string("llama-3.1-8b-instant"));
                     const EnvGuard key("CALX_API_KEY", std::string("gsk-env"));
                     const EnvGuard secret("CALX_DEVICE_TOKEN_SECRET", std::string("env-secret"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().provider.name == "groq", "provider override");
                     require(loaded.value().provider.model == "llama-3.1-8b-instant",
                             "model override");
                     require(loaded.value().provider.api_key ==
                                 std::optional<std::string>("gsk-env"),
                             "api key override");
                     require(loaded.value().gateway.device_token_secret == "env-secret",
                             "secret override");
                   }});

  tests.push_back({"config_loads_dotenv_file", [] {
                     IsolatedHome env;
                     env.home.create_file("custom.env",
                                          "# device gateway\nexport CALX_MODEL=\"from-dotenv\"\n"
                                          "CALX_API_KEY = dotenv-key\n");
                     const EnvGuard env_file("CALX_ENV_FILE",
                                             (env.home.path() / "custom.env").string());

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().provider.model == "from-dotenv",
                             "dotenv model: " + loaded.value().provider.model);
                     require(loaded.value().provider.api_key ==
                                 std::optional<std::string>("dotenv-key"),
                             "dotenv api key");
                   }});

  tests.push_back({"config_dotenv_does_not_override_environment", [] {
                     IsolatedHome env;
                     env.home.create_file("custom.env", "CALX_MODEL=from-dotenv\n");
                     const EnvGuard env_file("CALX_ENV_FILE",
                                             (env.home.path() / "custom.env").string());
                     const EnvGuard model("CALX_MODEL", std::string("from-shell"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().provider.model == "from-shell",
                             "shell environment should win");
                   }});

  tests.push_back({"config_save_then_load", [] {
                     IsolatedHome env;
                     auto config = valid_config();
                     config.provider.name = "deepseek";
                     config.continuation.max_fragment_size = 777;
                     config.policy.backend = "patterns";
                     config.policy.blocked_patterns = {"has \"quotes\"", "plain"};
                     config.gateway.port = 8181;

                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "config should exist after save");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().provider.name == "deepseek", "provider");
                     require(loaded.value().continuation.max_fragment_size == 777, "fragment size");
                     require(loaded.value().policy.blocked_patterns ==
                                 config.policy.blocked_patterns,
                             "patterns should survive quoting");
                     require(loaded.value().gateway.port == 8181, "port");
                     require(loaded.value().gateway.device_tokens == config.gateway.device_tokens,
                             "device tokens");
                   }});

  tests.push_back({"config_path_override_file", [] {
                     IsolatedHome env;
                     const auto target = env.home.path() / "elsewhere" / "calx.toml";
                     const ConfigOverrideGuard guard(target);
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == target, "override path should be used verbatim");

                     require(cfg::save_config(valid_config()).ok(), "save to override");
                     require(std::filesystem::exists(target), "override file should be written");
                   }});

  tests.push_back({"config_path_env_override", [] {
                     IsolatedHome env;
                     const auto dir = env.home.path() / "cfgdir";
                     std::filesystem::create_directories(dir);
                     const EnvGuard path_env("CALX_CONFIG_PATH", dir.string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == dir / "config.toml", "directory override");
                   }});

  tests.push_back({"validate_accepts_valid_config", [] {
                     const auto result = cfg::validate_config(valid_config());
                     require(result.ok(), result.error());
                     require(result.value().empty(), "no warnings expected");
                   }});

  tests.push_back({"validate_hard_errors", [] {
                     auto unknown = valid_config();
                     unknown.provider.name = "mystery";
                     const auto unknown_result = cfg::validate_config(unknown);
                     require(!unknown_result.ok(), "unknown provider should fail");
                     require(unknown_result.error().find("Unknown provider.name") !=
                                 std::string::npos,
                             unknown_result.error());

                     auto zero_fragment = valid_config();
                     zero_fragment.continuation.max_fragment_size = 0;
                     require(!cfg::validate_config(zero_fragment).ok(), "zero fragment size");

                     auto inverted_limits = valid_config();
                     inverted_limits.limits.prompt_hard_limit = 10;
                     require(!cfg::validate_config(inverted_limits).ok(),
                             "hard limit below soft limit");

                     auto public_bind = valid_config();
                     public_bind.gateway.host = "0.0.0.0";
                     require(!cfg::validate_config(public_bind).ok(),
                             "public bind needs opt-in");
                     public_bind.gateway.allow_public_bind = true;
                     require(cfg::validate_config(public_bind).ok(), "opt-in allows public bind");

                     auto no_secret = valid_config();
                     no_secret.gateway.device_token_secret.clear();
                     const auto no_secret_result = cfg::validate_config(no_secret);
                     require(!no_secret_result.ok(), "auth without a secret should fail");
                     require(no_secret_result.error().find("device_token_secret") !=
                                 std::string::npos,
                             no_secret_result.error());

                     auto bad_policy = valid_config();
                     bad_policy.policy.backend = "llm";
                     require(!cfg::validate_config(bad_policy).ok(), "unknown policy backend");
                   }});

  tests.push_back({"validate_warnings", [] {
                     const EnvGuard openai_key("OPENAI_API_KEY", std::nullopt);
                     auto config = valid_config();
                     config.provider.api_key.reset();
                     config.gateway.require_device_auth = false;
                     config.policy.backend = "patterns";
                     config.continuation.sweep_interval_seconds = 7200;

                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(contains_warning(result.value(), "API key is missing"), "api key");
                     require(contains_warning(result.value(), "require_device_auth is false"),
                             "auth disabled");
                     require(contains_warning(result.value(), "blocked_patterns is empty"),
                             "empty patterns");
                     require(contains_warning(result.value(), "sweep_interval_seconds"),
                             "sweep interval");
                   }});

  tests.push_back({"validate_provider_env_key_silences_warning", [] {
                     const EnvGuard openai_key("OPENAI_API_KEY", std::string("sk-env"));
                     auto config = valid_config();
                     config.provider.api_key.reset();
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(!contains_warning(result.value(), "API key is missing"),
                             "provider env key should count");
                   }});

  tests.push_back({"known_providers", [] {
                     for (const auto *name : {"openai", "anthropic", "gemini", "google", "deepseek",
                                              "perplexity", "groq", "openrouter", " OpenAI "}) {
                       require(cfg::is_known_provider(name), std::string("known: ") + name);
                     }
                     require(cfg::is_known_provider("custom:http://localhost:8000/v1"), "custom");
                     require(!cfg::is_known_provider("ollama"), "ollama is not supported");
                   }});
}
