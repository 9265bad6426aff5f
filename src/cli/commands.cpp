#include "calx/cli/commands.hpp"

#include "calx/common/fs.hpp"
#include "calx/config/config.hpp"
#include "calx/continuation/reaper.hpp"
#include "calx/gateway/server.hpp"
#include "calx/runtime/app.hpp"
#include "calx/security/device_auth.hpp"
#include "calx/security/tokens.hpp"
#include "calx/text/chunker.hpp"
#include "calx/text/sanitizer.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace calx::cli {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

std::string version_string() {
#ifdef CALX_VERSION
  std::string version = CALX_VERSION;
#else
  std::string version = gateway::kGatewayVersion;
#endif
  return "calx " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

template <typename T> bool parse_number(const std::string &raw, T &out) {
  const std::string trimmed = common::trim(raw);
  const auto *end = trimmed.data() + trimmed.size();
  const auto [ptr, ec] = std::from_chars(trimmed.data(), end, out);
  return ec == std::errc() && ptr == end;
}

void print_warnings(const std::vector<std::string> &warnings) {
  for (const auto &warning : warnings) {
    std::cerr << "[WARN] config: " << warning << "\n";
  }
}

int run_serve(std::vector<std::string> args) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &ctx = context.value();

  gateway::GatewayOptions options;
  std::string host;
  std::string port_raw;
  std::string duration_raw;
  const bool once = take_flag(args, "--once");
  options.verbose = take_flag(args, "--verbose") || take_flag(args, "-v");
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  (void)take_option(args, "--duration-secs", "", duration_raw);
  options.host = host.empty() ? ctx.config().gateway.host : host;
  options.port = ctx.config().gateway.port;
  if (!port_raw.empty() && !parse_number(port_raw, options.port)) {
    std::cerr << "invalid port: " << port_raw << "\n";
    return 1;
  }

  auto validated = ctx.validate();
  if (!validated.ok()) {
    std::cerr << validated.error() << "\n";
    return 1;
  }
  print_warnings(validated.value());

  auto service = ctx.create_query_service();
  if (!service.ok()) {
    std::cerr << service.error() << "\n";
    return 1;
  }

  auto auth = ctx.create_authenticator();
  if (!auth.ok()) {
    std::cerr << auth.error() << "\n";
    return 1;
  }

  continuation::ContinuationReaper reaper(
      ctx.store(), std::chrono::seconds(std::min(ctx.config().continuation.sweep_interval_seconds,
                                                 config::kMaxDurationSeconds)));
  gateway::GatewayServer server(ctx.config(), service.value(), auth.value());
  auto status = server.start(options);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  reaper.start();

  std::cout << "Gateway listening on " << options.host << ":" << server.port() << "\n";
  std::cout << "Provider: " << service.value()->provider_name() << " ("
            << service.value()->options().generation.model << ")\n";
  if (!auth.value().has_value()) {
    std::cout << "Device auth disabled; devices are identified by X-Device-Id\n";
  }
  std::cout.flush();

  if (once) {
    reaper.stop();
    server.stop();
    return 0;
  }

  int duration = 0;
  if (!duration_raw.empty() && !parse_number(duration_raw, duration)) {
    std::cerr << "invalid duration: " << duration_raw << "\n";
  }

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
  while (g_stop_requested == 0 && server.is_running()) {
    if (duration > 0 && std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "Shutting down gateway\n";
  reaper.stop();
  server.stop();
  return 0;
}

int run_ask(std::vector<std::string> args) {
  std::string device_id = "cli";
  (void)take_option(args, "--device", "-d", device_id);
  const bool as_json = take_flag(args, "--json");
  std::string prompt = join_tokens(args);
  if (common::trim(prompt).empty()) {
    prompt = read_stdin_all();
  }

  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto service = context.value().create_query_service();
  if (!service.ok()) {
    std::cerr << service.error() << "\n";
    return 1;
  }

  auto result = service.value()->submit(device_id, prompt);
  std::size_t index = 1;
  while (true) {
    if (!result.ok()) {
      std::cerr << result.error().to_string() << "\n";
      return 1;
    }
    const auto &fragment = result.value();
    if (as_json) {
      std::cout << fragment.to_json() << "\n";
    } else {
      std::cout << fragment.chunk << "\n";
    }
    if (!fragment.has_more || !fragment.cursor.has_value()) {
      break;
    }
    if (!as_json) {
      std::cout << "--- fragment " << ++index << " ---\n";
    }
    result = service.value()->continue_query(*fragment.cursor);
  }
  return 0;
}

int run_sanitize(std::vector<std::string> args) {
  const std::string input = args.empty() ? read_stdin_all() : join_tokens(args);
  std::cout << text::sanitize(input) << "\n";
  return 0;
}

int run_chunk(std::vector<std::string> args) {
  std::size_t size = text::kDefaultMaxFragmentSize;
  std::string size_raw;
  if (take_option(args, "--size", "-s", size_raw) && (!parse_number(size_raw, size) || size == 0)) {
    std::cerr << "invalid fragment size: " << size_raw << "\n";
    return 1;
  }
  const bool raw = take_flag(args, "--raw");
  std::string input = args.empty() ? read_stdin_all() : join_tokens(args);
  if (!raw) {
    input = text::sanitize(input);
  }

  const auto fragments = text::chunk(input, size);
  for (std::size_t i = 0; i < fragments.size(); ++i) {
    std::cout << "--- fragment " << (i + 1) << "/" << fragments.size() << " ("
              << text::utf8_length(fragments[i]) << " chars) ---\n";
    std::cout << fragments[i] << "\n";
  }
  return 0;
}

int run_device_token(std::vector<std::string> args) {
  const bool save = take_flag(args, "--save");
  if (args.empty() || common::trim(args[0]).empty()) {
    std::cerr << "usage: calx device-token <device_id> [--save]\n";
    return 1;
  }
  const std::string device_id = common::trim(args[0]);
  if (device_id.find(':') != std::string::npos) {
    std::cerr << "device id must not contain ':'\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto &config = cfg.value();
  if (config.gateway.device_token_secret.empty()) {
    if (!save) {
      std::cerr << "gateway.device_token_secret is empty; rerun with --save to create one\n";
      return 1;
    }
    auto secret = security::random_hex(32);
    if (!secret.ok()) {
      std::cerr << secret.error() << "\n";
      return 1;
    }
    config.gateway.device_token_secret = secret.value();
  }

  auto token = security::generate_device_token();
  if (!token.ok()) {
    std::cerr << token.error() << "\n";
    return 1;
  }
  const security::DeviceAuthenticator auth(config.gateway.device_token_secret, {});
  const std::string entry = device_id + ":" + auth.hash_token(token.value());

  std::cout << "Device: " << device_id << "\n";
  std::cout << "Token: " << token.value() << "\n";
  std::cout << "Config entry: " << entry << "\n";

  if (!save) {
    return 0;
  }
  auto &entries = config.gateway.device_tokens;
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&](const std::string &existing) {
                                 auto parsed = security::parse_device_entry(existing);
                                 return parsed.ok() && parsed.value().device_id == device_id;
                               }),
                entries.end());
  entries.push_back(entry);
  auto saved = config::save_config(config);
  if (!saved.ok()) {
    std::cerr << saved.error() << "\n";
    return 1;
  }
  std::cout << "Saved to config\n";
  return 0;
}

int run_status() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto &config = cfg.value();
  auto cp = config::config_path();

  std::cout << "Provider: " << config.provider.name << "\n";
  std::cout << "Model: " << config.provider.model << "\n";
  std::cout << "API key: " << (config.provider.api_key.has_value() ? "set" : "not set") << "\n";
  std::cout << "Fragment size: " << config.continuation.max_fragment_size << "\n";
  std::cout << "Session TTL: " << config.continuation.session_ttl_seconds << "s\n";
  std::cout << "Policy: " << config.policy.backend << "\n";
  std::cout << "Gateway: " << config.gateway.host << ":" << config.gateway.port << "\n";
  std::cout << "Device auth: " << (config.gateway.require_device_auth ? "required" : "disabled")
            << " (" << config.gateway.device_tokens.size() << " devices)\n";
  std::cout << "Observability: " << config.observability.backend << "\n";
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] == "show") {
    return run_status();
  }

  if (args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  if (args[0] == "validate") {
    auto cfg = config::load_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return 1;
    }
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "[FAIL] " << validated.error() << "\n";
      return 1;
    }
    print_warnings(validated.value());
    std::cout << "[OK] configuration is valid\n";
    return 0;
  }

  if (args[0] == "init") {
    if (config::config_exists()) {
      std::cerr << "config already exists\n";
      return 1;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return run_config({"path"});
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 1;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  calx" << RESET << DIM
            << "  AI answers sized for small screens" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "calx [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  SERVICE" << RESET << "\n";
  std::cout << "  " << GREEN << "serve" << RESET << DIM
            << "           Start the device gateway (--host, --port, --verbose)" << RESET << "\n";
  std::cout << "  " << GREEN << "device-token" << RESET << " ID" << DIM
            << " Issue a device token (--save writes the config entry)" << RESET << "\n\n";

  std::cout << BOLD << "  TEXT" << RESET << "\n";
  std::cout << "  " << GREEN << "ask" << RESET << " PROMPT" << DIM
            << "      Query the provider and print every fragment" << RESET << "\n";
  std::cout << "  " << GREEN << "sanitize" << RESET << DIM
            << "        Strip markup from stdin for a plain-text display" << RESET << "\n";
  std::cout << "  " << GREEN << "chunk" << RESET << DIM
            << "           Split stdin into fragments (--size N, --raw)" << RESET << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM
            << "     Display current configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config validate" << RESET << DIM
            << " Check configuration and list warnings" << RESET << "\n";
  std::cout << "  " << GREEN << "config init" << RESET << DIM
            << "     Write a default config file" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "         Show version" << RESET
            << "\n\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "serve" || subcommand == "gateway") {
    return run_serve(std::move(args));
  }
  if (subcommand == "ask") {
    return run_ask(std::move(args));
  }
  if (subcommand == "sanitize") {
    return run_sanitize(std::move(args));
  }
  if (subcommand == "chunk") {
    return run_chunk(std::move(args));
  }
  if (subcommand == "device-token") {
    return run_device_token(std::move(args));
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace calx::cli
