#pragma once

#include "calx/common/result.hpp"
#include "calx/config/schema.hpp"
#include "calx/query/service.hpp"
#include "calx/security/device_auth.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace calx::gateway {

constexpr const char *kGatewayVersion = "0.1.0";

struct GatewayOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8080;
  bool verbose = false;
};

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);

[[nodiscard]] std::string render_http_response(const HttpResponse &response);

/// Device-facing HTTP surface over a QueryService. When `auth` is empty every
/// request is accepted and the device id comes from X-Device-Id.
class GatewayServer {
public:
  GatewayServer(const config::Config &config, std::shared_ptr<query::QueryService> service,
                std::optional<security::DeviceAuthenticator> auth = std::nullopt);
  ~GatewayServer();

  GatewayServer(const GatewayServer &) = delete;
  GatewayServer &operator=(const GatewayServer &) = delete;

  [[nodiscard]] common::Status start(const GatewayOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] HttpResponse dispatch_for_test(const HttpRequest &request);

private:
  [[nodiscard]] common::Status validate_bind_address(const std::string &host) const;
  [[nodiscard]] HttpResponse dispatch(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_health(const HttpRequest &request) const;
  [[nodiscard]] HttpResponse handle_query(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_continue(const HttpRequest &request);

  [[nodiscard]] common::Result<std::string> resolve_device(const HttpRequest &request) const;

  void accept_loop();
  void handle_client(int client_fd);

  const config::Config &config_;
  std::shared_ptr<query::QueryService> service_;
  std::optional<security::DeviceAuthenticator> auth_;
  bool verbose_ = false;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
};

} // namespace calx::gateway
