#include "calx/gateway/server.hpp"

#include "calx/common/fs.hpp"
#include "calx/common/json_util.hpp"
#include "calx/observability/global.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <iostream>
#include <sstream>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace calx::gateway {

namespace {

constexpr std::size_t kMaxBodySize = 64 * 1024;
constexpr int kListenBacklog = 64;
constexpr const char *kAnonymousDevice = "anonymous";

bool is_loopback_host(const std::string &host) {
  const std::string lowered = common::to_lower(common::trim(host));
  return lowered == "127.0.0.1" || lowered == "localhost" || lowered == "::1" ||
         lowered == "[::1]";
}

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const std::string lowered = common::to_lower(key);
  auto it = request.headers.find(lowered);
  if (it == request.headers.end()) {
    return "";
  }
  return it->second;
}

std::string status_text(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "OK";
  }
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::string url_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '+') {
      out.push_back(' ');
      continue;
    }
    if (ch == '%' && i + 2 < value.size()) {
      const int hi = hex_value(value[i + 1]);
      const int lo = hex_value(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(ch);
  }
  return out;
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[url_decode(part)] = "";
      continue;
    }
    out[url_decode(part.substr(0, eq))] = url_decode(part.substr(eq + 1));
  }
  return out;
}

HttpResponse make_json_response(int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

HttpResponse make_error_response(int status, const std::string &message) {
  return make_json_response(status, "{\"error\":" + common::json_quote(message) + "}");
}

int status_for(const query::QueryErrorCode code) {
  switch (code) {
  case query::QueryErrorCode::NotFound:
    return 404;
  case query::QueryErrorCode::InvalidInput:
    return 400;
  case query::QueryErrorCode::PayloadTooLarge:
    return 413;
  case query::QueryErrorCode::UpstreamFailure:
    return 503;
  case query::QueryErrorCode::Internal:
    return 500;
  }
  return 500;
}

HttpResponse render_query_result(const query::QueryResult &result) {
  if (!result.ok()) {
    return make_error_response(status_for(result.error().code), result.error().message);
  }
  return make_json_response(200, result.value().to_json());
}

std::optional<std::size_t> parse_content_length(const std::string &value) {
  const std::string trimmed = common::trim(value);
  std::size_t parsed = 0;
  const auto *begin = trimmed.data();
  const auto *end = trimmed.data() + trimmed.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

bool send_all(const int fd, const std::string &text) {
#ifndef _WIN32
  std::size_t sent = 0;
  while (sent < text.size()) {
    const ssize_t n = send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
#else
  (void)fd;
  (void)text;
  return false;
#endif
}

} // namespace

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure("incomplete request");
  }

  std::istringstream head_stream(raw.substr(0, header_end));
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure("missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure("invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto colon = line.find(':');
    if (line.empty() || colon == std::string::npos) {
      continue;
    }
    request.headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }

  return common::Result<HttpRequest>::success(std::move(request));
}

GatewayServer::GatewayServer(const config::Config &config,
                             std::shared_ptr<query::QueryService> service,
                             std::optional<security::DeviceAuthenticator> auth)
    : config_(config), service_(std::move(service)), auth_(std::move(auth)) {}

GatewayServer::~GatewayServer() { stop(); }

common::Status GatewayServer::start(const GatewayOptions &options) {
#ifdef _WIN32
  return common::Status::error("gateway server is not implemented on Windows");
#else
  if (running_) {
    return common::Status::error("gateway already running");
  }
  if (service_ == nullptr) {
    return common::Status::error("gateway needs a query service");
  }
  if (auto bind_ok = validate_bind_address(options.host); !bind_ok.ok()) {
    return bind_ok;
  }
  verbose_ = options.verbose;

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  const std::string host = common::to_lower(options.host) == "localhost" ? "127.0.0.1"
                                                                         : options.host;
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid bind host: " + options.host);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  return common::Status::success();
#endif
}

void GatewayServer::stop() {
#ifndef _WIN32
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
#endif
}

std::uint16_t GatewayServer::port() const { return bound_port_; }

bool GatewayServer::is_running() const { return running_.load(); }

common::Status GatewayServer::validate_bind_address(const std::string &host) const {
  if (!is_loopback_host(host) && !config_.gateway.allow_public_bind) {
    return common::Status::error("refusing public bind without allow_public_bind=true");
  }
  return common::Status::success();
}

HttpResponse GatewayServer::dispatch_for_test(const HttpRequest &request) {
  return dispatch(request);
}

HttpResponse GatewayServer::dispatch(const HttpRequest &request) {
  const auto started = std::chrono::steady_clock::now();

  HttpResponse response;
  if (request.path == "/health") {
    response = request.method == "GET" ? handle_health(request)
                                       : make_error_response(405, "method not allowed");
  } else if (request.path == "/device/ai/query") {
    response = request.method == "POST" ? handle_query(request)
                                        : make_error_response(405, "method not allowed");
  } else if (request.path == "/device/ai/continue") {
    response = request.method == "GET" ? handle_continue(request)
                                       : make_error_response(405, "method not allowed");
  } else {
    response = make_error_response(404, "not found");
  }

  const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_metric(
      observability::RequestLatencyMetric{.route = request.path, .latency = latency});
  if (verbose_) {
    std::cerr << "[DEBUG] " << request.method << " " << request.path << " -> "
              << response.status << " (" << latency.count() << "ms)\n";
  }
  return response;
}

HttpResponse GatewayServer::handle_health(const HttpRequest &) const {
  std::ostringstream body;
  body << "{";
  body << "\"status\":\"ok\",";
  body << "\"version\":" << common::json_quote(kGatewayVersion) << ",";
  body << "\"provider\":" << common::json_quote(service_->provider_name()) << ",";
  body << "\"active_sessions\":" << service_->active_sessions();
  body << "}";
  return make_json_response(200, body.str());
}

common::Result<std::string> GatewayServer::resolve_device(const HttpRequest &request) const {
  if (auth_.has_value()) {
    return auth_->authenticate(header_lookup(request, "authorization"));
  }
  const std::string claimed = common::trim(header_lookup(request, "x-device-id"));
  return common::Result<std::string>::success(claimed.empty() ? kAnonymousDevice : claimed);
}

HttpResponse GatewayServer::handle_query(const HttpRequest &request) {
  const auto device = resolve_device(request);
  if (!device.ok()) {
    return make_error_response(401, "unauthorized");
  }
  if (request.body.size() > kMaxBodySize) {
    return make_error_response(413, "request_too_large");
  }

  const auto prompt = common::json_find_string(request.body, "prompt");
  if (!prompt.has_value()) {
    return make_error_response(400, query::kPromptRequiredMessage);
  }
  return render_query_result(service_->submit(device.value(), *prompt));
}

HttpResponse GatewayServer::handle_continue(const HttpRequest &request) {
  if (!resolve_device(request).ok()) {
    return make_error_response(401, "unauthorized");
  }
  const auto it = request.query.find("cursor");
  if (it == request.query.end() || common::trim(it->second).empty()) {
    return make_error_response(400, "Cursor is required");
  }
  return render_query_result(service_->continue_query(it->second));
}

void GatewayServer::accept_loop() {
#ifndef _WIN32
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }
    handle_client(client);
    close(client);
  }
#endif
}

void GatewayServer::handle_client(int client_fd) {
#ifndef _WIN32
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  bool header_parsed = false;
  while (raw.size() < (kMaxBodySize + 8192)) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (!header_parsed) {
      const auto header_end = raw.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        continue;
      }
      header_parsed = true;
      auto parsed = parse_http_request(raw.substr(0, header_end + 4));
      if (parsed.ok()) {
        const std::string cl = header_lookup(parsed.value(), "content-length");
        if (!cl.empty()) {
          content_length = parse_content_length(cl).value_or(0);
        }
      }
      if (content_length > kMaxBodySize) {
        if (!send_all(client_fd,
                      render_http_response(make_error_response(413, "request_too_large")))) {
          observability::record_error("gateway", "failed to send response");
        }
        return;
      }
    }

    const auto header_end = raw.find("\r\n\r\n");
    if (raw.size() >= header_end + 4 + content_length) {
      break;
    }
  }

  auto parsed = parse_http_request(raw);
  HttpResponse response;
  if (!parsed.ok()) {
    response = make_error_response(400, "invalid_request");
  } else {
    response = dispatch(parsed.value());
  }
  if (!send_all(client_fd, render_http_response(response))) {
    observability::record_error("gateway", "failed to send response");
  }
#endif
}

} // namespace calx::gateway
