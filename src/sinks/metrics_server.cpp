#include "sinks/metrics_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <sstream>
#include <string>
#include <utility>

#include "core/log.hpp"

namespace sla_agent::sinks {
namespace {

constexpr int kAcceptPollMs = 200;
constexpr std::size_t kMaxRequestBytes = 16 * 1024;
constexpr int kClientTimeoutSeconds = 2;

const char* reason_phrase(const int code) {
  switch (code) {
    case 200:
      return "OK";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    default:
      return "Internal Server Error";
  }
}

std::string http_response(const int code, const std::string& body, const std::string& content_type) {
  std::ostringstream out;
  out << "HTTP/1.1 " << code << ' ' << reason_phrase(code) << "\r\n"
      << "Content-Type: " << content_type << "\r\n"
      << "Content-Length: " << body.size() << "\r\n"
      << "Connection: close\r\n"
      << "\r\n"
      << body;
  return out.str();
}

bool read_request_head(const int fd, std::string& request) {
  char buffer[2048];
  while (request.find("\r\n\r\n") == std::string::npos) {
    const ssize_t received = ::recv(fd, buffer, sizeof(buffer), 0);
    if (received <= 0) {
      return !request.empty() && request.find("\r\n") != std::string::npos;
    }
    request.append(buffer, static_cast<std::size_t>(received));
    if (request.size() > kMaxRequestBytes) {
      return false;
    }
  }
  return true;
}

void send_all(const int fd, const std::string& payload) {
  std::size_t sent = 0;
  while (sent < payload.size()) {
    const ssize_t n = ::send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return;
    }
    sent += static_cast<std::size_t>(n);
  }
}

}  // namespace

MetricsServer::MetricsServer(MetricsServerOptions options, const SlaMetrics& metrics)
    : options_(std::move(options)), metrics_(metrics) {}

MetricsServer::~MetricsServer() { stop(); }

bool MetricsServer::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (running_) {
    return true;
  }

  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    core::log_error("server", std::string("socket() failed: ") + std::strerror(errno));
    return false;
  }

  int reuse = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options_.port);
  if (options_.bind_address.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, options_.bind_address.c_str(), &addr.sin_addr) != 1) {
    core::log_error("server", "invalid bind address " + options_.bind_address);
    ::close(fd);
    return false;
  }

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    core::log_error("server", "bind() to " + options_.bind_address + ':' + std::to_string(options_.port) +
                                  " failed: " + std::strerror(errno));
    ::close(fd);
    return false;
  }

  if (::listen(fd, 16) < 0) {
    core::log_error("server", std::string("listen() failed: ") + std::strerror(errno));
    ::close(fd);
    return false;
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = options_.port;
  }

  listen_fd_ = fd;
  running_ = true;
  worker_ = std::thread([this] { accept_loop(); });

  core::log_info("server", "exposing metrics on " + options_.bind_address + ':' + std::to_string(bound_port_.load()));
  return true;
}

void MetricsServer::stop() {
  {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    if (!running_) {
      return;
    }
    running_ = false;
  }

  if (worker_.joinable()) {
    worker_.join();
  }

  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }

  core::log_info("server", "metrics server stopped");
}

void MetricsServer::accept_loop() {
  while (running_) {
    pollfd pfd{};
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, kAcceptPollMs);
    if (ready <= 0) {
      continue;
    }

    const int client = ::accept(listen_fd_, nullptr, nullptr);
    if (client < 0) {
      continue;
    }

    timeval timeout{};
    timeout.tv_sec = kClientTimeoutSeconds;
    ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    ::setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

    handle_connection(client);
    ::close(client);
  }
}

void MetricsServer::handle_connection(const int client_fd) const {
  std::string request;
  if (!read_request_head(client_fd, request)) {
    return;
  }

  std::istringstream head(request);
  std::string method;
  std::string target;
  head >> method >> target;

  send_all(client_fd, respond(method, target));
}

std::string MetricsServer::respond(const std::string& method, const std::string& target) const {
  std::string path = target;
  const auto query = path.find('?');
  if (query != std::string::npos) {
    path.erase(query);
  }

  if (method != "GET") {
    return http_response(405, "only GET is supported\n", "text/plain; charset=utf-8");
  }

  try {
    if (path == "/metrics") {
      return http_response(200, metrics_.render_prometheus(), "text/plain; version=0.0.4; charset=utf-8");
    }
    if (path == "/status") {
      return http_response(200, metrics_.status_json().dump() + "\n", "application/json");
    }
    if (path == "/healthz") {
      return http_response(200, "ok\n", "text/plain; charset=utf-8");
    }
  } catch (const std::exception& ex) {
    core::log_error("server", std::string("failed to render ") + path + ": " + ex.what());
    return http_response(500, "error building response\n", "text/plain; charset=utf-8");
  }

  return http_response(404, "not found\n", "text/plain; charset=utf-8");
}

}  // namespace sla_agent::sinks
