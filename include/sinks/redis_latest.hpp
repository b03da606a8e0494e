#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/sla_frame.hpp"

struct redisContext;

namespace sla_agent::sinks {

struct RedisLatestOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"sla"};
  std::uint32_t connect_timeout_ms{1000};
};

// Mirrors the latest SLA values into one Redis hash, "<key_prefix>:sla".
// Each publish overwrites the previous values; no history is kept.
class RedisLatestSink {
 public:
  explicit RedisLatestSink(RedisLatestOptions options = {});
  ~RedisLatestSink();

  RedisLatestSink(const RedisLatestSink&) = delete;
  RedisLatestSink& operator=(const RedisLatestSink&) = delete;
  RedisLatestSink(RedisLatestSink&&) noexcept;
  RedisLatestSink& operator=(RedisLatestSink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::sla_frame& frame);

  [[nodiscard]] std::string hash_key() const { return options_.key_prefix + ":sla"; }
  [[nodiscard]] std::string describe_endpoint() const;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool publish_impl(const model::sla_frame& frame);

  RedisLatestOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
};

}  // namespace sla_agent::sinks
