#include "sinks/redis_latest.hpp"

#include <cstddef>
#include <string>
#include <utility>

#include <hiredis/hiredis.h>

#include "core/log.hpp"
#include "core/math.hpp"

namespace sla_agent::sinks {
namespace {

constexpr std::size_t kFieldCount = 7;
constexpr std::size_t kCommandArgCount = 2 + (kFieldCount * 2);

void add_field(std::vector<std::string>& args, const char* field, std::string value) {
  args.emplace_back(field);
  args.emplace_back(std::move(value));
}

}  // namespace

RedisLatestSink::RedisLatestSink(RedisLatestOptions options) : options_(std::move(options)) {
  command_args_.reserve(kCommandArgCount);
  command_argv_.reserve(kCommandArgCount);
  command_argv_len_.reserve(kCommandArgCount);
}

RedisLatestSink::~RedisLatestSink() = default;

RedisLatestSink::RedisLatestSink(RedisLatestSink&&) noexcept = default;
RedisLatestSink& RedisLatestSink::operator=(RedisLatestSink&&) noexcept = default;

std::string RedisLatestSink::describe_endpoint() const {
  if (!options_.unix_socket.empty()) {
    return "unix://" + options_.unix_socket;
  }
  return options_.host + ':' + std::to_string(options_.port);
}

bool RedisLatestSink::check_connectivity() {
  return ensure_connected();
}

void RedisLatestSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisLatestSink::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisLatestSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      core::log_debug("redis", std::string("connect failed: ") + raw->errstr);
      redisFree(raw);
    } else {
      core::log_debug("redis", "connect failed: out of memory");
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisLatestSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    core::log_error("redis", "AUTH rejected");
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisLatestSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    core::log_error("redis", "SELECT " + std::to_string(options_.db) + " rejected");
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisLatestSink::publish(const model::sla_frame& frame) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(frame)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(frame);
}

bool RedisLatestSink::publish_impl(const model::sla_frame& frame) {
  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();

  command_args_.emplace_back("HSET");
  command_args_.emplace_back(hash_key());
  add_field(command_args_, "current_ratio", std::to_string(core::finite_or_zero(frame.current_ratio)));
  add_field(command_args_, "window_ratio", std::to_string(core::finite_or_zero(frame.window_ratio)));
  add_field(command_args_, "window_fill", std::to_string(frame.window_fill));
  add_field(command_args_, "calculations", std::to_string(frame.cycle));
  add_field(command_args_, "request_duration_seconds",
            std::to_string(core::finite_or_zero(frame.snapshot.duration_seconds)));
  add_field(command_args_, "fetch_ok", frame.snapshot.empty() ? "0" : "1");
  add_field(command_args_, "updated_ms", std::to_string(frame.timestamp_ms));

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    core::log_error("redis", std::string("HSET failed: ") + reply->str);
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace sla_agent::sinks
