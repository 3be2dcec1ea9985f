#include "weather/cache.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace weather_mcp::weather {

void RedisReportCache::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

void RedisReportCache::ReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

RedisReportCache::RedisReportCache(core::RedisConfig config) : config_(std::move(config)) {}

RedisReportCache::~RedisReportCache() = default;

std::string RedisReportCache::make_key(const std::string& suffix) const {
  return config_.key_prefix + ":" + suffix;
}

bool RedisReportCache::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisReportCache::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(config_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((config_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!config_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(config_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(config_.host.c_str(), static_cast<int>(config_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }
  context_.reset(raw);

  if (!config_.password.empty()) {
    const auto reply = command({"AUTH", config_.password});
    if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
      std::cerr << "[redis] AUTH failed\n";
      context_.reset();
      return false;
    }
  }

  if (config_.db != 0) {
    const auto reply = command({"SELECT", std::to_string(config_.db)});
    if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
      std::cerr << "[redis] SELECT failed\n";
      context_.reset();
      return false;
    }
  }
  return true;
}

RedisReportCache::ReplyPtr RedisReportCache::command(const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }

  auto* raw = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argv_len.data()));
  if (raw == nullptr) {
    std::cerr << "[redis] " << args.front() << " failed: " << context_->errstr << '\n';
    context_.reset();
  }
  return ReplyPtr(raw);
}

std::optional<std::string> RedisReportCache::get(const std::string& key) {
  if (!ensure_connected()) {
    return std::nullopt;
  }

  const auto reply = command({"GET", make_key(key)});
  if (reply == nullptr) {
    return std::nullopt;
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    std::cerr << "[redis] GET rejected: " << (reply->str != nullptr ? reply->str : "") << '\n';
    return std::nullopt;
  }
  if (reply->type != REDIS_REPLY_STRING || reply->str == nullptr) {
    return std::nullopt;
  }
  return std::string(reply->str, static_cast<std::size_t>(reply->len));
}

void RedisReportCache::put(const std::string& key, const std::string& report) {
  if (!ensure_connected()) {
    return;
  }

  const auto reply = command({"SET", make_key(key), report, "EX", std::to_string(config_.ttl_seconds)});
  if (reply != nullptr && reply->type == REDIS_REPLY_ERROR) {
    std::cerr << "[redis] SET rejected: " << (reply->str != nullptr ? reply->str : "") << '\n';
  }
}

}  // namespace weather_mcp::weather
