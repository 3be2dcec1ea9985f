#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"

struct redisContext;
struct redisReply;

namespace weather_mcp::weather {

class ReportCache {
 public:
  virtual ~ReportCache() = default;

  virtual std::optional<std::string> get(const std::string& key) = 0;
  virtual void put(const std::string& key, const std::string& report) = 0;
};

// Reports stored as plain Redis strings with an expiry. Failures are logged and
// read as misses; the connection is re-established on the next call.
class RedisReportCache : public ReportCache {
 public:
  explicit RedisReportCache(core::RedisConfig config);
  ~RedisReportCache() override;

  RedisReportCache(const RedisReportCache&) = delete;
  RedisReportCache& operator=(const RedisReportCache&) = delete;

  std::optional<std::string> get(const std::string& key) override;
  void put(const std::string& key, const std::string& report) override;

  std::string make_key(const std::string& suffix) const;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };
  struct ReplyDeleter {
    void operator()(redisReply* reply) const;
  };
  using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

  bool ensure_connected();
  bool reconnect();
  ReplyPtr command(const std::vector<std::string>& args);

  core::RedisConfig config_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
};

}  // namespace weather_mcp::weather
