#include "core/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace weather_mcp::core {
namespace {

constexpr std::array<const char*, 9> kKnownKeys = {
    "OPENWEATHER_API_KEY",
    "WEATHER_MCP_BASE_URL",
    "WEATHER_MCP_TIMEOUT_MS",
    "WEATHER_MCP_REDIS_ADDRESS",
    "WEATHER_MCP_REDIS_PASSWORD",
    "WEATHER_MCP_REDIS_DB",
    "WEATHER_MCP_REDIS_PREFIX",
    "WEATHER_MCP_CACHE_TTL_S",
    "WEATHER_MCP_VERBOSE",
};

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }

  // Unquoted values may carry a trailing comment.
  const auto comment_pos = value.find(" #");
  if (comment_pos != std::string::npos) {
    return trim(value.substr(0, comment_pos));
  }
  return value;
}

bool parse_bool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  return parsed;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.empty()) {
    return;
  }

  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = parse_integer("WEATHER_MCP_REDIS_ADDRESS port", value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("WEATHER_MCP_REDIS_ADDRESS port must be in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& value) {
  if (key == "OPENWEATHER_API_KEY") {
    config.weather.api_key = value;
    return;
  }

  if (key == "WEATHER_MCP_BASE_URL") {
    if (value.empty()) {
      throw std::runtime_error("WEATHER_MCP_BASE_URL must not be empty");
    }
    config.weather.base_url = value;
    while (config.weather.base_url.size() > 1 && config.weather.base_url.back() == '/') {
      config.weather.base_url.pop_back();
    }
    return;
  }

  if (key == "WEATHER_MCP_TIMEOUT_MS") {
    const auto timeout = parse_integer(key, value);
    if (timeout <= 0 || timeout > 600000) {
      throw std::runtime_error("WEATHER_MCP_TIMEOUT_MS must be in range 1..600000");
    }
    config.weather.request_timeout_ms = static_cast<std::uint32_t>(timeout);
    return;
  }

  if (key == "WEATHER_MCP_REDIS_ADDRESS") {
    apply_redis_address(config.cache, value);
    return;
  }

  if (key == "WEATHER_MCP_REDIS_PASSWORD") {
    config.cache.password = value;
    return;
  }

  if (key == "WEATHER_MCP_REDIS_DB") {
    const auto db = parse_integer(key, value);
    if (db < 0) {
      throw std::runtime_error("WEATHER_MCP_REDIS_DB must be greater than or equal to 0");
    }
    config.cache.db = static_cast<int>(db);
    return;
  }

  if (key == "WEATHER_MCP_REDIS_PREFIX") {
    if (value.empty()) {
      throw std::runtime_error("WEATHER_MCP_REDIS_PREFIX must not be empty");
    }
    config.cache.key_prefix = value;
    return;
  }

  if (key == "WEATHER_MCP_CACHE_TTL_S") {
    const auto ttl = parse_integer(key, value);
    if (ttl <= 0 || ttl > 86400 * 30) {
      throw std::runtime_error("WEATHER_MCP_CACHE_TTL_S must be in range 1..2592000");
    }
    config.cache.ttl_seconds = static_cast<std::uint32_t>(ttl);
    return;
  }

  if (key == "WEATHER_MCP_VERBOSE") {
    config.verbose = parse_bool(value);
  }
}

}  // namespace

Settings load_env_file(const std::string& path) {
  Settings settings;

  std::ifstream input(path);
  if (!input.is_open()) {
    return settings;
  }

  std::string line;
  while (std::getline(input, line)) {
    std::string stripped = trim(line);
    if (stripped.empty() || stripped.front() == '#') {
      continue;
    }

    if (stripped.rfind("export ", 0) == 0) {
      stripped = trim(stripped.substr(std::string("export ").size()));
    }

    const auto equals_pos = stripped.find('=');
    if (equals_pos == std::string::npos || equals_pos == 0) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, equals_pos));
    settings[key] = unquote(trim(stripped.substr(equals_pos + 1)));
  }

  return settings;
}

ServerConfig build_server_config(const Settings& settings) {
  ServerConfig config{};
  for (const auto* key : kKnownKeys) {
    if (const auto it = settings.find(key); it != settings.end()) {
      apply_key_value(config, key, trim(it->second));
    }
  }
  return config;
}

ServerConfig load_server_config(const std::string& env_file_path) {
  Settings settings = load_env_file(env_file_path);
  for (const auto* key : kKnownKeys) {
    if (const auto* value = std::getenv(key); value != nullptr) {
      settings[key] = value;
    }
  }
  return build_server_config(settings);
}

}  // namespace weather_mcp::core
