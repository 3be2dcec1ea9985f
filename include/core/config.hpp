#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace weather_mcp::core {

using Settings = std::unordered_map<std::string, std::string>;

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"weather:mcp"};
  std::uint32_t connect_timeout_ms{1000};
  std::uint32_t ttl_seconds{300};
  bool enabled{false};
};

struct WeatherConfig {
  std::string api_key{};
  std::string base_url{"https://api.openweathermap.org/data/2.5"};
  std::uint32_t request_timeout_ms{10000};
};

struct ServerConfig {
  WeatherConfig weather{};
  RedisConfig cache{};
  bool verbose{false};
};

// Reads KEY=VALUE lines. A missing file yields no settings.
Settings load_env_file(const std::string& path);

// Throws std::runtime_error naming the offending key.
ServerConfig build_server_config(const Settings& settings);

// .env file values overridden by the process environment.
ServerConfig load_server_config(const std::string& env_file_path);

}  // namespace weather_mcp::core
