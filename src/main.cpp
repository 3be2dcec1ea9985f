#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <signal.h>

#include <curl/curl.h>

#include "core/config.hpp"
#include "mcp/server.hpp"
#include "mcp/transport.hpp"
#include "weather/cache.hpp"
#include "weather/client.hpp"
#include "weather/http.hpp"
#include "weather/tools.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

// No SA_RESTART: a blocking read on stdin must return so the loop sees the flag.
void install_signal_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_shutdown_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  std::signal(SIGPIPE, SIG_IGN);
}

std::string format_config_settings(const weather_mcp::core::ServerConfig& config, const std::string& env_path) {
  std::ostringstream output;
  output << "[weather-mcp] env file " << env_path
         << " | api_key=" << (config.weather.api_key.empty() ? "missing" : "set")
         << " | base_url=" << config.weather.base_url
         << " | timeout_ms=" << config.weather.request_timeout_ms
         << " | cache_enabled=" << (config.cache.enabled ? "true" : "false");

  if (config.cache.enabled) {
    output << " | redis_address=";
    if (!config.cache.unix_socket.empty()) {
      output << "unix://" << config.cache.unix_socket;
    } else {
      output << config.cache.host << ':' << config.cache.port;
    }
    output << " | cache_ttl_s=" << config.cache.ttl_seconds;
  }
  output << " | verbose=" << (config.verbose ? "true" : "false");
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  const weather_mcp::mcp::ServerInfo info{};
  if (argc > 1 && std::strcmp(argv[1], "--version") == 0) {
    std::cout << info.name << ' ' << info.version << '\n';
    return 0;
  }

  install_signal_handlers();

  const std::string env_path = argc > 1 ? argv[1] : ".env";

  weather_mcp::core::ServerConfig config{};
  try {
    config = weather_mcp::core::load_server_config(env_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, env_path) << '\n';

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "[weather-mcp] failed to initialize libcurl\n";
    return 1;
  }

  std::shared_ptr<weather_mcp::weather::ReportCache> cache;
  if (config.cache.enabled) {
    cache = std::make_shared<weather_mcp::weather::RedisReportCache>(config.cache);
  }

  auto http = std::make_shared<weather_mcp::weather::CurlHttpClient>(config.weather.request_timeout_ms);
  auto client = std::make_shared<weather_mcp::weather::WeatherClient>(config.weather, http, cache);

  int status = 0;
  try {
    const weather_mcp::mcp::Server server(weather_mcp::weather::build_weather_tools(client), info);
    weather_mcp::mcp::StdioTransport transport(
        weather_mcp::mcp::TransportOptions{.verbose = config.verbose, .stop_requested = &g_shutdown_requested});
    status = transport.run(std::cin, std::cout, std::cerr, server);
  } catch (const std::exception& ex) {
    std::cerr << "[weather-mcp] fatal: " << ex.what() << '\n';
    status = 1;
  }

  curl_global_cleanup();
  return status;
}
