#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "mcp/server.hpp"
#include "weather/cache.hpp"
#include "weather/client.hpp"
#include "weather/http.hpp"
#include "weather/report.hpp"
#include "weather/tools.hpp"

using weather_mcp::core::WeatherConfig;
using weather_mcp::weather::FetchError;
using weather_mcp::weather::FetchErrorKind;
using weather_mcp::weather::FetchOptions;
using weather_mcp::weather::FetchResult;
using weather_mcp::weather::HttpClient;
using weather_mcp::weather::HttpResponse;
using weather_mcp::weather::ReportCache;
using weather_mcp::weather::Units;
using weather_mcp::weather::WeatherClient;

namespace {

const char* kCurrentPayload = R"({
  "name": "London",
  "sys": {"country": "GB"},
  "main": {"temp": 15.5, "feels_like": 14.2, "humidity": 72, "pressure": 1013},
  "weather": [{"description": "light rain"}],
  "wind": {"speed": 4.1}
})";

const char* kForecastPayload = R"({
  "city": {"name": "Oslo", "country": "NO"},
  "list": [
    {"dt_txt": "2024-01-15 09:00:00", "main": {"temp": 6.0, "temp_min": 5.0, "temp_max": 8.0, "humidity": 80}, "weather": [{"description": "fog"}]},
    {"dt_txt": "2024-01-15 12:00:00", "main": {"temp": 7.0, "temp_min": 3.5, "temp_max": 10.0, "humidity": 60}, "weather": [{"description": "scattered clouds"}]},
    {"dt_txt": "2024-01-15 15:00:00", "main": {"temp": 6.5, "temp_min": 6.0, "temp_max": 9.0, "humidity": 70}, "weather": [{"description": "mist"}]},
    {"dt_txt": "2024-01-16 12:00:00", "main": {"temp": 2.0, "temp_min": -1.0, "temp_max": 2.5, "humidity": 90}, "weather": [{"description": "snow"}]},
    {"dt_txt": "2024-01-17 00:00:00", "main": {"temp": 1.0, "temp_min": 0.0, "temp_max": 1.0, "humidity": 95}, "weather": [{"description": "clear sky"}]}
  ]
})";

class FakeHttpClient : public HttpClient {
 public:
  explicit FakeHttpClient(HttpResponse response) : response_(std::move(response)) {}

  HttpResponse get(const std::string& url) const override {
    urls_.push_back(url);
    return response_;
  }

  const std::vector<std::string>& urls() const { return urls_; }

 private:
  HttpResponse response_;
  mutable std::vector<std::string> urls_;
};

class MemoryCache : public ReportCache {
 public:
  std::optional<std::string> get(const std::string& key) override {
    ++lookups;
    const auto it = entries.find(key);
    if (it == entries.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void put(const std::string& key, const std::string& report) override { entries[key] = report; }

  std::map<std::string, std::string> entries;
  int lookups{0};
};

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

WeatherConfig test_config(const std::string& api_key = "KEY") {
  WeatherConfig config;
  config.api_key = api_key;
  config.base_url = "https://api.test/data/2.5";
  return config;
}

std::shared_ptr<FakeHttpClient> ok_http(const char* body) {
  return std::make_shared<FakeHttpClient>(HttpResponse{.status = 200, .body = body, .transport_error = {}});
}

const FetchError* error_of(const FetchResult& result) {
  return std::get_if<FetchError>(&result);
}

int test_current_report_and_request_url() {
  const auto http = ok_http(kCurrentPayload);
  const WeatherClient client(test_config(), http);

  const auto result = client.current("New York", FetchOptions{});
  const auto* report = std::get_if<std::string>(&result);
  if (report == nullptr) {
    return fail("test_current_report_and_request_url", "expected a report");
  }

  const std::string expected =
      "🌤️ Weather Report for London, GB\n\n"
      "🌡️ Temperature: 15.5°C (feels like 14.2°C)\n"
      "☁️ Conditions: Light Rain\n"
      "💧 Humidity: 72%\n"
      "🌪️ Wind Speed: 4.1 m/s\n"
      "📊 Pressure: 1013 hPa";
  if (*report != expected) {
    return fail("test_current_report_and_request_url", "report text mismatch");
  }

  if (http->urls().size() != 1 ||
      http->urls()[0] != "https://api.test/data/2.5/weather?q=New+York&appid=KEY&units=metric") {
    return fail("test_current_report_and_request_url", "request URL mismatch");
  }
  return 0;
}

int test_units_change_symbols_and_query() {
  const auto http = ok_http(kCurrentPayload);
  const WeatherClient client(test_config(), http);

  const auto imperial = client.current("London", FetchOptions{.units = "imperial", .days = std::nullopt});
  const auto* report = std::get_if<std::string>(&imperial);
  if (report == nullptr || report->find("15.5°F") == std::string::npos || report->find("4.1 mph") == std::string::npos) {
    return fail("test_units_change_symbols_and_query", "imperial symbols missing");
  }

  const auto kelvin = client.current("London", FetchOptions{.units = "kelvin", .days = std::nullopt});
  if (!std::holds_alternative<std::string>(kelvin) || http->urls().back().find("units=standard") == std::string::npos) {
    return fail("test_units_change_symbols_and_query", "kelvin should query standard units");
  }
  return 0;
}

int test_precondition_failures_skip_network() {
  const auto http = ok_http(kCurrentPayload);
  const WeatherClient client(test_config(), http);

  const auto empty = client.current("   ", FetchOptions{});
  if (error_of(empty) == nullptr || error_of(empty)->kind != FetchErrorKind::kEmptyLocation) {
    return fail("test_precondition_failures_skip_network", "blank location should be rejected");
  }

  const WeatherClient keyless(test_config(""), http);
  const auto missing_key = keyless.current("London", FetchOptions{});
  if (error_of(missing_key) == nullptr || error_of(missing_key)->kind != FetchErrorKind::kMissingCredential) {
    return fail("test_precondition_failures_skip_network", "missing key should be reported");
  }

  const auto bad_units = client.current("London", FetchOptions{.units = "rankine", .days = std::nullopt});
  if (error_of(bad_units) == nullptr || error_of(bad_units)->kind != FetchErrorKind::kInvalidArgument) {
    return fail("test_precondition_failures_skip_network", "unknown units should be rejected");
  }

  const auto bad_days = client.forecast("London", FetchOptions{.units = std::nullopt, .days = 6});
  if (error_of(bad_days) == nullptr || error_of(bad_days)->kind != FetchErrorKind::kInvalidArgument) {
    return fail("test_precondition_failures_skip_network", "days above 5 should be rejected");
  }

  if (!http->urls().empty()) {
    return fail("test_precondition_failures_skip_network", "no request should have been made");
  }
  return 0;
}

int test_upstream_failures_are_typed() {
  const auto not_found = std::make_shared<FakeHttpClient>(
      HttpResponse{.status = 404, .body = R"({"cod":"404","message":"city not found"})", .transport_error = {}});
  const auto result = WeatherClient(test_config(), not_found).current("Atlantis", FetchOptions{});
  if (error_of(result) == nullptr || error_of(result)->kind != FetchErrorKind::kNotFound ||
      describe(*error_of(result)) != "Location 'Atlantis' not found") {
    return fail("test_upstream_failures_are_typed", "404 should map to not found");
  }

  const auto unauthorized = std::make_shared<FakeHttpClient>(
      HttpResponse{.status = 401, .body = R"({"cod":401,"message":"Invalid API key"})", .transport_error = {}});
  const auto denied = WeatherClient(test_config(), unauthorized).current("London", FetchOptions{});
  if (error_of(denied) == nullptr || error_of(denied)->kind != FetchErrorKind::kHttpError ||
      error_of(denied)->http_status != 401 || describe(*error_of(denied)) != "Weather API returned HTTP 401 - Invalid API key") {
    return fail("test_upstream_failures_are_typed", "401 should map to an HTTP error");
  }

  const auto offline = std::make_shared<FakeHttpClient>(
      HttpResponse{.status = 0, .body = {}, .transport_error = "Could not resolve host: api.test"});
  const auto unreachable = WeatherClient(test_config(), offline).current("London", FetchOptions{});
  if (error_of(unreachable) == nullptr || error_of(unreachable)->kind != FetchErrorKind::kNetworkFailure ||
      describe(*error_of(unreachable)).find("Could not resolve host") == std::string::npos) {
    return fail("test_upstream_failures_are_typed", "transport errors should map to network failure");
  }

  const auto garbage = WeatherClient(test_config(), ok_http(R"({"name":"London"})")).current("London", FetchOptions{});
  if (error_of(garbage) == nullptr || error_of(garbage)->kind != FetchErrorKind::kMalformedResponse) {
    return fail("test_upstream_failures_are_typed", "incomplete payload should be malformed");
  }
  return 0;
}

int test_forecast_groups_days() {
  const auto http = ok_http(kForecastPayload);
  const WeatherClient client(test_config(), http);

  const auto result = client.forecast("Oslo", FetchOptions{.units = std::nullopt, .days = 2});
  const auto* report = std::get_if<std::string>(&result);
  if (report == nullptr) {
    return fail("test_forecast_groups_days", "expected a report");
  }
  if (report->rfind("📅 2-Day Weather Forecast for Oslo, NO\n\n", 0) != 0) {
    return fail("test_forecast_groups_days", "header mismatch");
  }
  if (report->find("Monday, January 15") == std::string::npos ||
      report->find("Tuesday, January 16") == std::string::npos) {
    return fail("test_forecast_groups_days", "day labels missing");
  }
  if (report->find("January 17") != std::string::npos) {
    return fail("test_forecast_groups_days", "forecast should be limited to two days");
  }
  if (report->find("3.5°C - 10.0°C") == std::string::npos || report->find("Scattered Clouds") == std::string::npos ||
      report->find("Humidity: 60%") == std::string::npos) {
    return fail("test_forecast_groups_days", "first day should use daily extremes and the midday entry");
  }
  if (http->urls().back() != "https://api.test/data/2.5/forecast?q=Oslo&appid=KEY&units=metric") {
    return fail("test_forecast_groups_days", "forecast URL mismatch");
  }
  return 0;
}

int test_cache_hits_skip_network() {
  const auto http = ok_http(kCurrentPayload);
  const auto cache = std::make_shared<MemoryCache>();
  const WeatherClient client(test_config(), http, cache);

  const auto first = client.current(" London ", FetchOptions{});
  const auto second = client.current("london", FetchOptions{});
  if (!std::holds_alternative<std::string>(first) || !std::holds_alternative<std::string>(second) ||
      std::get<std::string>(first) != std::get<std::string>(second)) {
    return fail("test_cache_hits_skip_network", "cached report should equal the fetched one");
  }
  if (http->urls().size() != 1 || cache->lookups != 2) {
    return fail("test_cache_hits_skip_network", "second lookup should be served from cache");
  }
  if (cache->entries.count("current:metric:london") != 1) {
    return fail("test_cache_hits_skip_network", "cache key mismatch");
  }

  const auto imperial = client.current("london", FetchOptions{.units = "imperial", .days = std::nullopt});
  if (http->urls().size() != 2 || !std::holds_alternative<std::string>(imperial)) {
    return fail("test_cache_hits_skip_network", "units must be part of the cache key");
  }
  return 0;
}

int test_weather_tools_registry() {
  const auto http = ok_http(kForecastPayload);
  const auto client = std::make_shared<WeatherClient>(test_config(), http);
  const auto registry = weather_mcp::weather::build_weather_tools(client);

  if (registry.size() != 2 || registry.tools()[0].name != "get_weather" ||
      registry.tools()[1].name != "get_weather_forecast") {
    return fail("test_weather_tools_registry", "tool names or order mismatch");
  }

  const auto& forecast_schema = registry.tools()[1].input_schema;
  if (forecast_schema["required"][0] != "location" || forecast_schema["properties"]["days"]["maximum"] != 5 ||
      forecast_schema["properties"]["units"]["default"] != "metric") {
    return fail("test_weather_tools_registry", "forecast schema mismatch");
  }

  const auto* forecast = registry.find("get_weather_forecast");
  const auto fractional = forecast->handler(weather_mcp::mcp::json{{"location", "Oslo"}, {"days", 2.5}});
  if (!std::holds_alternative<weather_mcp::mcp::ToolFailure>(fractional)) {
    return fail("test_weather_tools_registry", "fractional days should fail");
  }

  const auto wrong_type = forecast->handler(weather_mcp::mcp::json{{"location", 42}});
  if (!std::holds_alternative<weather_mcp::mcp::ToolFailure>(wrong_type)) {
    return fail("test_weather_tools_registry", "non-string location should fail");
  }

  const auto ok = forecast->handler(weather_mcp::mcp::json{{"location", "Oslo"}, {"days", 1}});
  if (!std::holds_alternative<std::string>(ok) || std::get<std::string>(ok).find("1-Day") == std::string::npos) {
    return fail("test_weather_tools_registry", "forecast tool should pass days through");
  }
  return 0;
}

int test_tool_failures_reach_the_client() {
  const auto http = ok_http(kCurrentPayload);
  const auto client = std::make_shared<WeatherClient>(test_config(""), http);
  const weather_mcp::mcp::Server server(weather_mcp::weather::build_weather_tools(client));

  const auto out = server.handle(
      R"({"jsonrpc":"2.0","id":21,"method":"tools/call","params":{"name":"get_weather","arguments":{"location":"London"}}})");
  if (!out.has_value()) {
    return fail("test_tool_failures_reach_the_client", "expected a response");
  }
  const auto response = nlohmann::json::parse(*out);
  if (response["id"] != 21 || response["error"]["code"] != -32603 ||
      response["error"]["message"] != "Tool execution error: OPENWEATHER_API_KEY environment variable not set") {
    return fail("test_tool_failures_reach_the_client", "missing credential should surface as -32603");
  }
  return 0;
}

int test_title_case() {
  if (weather_mcp::weather::title_case("overcast clouds") != "Overcast Clouds" ||
      weather_mcp::weather::title_case("LIGHT intensity drizzle") != "Light Intensity Drizzle") {
    return fail("test_title_case", "title case mismatch");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_current_report_and_request_url(); rc != 0) {
    return rc;
  }
  if (int rc = test_units_change_symbols_and_query(); rc != 0) {
    return rc;
  }
  if (int rc = test_precondition_failures_skip_network(); rc != 0) {
    return rc;
  }
  if (int rc = test_upstream_failures_are_typed(); rc != 0) {
    return rc;
  }
  if (int rc = test_forecast_groups_days(); rc != 0) {
    return rc;
  }
  if (int rc = test_cache_hits_skip_network(); rc != 0) {
    return rc;
  }
  if (int rc = test_weather_tools_registry(); rc != 0) {
    return rc;
  }
  if (int rc = test_tool_failures_reach_the_client(); rc != 0) {
    return rc;
  }
  if (int rc = test_title_case(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] weather unit tests\n";
  return 0;
}
