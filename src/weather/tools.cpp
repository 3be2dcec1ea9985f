#include "weather/tools.hpp"

#include <cmath>
#include <string>
#include <utility>
#include <variant>

namespace weather_mcp::weather {

namespace {

using mcp::json;

json location_property() {
  return json{{"type", "string"}, {"description", "City name (e.g., 'London', 'New York', 'Jakarta')"}};
}

json units_property() {
  return json{{"type", "string"},
              {"description", "Temperature units (metric for Celsius, imperial for Fahrenheit, kelvin for Kelvin)"},
              {"enum", {"metric", "imperial", "kelvin"}},
              {"default", "metric"}};
}

// Argument extraction mirrors the advertised schema; violations become
// invalid-argument fetch errors rather than protocol errors.
std::variant<std::string, FetchError> read_location(const json& arguments) {
  const auto it = arguments.find("location");
  if (it == arguments.end() || it->is_null()) {
    return std::string();
  }
  if (!it->is_string()) {
    return FetchError{.kind = FetchErrorKind::kInvalidArgument, .detail = "location must be a string"};
  }
  return it->get<std::string>();
}

std::variant<FetchOptions, FetchError> read_options(const json& arguments, const bool with_days) {
  FetchOptions options;

  if (const auto it = arguments.find("units"); it != arguments.end() && !it->is_null()) {
    if (!it->is_string()) {
      return FetchError{.kind = FetchErrorKind::kInvalidArgument, .detail = "units must be a string"};
    }
    options.units = it->get<std::string>();
  }

  if (!with_days) {
    return options;
  }

  if (const auto it = arguments.find("days"); it != arguments.end() && !it->is_null()) {
    if (!it->is_number()) {
      return FetchError{.kind = FetchErrorKind::kInvalidArgument, .detail = "days must be a number"};
    }
    const double days = it->get<double>();
    if (std::floor(days) != days || days < kMinForecastDays || days > kMaxForecastDays) {
      return FetchError{.kind = FetchErrorKind::kInvalidArgument, .detail = "days must be a whole number between 1 and 5"};
    }
    options.days = static_cast<int>(days);
  }
  return options;
}

mcp::ToolResult to_tool_result(FetchResult result) {
  if (auto* error = std::get_if<FetchError>(&result)) {
    return mcp::ToolFailure{.message = describe(*error)};
  }
  return std::move(std::get<std::string>(result));
}

template <typename Fetch>
mcp::ToolResult run_tool(const json& arguments, const bool with_days, Fetch&& fetch) {
  auto location = read_location(arguments);
  if (auto* error = std::get_if<FetchError>(&location)) {
    return mcp::ToolFailure{.message = describe(*error)};
  }
  auto options = read_options(arguments, with_days);
  if (auto* error = std::get_if<FetchError>(&options)) {
    return mcp::ToolFailure{.message = describe(*error)};
  }
  return to_tool_result(fetch(std::get<std::string>(location), std::get<FetchOptions>(options)));
}

}  // namespace

mcp::ToolRegistry build_weather_tools(std::shared_ptr<const WeatherClient> client) {
  mcp::ToolRegistry registry;

  registry.add(mcp::Tool{
      .name = "get_weather",
      .description = "Get current weather for a location",
      .input_schema = json{{"type", "object"},
                           {"properties", {{"location", location_property()}, {"units", units_property()}}},
                           {"required", json::array({"location"})}},
      .handler = [client](const json& arguments) {
        return run_tool(arguments, false, [&client](const std::string& location, const FetchOptions& options) {
          return client->current(location, options);
        });
      }});

  registry.add(mcp::Tool{
      .name = "get_weather_forecast",
      .description = "Get a daily weather forecast (up to 5 days) for a location",
      .input_schema = json{{"type", "object"},
                           {"properties",
                            {{"location", location_property()},
                             {"units", units_property()},
                             {"days",
                              {{"type", "number"},
                               {"description", "Number of days to forecast (1-5)"},
                               {"minimum", kMinForecastDays},
                               {"maximum", kMaxForecastDays},
                               {"default", kMaxForecastDays}}}}},
                           {"required", json::array({"location"})}},
      .handler = [client](const json& arguments) {
        return run_tool(arguments, true, [&client](const std::string& location, const FetchOptions& options) {
          return client->forecast(location, options);
        });
      }});

  return registry;
}

}  // namespace weather_mcp::weather
