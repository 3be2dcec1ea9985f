#include "weather/client.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "weather/cache.hpp"
#include "weather/report.hpp"

namespace weather_mcp::weather {

namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// OpenWeatherMap calls kelvin output "standard".
const char* units_query_value(const Units units) {
  return units == Units::kKelvin ? "standard" : units_name(units);
}

}  // namespace

std::optional<Units> parse_units(std::string_view value) {
  if (value == "metric") {
    return Units::kMetric;
  }
  if (value == "imperial") {
    return Units::kImperial;
  }
  if (value == "kelvin") {
    return Units::kKelvin;
  }
  return std::nullopt;
}

const char* units_name(const Units units) {
  switch (units) {
    case Units::kMetric:
      return "metric";
    case Units::kImperial:
      return "imperial";
    case Units::kKelvin:
      return "kelvin";
  }
  return "metric";
}

std::string describe(const FetchError& error) {
  switch (error.kind) {
    case FetchErrorKind::kMissingCredential:
      return "OPENWEATHER_API_KEY environment variable not set";
    case FetchErrorKind::kEmptyLocation:
      return "No location provided";
    case FetchErrorKind::kInvalidArgument:
      return "Invalid argument: " + error.detail;
    case FetchErrorKind::kNotFound:
      return "Location '" + error.detail + "' not found";
    case FetchErrorKind::kHttpError:
      return "Weather API returned HTTP " + std::to_string(error.http_status) +
             (error.detail.empty() ? std::string() : " - " + error.detail);
    case FetchErrorKind::kNetworkFailure:
      return "Network failure: " + error.detail;
    case FetchErrorKind::kMalformedResponse:
      return "Malformed weather API response: " + error.detail;
  }
  return "Unknown weather error";
}

std::string url_encode(std::string_view value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    const auto byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(c);
    } else if (c == ' ') {
      out.push_back('+');
    } else {
      out.push_back('%');
      out.push_back(kHex[byte >> 4U]);
      out.push_back(kHex[byte & 0x0FU]);
    }
  }
  return out;
}

WeatherClient::WeatherClient(core::WeatherConfig config, std::shared_ptr<const HttpClient> http,
                             std::shared_ptr<ReportCache> cache)
    : config_(std::move(config)), http_(std::move(http)), cache_(std::move(cache)) {}

FetchResult WeatherClient::current(const std::string& location, const FetchOptions& options) const {
  return fetch(Endpoint::kCurrent, location, options);
}

FetchResult WeatherClient::forecast(const std::string& location, const FetchOptions& options) const {
  return fetch(Endpoint::kForecast, location, options);
}

FetchResult WeatherClient::fetch(const Endpoint endpoint, const std::string& location,
                                 const FetchOptions& options) const {
  const std::string query = trim(location);
  if (query.empty()) {
    return FetchError{.kind = FetchErrorKind::kEmptyLocation};
  }
  if (config_.api_key.empty()) {
    return FetchError{.kind = FetchErrorKind::kMissingCredential};
  }

  Units units = Units::kMetric;
  if (options.units.has_value()) {
    const auto parsed = parse_units(*options.units);
    if (!parsed.has_value()) {
      return FetchError{.kind = FetchErrorKind::kInvalidArgument,
                        .detail = "units must be one of metric, imperial, kelvin"};
    }
    units = *parsed;
  }

  const int days = options.days.value_or(kMaxForecastDays);
  if (days < kMinForecastDays || days > kMaxForecastDays) {
    return FetchError{.kind = FetchErrorKind::kInvalidArgument, .detail = "days must be between 1 and 5"};
  }

  std::string cache_key = endpoint == Endpoint::kCurrent ? "current:" : "forecast:";
  cache_key += units_name(units);
  if (endpoint == Endpoint::kForecast) {
    cache_key += ":" + std::to_string(days);
  }
  cache_key += ":" + to_lower(query);

  if (cache_ != nullptr) {
    if (auto cached = cache_->get(cache_key); cached.has_value()) {
      return std::move(*cached);
    }
  }

  const std::string url = config_.base_url + (endpoint == Endpoint::kCurrent ? "/weather" : "/forecast") +
                          "?q=" + url_encode(query) + "&appid=" + url_encode(config_.api_key) +
                          "&units=" + units_query_value(units);

  const auto response = http_->get(url);
  if (!response.transport_error.empty()) {
    return FetchError{.kind = FetchErrorKind::kNetworkFailure, .detail = response.transport_error};
  }
  if (response.status == 404) {
    return FetchError{.kind = FetchErrorKind::kNotFound, .detail = query, .http_status = 404};
  }
  if (response.status != 200) {
    std::string message;
    const auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_object() && body.contains("message") && body["message"].is_string()) {
      message = body["message"].get<std::string>();
    }
    return FetchError{.kind = FetchErrorKind::kHttpError, .detail = message, .http_status = response.status};
  }

  std::string report;
  try {
    const auto payload = nlohmann::json::parse(response.body);
    report = endpoint == Endpoint::kCurrent ? format_current_report(payload, units)
                                            : format_forecast_report(payload, units, days);
  } catch (const std::exception& ex) {
    return FetchError{.kind = FetchErrorKind::kMalformedResponse, .detail = ex.what()};
  }

  if (cache_ != nullptr) {
    cache_->put(cache_key, report);
  }
  return report;
}

}  // namespace weather_mcp::weather
