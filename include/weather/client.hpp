#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "core/config.hpp"
#include "weather/http.hpp"

namespace weather_mcp::weather {

class ReportCache;

enum class Units { kMetric, kImperial, kKelvin };

std::optional<Units> parse_units(std::string_view value);
const char* units_name(Units units);

enum class FetchErrorKind {
  kMissingCredential,
  kEmptyLocation,
  kInvalidArgument,
  kNotFound,
  kHttpError,
  kNetworkFailure,
  kMalformedResponse,
};

struct FetchError {
  FetchErrorKind kind;
  std::string detail{};
  long http_status{0};
};

// Human-readable, single-line description of a fetch failure.
std::string describe(const FetchError& error);

using FetchResult = std::variant<std::string, FetchError>;

struct FetchOptions {
  std::optional<std::string> units{};
  std::optional<int> days{};
};

constexpr int kMinForecastDays = 1;
constexpr int kMaxForecastDays = 5;

// OpenWeatherMap client producing formatted text reports. Expected failures are
// returned, never thrown.
class WeatherClient {
 public:
  WeatherClient(core::WeatherConfig config, std::shared_ptr<const HttpClient> http,
                std::shared_ptr<ReportCache> cache = nullptr);

  FetchResult current(const std::string& location, const FetchOptions& options) const;
  FetchResult forecast(const std::string& location, const FetchOptions& options) const;

 private:
  enum class Endpoint { kCurrent, kForecast };

  FetchResult fetch(Endpoint endpoint, const std::string& location, const FetchOptions& options) const;

  core::WeatherConfig config_;
  std::shared_ptr<const HttpClient> http_;
  std::shared_ptr<ReportCache> cache_;
};

std::string url_encode(std::string_view value);

}  // namespace weather_mcp::weather
