#include "weather/report.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "weather/client.hpp"

namespace weather_mcp::weather {

namespace {

const char* temperature_symbol(const Units units) {
  switch (units) {
    case Units::kMetric:
      return "°C";
    case Units::kImperial:
      return "°F";
    case Units::kKelvin:
      return "K";
  }
  return "";
}

const char* speed_unit(const Units units) {
  return units == Units::kImperial ? "mph" : "m/s";
}

std::string format_number(const nlohmann::json& value) {
  if (value.is_number_integer() || value.is_number_unsigned()) {
    return std::to_string(value.get<long long>());
  }
  std::ostringstream out;
  out << value.get<double>();
  return out.str();
}

std::string format_fixed(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value;
  return out.str();
}

int hour_of(const std::string& dt_txt) {
  const auto space = dt_txt.find(' ');
  if (space == std::string::npos || space + 3 > dt_txt.size()) {
    return 12;
  }
  return std::atoi(dt_txt.substr(space + 1, 2).c_str());
}

std::string day_label(const std::string& date) {
  std::tm tm{};
  std::istringstream in(date);
  in >> std::get_time(&tm, "%Y-%m-%d");
  if (in.fail()) {
    return date;
  }
  tm.tm_hour = 12;
  tm.tm_isdst = -1;
  if (std::mktime(&tm) == static_cast<std::time_t>(-1)) {
    return date;
  }
  std::ostringstream out;
  out << std::put_time(&tm, "%A, %B %d");
  return out.str();
}

struct DailyForecast {
  std::string date;
  std::vector<const nlohmann::json*> entries;
};

// Upstream returns 3-hour slots; group them by calendar date keeping order.
std::vector<DailyForecast> group_by_date(const nlohmann::json& list) {
  std::vector<DailyForecast> days;
  for (const auto& entry : list) {
    const auto dt_txt = entry.at("dt_txt").get<std::string>();
    const auto date = dt_txt.substr(0, dt_txt.find(' '));
    if (days.empty() || days.back().date != date) {
      days.push_back(DailyForecast{.date = date, .entries = {}});
    }
    days.back().entries.push_back(&entry);
  }
  return days;
}

}  // namespace

std::string title_case(const std::string& text) {
  std::string out = text;
  bool word_start = true;
  for (auto& c : out) {
    const auto byte = static_cast<unsigned char>(c);
    if (std::isalpha(byte) != 0) {
      c = static_cast<char>(word_start ? std::toupper(byte) : std::tolower(byte));
      word_start = false;
    } else {
      word_start = true;
    }
  }
  return out;
}

std::string format_current_report(const nlohmann::json& payload, const Units units) {
  const auto& readings = payload.at("main");
  const std::string symbol = temperature_symbol(units);

  std::ostringstream report;
  report << "🌤️ Weather Report for " << payload.at("name").get<std::string>() << ", "
         << payload.at("sys").at("country").get<std::string>() << "\n\n"
         << "🌡️ Temperature: " << format_number(readings.at("temp")) << symbol << " (feels like "
         << format_number(readings.at("feels_like")) << symbol << ")\n"
         << "☁️ Conditions: " << title_case(payload.at("weather").at(0).at("description").get<std::string>()) << '\n'
         << "💧 Humidity: " << format_number(readings.at("humidity")) << "%\n"
         << "🌪️ Wind Speed: " << format_number(payload.at("wind").at("speed")) << ' ' << speed_unit(units) << '\n'
         << "📊 Pressure: " << format_number(readings.at("pressure")) << " hPa";
  return report.str();
}

std::string format_forecast_report(const nlohmann::json& payload, const Units units, const int days) {
  const auto& city = payload.at("city");
  const auto grouped = group_by_date(payload.at("list"));
  if (grouped.empty()) {
    throw std::invalid_argument("forecast list is empty");
  }

  const std::string symbol = temperature_symbol(units);
  const auto count = std::min(grouped.size(), static_cast<std::size_t>(std::max(days, 0)));

  std::ostringstream report;
  report << "📅 " << days << "-Day Weather Forecast for " << city.at("name").get<std::string>() << ", "
         << city.at("country").get<std::string>() << "\n\n";

  for (std::size_t i = 0; i < count; ++i) {
    const auto& day = grouped[i];

    const auto* midday = *std::min_element(day.entries.begin(), day.entries.end(),
                                           [](const nlohmann::json* a, const nlohmann::json* b) {
                                             return std::abs(12 - hour_of(a->at("dt_txt").get<std::string>())) <
                                                    std::abs(12 - hour_of(b->at("dt_txt").get<std::string>()));
                                           });

    double temp_min = day.entries.front()->at("main").at("temp_min").get<double>();
    double temp_max = day.entries.front()->at("main").at("temp_max").get<double>();
    for (const auto* entry : day.entries) {
      temp_min = std::min(temp_min, entry->at("main").at("temp_min").get<double>());
      temp_max = std::max(temp_max, entry->at("main").at("temp_max").get<double>());
    }

    report << "🗓️ " << day_label(day.date) << '\n'
           << "   🌡️ " << format_fixed(temp_min) << symbol << " - " << format_fixed(temp_max) << symbol << '\n'
           << "   ☁️ " << title_case(midday->at("weather").at(0).at("description").get<std::string>()) << '\n'
           << "   💧 Humidity: " << format_number(midday->at("main").at("humidity")) << "%\n";
    if (i + 1 < count) {
      report << '\n';
    }
  }
  return report.str();
}

}  // namespace weather_mcp::weather
