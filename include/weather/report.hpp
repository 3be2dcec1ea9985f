#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace weather_mcp::weather {

enum class Units;

// Both formatters throw nlohmann::json::exception on payloads missing the
// expected fields, and std::invalid_argument on an empty forecast list.
std::string format_current_report(const nlohmann::json& payload, Units units);
std::string format_forecast_report(const nlohmann::json& payload, Units units, int days);

std::string title_case(const std::string& text);

}  // namespace weather_mcp::weather
