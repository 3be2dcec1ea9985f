#pragma once

#include <memory>

#include "mcp/tools.hpp"
#include "weather/client.hpp"

namespace weather_mcp::weather {

// Registers get_weather and get_weather_forecast, in that order.
mcp::ToolRegistry build_weather_tools(std::shared_ptr<const WeatherClient> client);

}  // namespace weather_mcp::weather
