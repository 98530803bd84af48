#pragma once
#include "weathermcp/tools/registry.hpp"
#include "weathermcp/weather/source.hpp"

#include <memory>
#include <string>
#include <vector>

namespace weathermcp::weather
{

std::string format_live_report(const std::vector<LiveConditions>& lives);
std::string format_forecast(const std::vector<Forecast>& forecasts);

/// Structured current conditions for get_weather.
Json conditions_to_json(const std::string& location, const LiveConditions& live);

tools::Tool make_get_weather_tool(std::shared_ptr<WeatherSource> source);
tools::Tool make_get_alerts_tool(std::shared_ptr<WeatherSource> source);
tools::Tool make_get_forecast_tool(std::shared_ptr<WeatherSource> source);

/// Register get_weather, get_alerts and get_forecast.
void register_weather_tools(tools::ToolRegistry& registry, std::shared_ptr<WeatherSource> source);

} // namespace weathermcp::weather
