#include "weathermcp/weather/tools.hpp"

#include "weathermcp/exceptions.hpp"
#include "weathermcp/logging.hpp"

#include <cstdlib>
#include <sstream>

namespace weathermcp::weather
{

namespace
{
using util::schema::Schema;

Json temperature_value(const std::string& text)
{
    if (text.empty())
        return nullptr;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0')
        return nullptr;
    return v;
}

std::string require_text(const tools::Arguments& args, const std::string& name)
{
    std::string value = args.get_string(name);
    if (value.empty())
        throw ToolError(WeatherSource::kInvalidLocation, "argument '" + name + "' must not be empty");
    return value;
}
} // namespace

std::string format_live_report(const std::vector<LiveConditions>& lives)
{
    if (lives.empty())
        return "No active alerts found.";

    std::ostringstream out;
    for (const auto& live : lives)
    {
        out << "Province: " << live.province << "\n"
            << "City: " << live.city << "\n"
            << "Weather: " << live.weather << "\n"
            << "Temperature: " << live.temperature << "°C\n"
            << "Wind: " << live.wind_direction << " (" << live.wind_power << ")\n"
            << "---\n";
    }
    return out.str();
}

std::string format_forecast(const std::vector<Forecast>& forecasts)
{
    std::ostringstream out;
    for (const auto& fc : forecasts)
    {
        for (const auto& day : fc.casts)
        {
            out << "Date: " << day.date << "\n"
                << "Day: " << day.day_weather << " " << day.day_temp << "°C " << day.day_wind
                << " (" << day.day_power << ")\n"
                << "Night: " << day.night_weather << " " << day.night_temp << "°C "
                << day.night_wind << " (" << day.night_power << ")\n"
                << "---\n";
        }
    }
    std::string text = out.str();
    // A city with no casts produces no lines either.
    if (text.empty())
        return "No forecast data available.";
    return text;
}

Json conditions_to_json(const std::string& location, const LiveConditions& live)
{
    return Json{{"location", location},
                {"province", live.province},
                {"city", live.city},
                {"weather", live.weather},
                {"tempC", temperature_value(live.temperature)},
                {"humidity", live.humidity},
                {"windDirection", live.wind_direction},
                {"windPower", live.wind_power},
                {"reportTime", live.report_time}};
}

tools::Tool make_get_weather_tool(std::shared_ptr<WeatherSource> source)
{
    auto schema = Schema::object().required("location", Schema::string("City name or adcode"));
    tools::Tool tool(
        "get_weather", "Current weather conditions for a location", std::move(schema),
        [source](const tools::Arguments& args, const tools::ToolContext& ctx) -> Json
        {
            std::string location = require_text(args, "location");
            auto lives = source->live(location, ctx);
            if (lives.empty())
                throw ToolError(WeatherSource::kInvalidLocation,
                                "no weather data for location: " + location);
            return conditions_to_json(location, lives.front());
        });
    tool.set_title("Current weather").set_idempotent(true);
    return tool;
}

tools::Tool make_get_alerts_tool(std::shared_ptr<WeatherSource> source)
{
    auto schema = Schema::object().required("state", Schema::string("City code (adcode)"));
    tools::Tool tool("get_alerts", "Today's weather report for a city code", std::move(schema),
                     [source](const tools::Arguments& args, const tools::ToolContext& ctx) -> Json
                     {
                         std::string state = require_text(args, "state");
                         logging::debug("get_alerts state=" + state);
                         return format_live_report(source->live(state, ctx));
                     });
    tool.set_idempotent(true);
    return tool;
}

tools::Tool make_get_forecast_tool(std::shared_ptr<WeatherSource> source)
{
    auto schema = Schema::object().required("city", Schema::string("City code (adcode)"));
    tools::Tool tool("get_forecast", "Weather forecast for the next few days", std::move(schema),
                     [source](const tools::Arguments& args, const tools::ToolContext& ctx) -> Json
                     {
                         std::string city = require_text(args, "city");
                         logging::debug("get_forecast city=" + city);
                         return format_forecast(source->forecast(city, ctx));
                     });
    tool.set_idempotent(true);
    return tool;
}

void register_weather_tools(tools::ToolRegistry& registry, std::shared_ptr<WeatherSource> source)
{
    if (!source)
        throw Error("weather tools need a weather source");
    registry.register_tool(make_get_weather_tool(source));
    registry.register_tool(make_get_alerts_tool(source));
    registry.register_tool(make_get_forecast_tool(std::move(source)));
}

} // namespace weathermcp::weather
