#pragma once
#include "weathermcp/tools/tool.hpp"
#include "weathermcp/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace weathermcp::weather
{

/// Current conditions for one city, as reported by the source.
struct LiveConditions
{
    std::string province;
    std::string city;
    std::string adcode;
    std::string weather;
    std::string temperature;
    std::string wind_direction;
    std::string wind_power;
    std::string humidity;
    std::string report_time;
};

struct DayForecast
{
    std::string date;
    std::string day_weather;
    std::string night_weather;
    std::string day_temp;
    std::string night_temp;
    std::string day_wind;
    std::string night_wind;
    std::string day_power;
    std::string night_power;
};

struct Forecast
{
    std::string city;
    std::vector<DayForecast> casts;
};

/// Capability the weather tools are built on. Implementations throw
/// ToolError with one of the codes below; the tools pass them through.
///
/// `ctx` is the calling tool's context: implementations stay within
/// `ctx.remaining()` and stop early once `ctx.cancelled()` is set.
class WeatherSource
{
  public:
    static constexpr const char* kUpstreamUnavailable = "upstream_unavailable";
    static constexpr const char* kUpstreamInvalid = "upstream_invalid";
    static constexpr const char* kInvalidLocation = "invalid_location";
    static constexpr const char* kNotConfigured = "not_configured";

    virtual ~WeatherSource() = default;

    virtual std::vector<LiveConditions> live(const std::string& city,
                                             const tools::ToolContext& ctx) = 0;
    virtual std::vector<Forecast> forecast(const std::string& city,
                                           const tools::ToolContext& ctx) = 0;
};

/// AMap (restapi.amap.com) weather information API.
///
/// City is an adcode or city name. One HTTP GET per call; the client holds
/// only configuration, so concurrent calls are safe. `timeout` caps a single
/// call; the caller's remaining budget caps it further.
class AmapWeatherSource : public WeatherSource
{
  public:
    AmapWeatherSource(std::string base_url, std::string api_key,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));

    std::vector<LiveConditions> live(const std::string& city,
                                     const tools::ToolContext& ctx) override;
    std::vector<Forecast> forecast(const std::string& city,
                                   const tools::ToolContext& ctx) override;

    /// Decode a `extensions=base` response body. Throws ToolError.
    static std::vector<LiveConditions> parse_live(const Json& body);
    /// Decode a `extensions=all` response body. Throws ToolError.
    static std::vector<Forecast> parse_forecast(const Json& body);

  private:
    Json fetch(const std::string& city, const std::string& extensions,
               const tools::ToolContext& ctx) const;

    std::string base_url_;
    std::string api_key_;
    std::chrono::milliseconds timeout_;
};

} // namespace weathermcp::weather
