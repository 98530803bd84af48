#include "weathermcp/exceptions.hpp"
#include "weathermcp/logging.hpp"
#include "weathermcp/util/json.hpp"
#include "weathermcp/weather/source.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>

namespace weathermcp::weather
{

namespace
{
constexpr const char* kWeatherInfoPath = "/v3/weather/weatherInfo";
constexpr const char* kUserAgent = "weather-app/1.0";

/// AMap returns strings, but empty fields come back as [] and a few numeric
/// fields have been seen as numbers.
std::string field(const Json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return "";
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number())
        return it->dump();
    return "";
}

/// Error class for a rejected request, from its infocode. Key and permission
/// problems are ours to fix; 2xxxx codes blame the query; the rest (quota,
/// throttling, engine faults) are the service's.
const char* rejection_code(const std::string& infocode)
{
    static const char* const kKeyProblems[] = {"10001", "10005", "10006", "10007", "10008",
                                               "10009", "10011", "10012", "10013"};
    if (infocode.empty())
        return WeatherSource::kInvalidLocation;
    for (const char* k : kKeyProblems)
        if (infocode == k)
            return WeatherSource::kNotConfigured;
    if (infocode.size() == 5 && infocode[0] == '2')
        return WeatherSource::kInvalidLocation;
    return WeatherSource::kUpstreamUnavailable;
}

void check_status(const Json& body)
{
    if (!body.is_object())
        throw ToolError(WeatherSource::kUpstreamInvalid, "weather service returned a non-object body");
    if (field(body, "status") != "1")
    {
        std::string info = field(body, "info");
        std::string code = field(body, "infocode");
        throw ToolError(rejection_code(code),
                        "weather service rejected the request: " +
                            (info.empty() ? std::string("unknown error") : info) +
                            (code.empty() ? "" : " (" + code + ")"));
    }
}

/// Split "https://host:port/prefix" into the client base and a path prefix.
std::pair<std::string, std::string> split_base(const std::string& base_url)
{
    auto scheme_end = base_url.find("://");
    auto path_start = base_url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos)
        return {base_url, ""};
    std::string prefix = base_url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/')
        prefix.pop_back();
    return {base_url.substr(0, path_start), prefix};
}
} // namespace

AmapWeatherSource::AmapWeatherSource(std::string base_url, std::string api_key,
                                     std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)), timeout_(timeout)
{
}

Json AmapWeatherSource::fetch(const std::string& city, const std::string& extensions,
                             const tools::ToolContext& ctx) const
{
    if (api_key_.empty())
        throw ToolError(kNotConfigured,
                        "weather API key is not configured (set WEATHERMCP_WEATHER_API_KEY)");

    auto [host, prefix] = split_base(base_url_);
    std::string path = prefix + kWeatherInfoPath;

    std::unique_ptr<httplib::Client> client;
    try
    {
        client = std::make_unique<httplib::Client>(host);
    }
    catch (const std::invalid_argument& e)
    {
        // Thrown for https when built without TLS support.
        throw ToolError(kNotConfigured, "unusable weather API base " + host + ": " + e.what());
    }
    if (!client->is_valid())
        throw ToolError(kNotConfigured, "unusable weather API base: " + host);

    if (ctx.cancelled())
        throw ToolError(kUpstreamUnavailable, "weather request cancelled before it was sent");
    auto budget = std::min(timeout_, ctx.remaining());
    if (budget.count() <= 0)
        throw ToolError(kUpstreamUnavailable, "no time left for the weather request");
    auto deadline = std::chrono::steady_clock::now() + budget;

    // Connecting and waiting for the response each get half the budget, so the
    // two together stay within it; the progress callback bounds the body.
    auto half = std::max(budget / 2, std::chrono::milliseconds(1));
    auto& cli = *client;
    cli.set_connection_timeout(half);
    cli.set_read_timeout(half);
    cli.set_write_timeout(half);
    cli.set_follow_location(true);

    httplib::Params params = {
        {"key", api_key_}, {"city", city}, {"output", "json"}, {"extensions", extensions}};
    httplib::Headers headers = {{"User-Agent", kUserAgent}, {"Accept", "application/json"}};

    logging::info("requesting " + host + path + " city=" + city + " extensions=" + extensions);
    auto res = cli.Get(path, params, headers,
                       [&ctx, deadline](uint64_t, uint64_t)
                       { return !ctx.cancelled() && std::chrono::steady_clock::now() < deadline; });
    if (!res)
    {
        if (res.error() == httplib::Error::Canceled)
            throw ToolError(kUpstreamUnavailable,
                            "weather request abandoned: time budget exhausted");
        throw ToolError(kUpstreamUnavailable, "failed to reach weather service at " + host + ": " +
                                                  httplib::to_string(res.error()));
    }

    logging::debug("weather service answered HTTP " + std::to_string(res->status) + " (" +
                   std::to_string(res->body.size()) + " bytes)");
    if (res->status != 200)
        throw ToolError(kUpstreamUnavailable,
                        "weather service returned HTTP " + std::to_string(res->status));

    try
    {
        return util::json::parse(res->body);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw ToolError(kUpstreamInvalid,
                        std::string("failed to parse weather service response: ") + e.what());
    }
}

std::vector<LiveConditions> AmapWeatherSource::live(const std::string& city,
                                                    const tools::ToolContext& ctx)
{
    return parse_live(fetch(city, "base", ctx));
}

std::vector<Forecast> AmapWeatherSource::forecast(const std::string& city,
                                                  const tools::ToolContext& ctx)
{
    return parse_forecast(fetch(city, "all", ctx));
}

std::vector<LiveConditions> AmapWeatherSource::parse_live(const Json& body)
{
    check_status(body);

    std::vector<LiveConditions> out;
    auto lives = body.find("lives");
    if (lives == body.end() || lives->is_null())
        return out;
    if (!lives->is_array())
        throw ToolError(kUpstreamInvalid, "weather service field 'lives' is not an array");

    for (const auto& item : *lives)
    {
        if (!item.is_object())
            continue;
        LiveConditions live;
        live.province = field(item, "province");
        live.city = field(item, "city");
        live.adcode = field(item, "adcode");
        live.weather = field(item, "weather");
        live.temperature = field(item, "temperature");
        live.wind_direction = field(item, "winddirection");
        live.wind_power = field(item, "windpower");
        live.humidity = field(item, "humidity");
        live.report_time = field(item, "reporttime");
        out.push_back(std::move(live));
    }
    return out;
}

std::vector<Forecast> AmapWeatherSource::parse_forecast(const Json& body)
{
    check_status(body);

    std::vector<Forecast> out;
    auto forecasts = body.find("forecasts");
    if (forecasts == body.end() || forecasts->is_null())
        return out;
    if (!forecasts->is_array())
        throw ToolError(kUpstreamInvalid, "weather service field 'forecasts' is not an array");

    for (const auto& item : *forecasts)
    {
        if (!item.is_object())
            continue;
        Forecast fc;
        fc.city = field(item, "city");
        auto casts = item.find("casts");
        if (casts != item.end() && casts->is_array())
        {
            for (const auto& c : *casts)
            {
                if (!c.is_object())
                    continue;
                DayForecast day;
                day.date = field(c, "date");
                day.day_weather = field(c, "dayweather");
                day.night_weather = field(c, "nightweather");
                day.day_temp = field(c, "daytemp");
                day.night_temp = field(c, "nighttemp");
                day.day_wind = field(c, "daywind");
                day.night_wind = field(c, "nightwind");
                day.day_power = field(c, "daypower");
                day.night_power = field(c, "nightpower");
                fc.casts.push_back(std::move(day));
            }
        }
        out.push_back(std::move(fc));
    }
    return out;
}

} // namespace weathermcp::weather
