#include "weathermcp/settings.hpp"

#include "weathermcp/exceptions.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace weathermcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static long long getenv_int(const char* key, long long defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        size_t pos = 0;
        long long parsed = std::stoll(v, &pos, 10);
        if (pos != std::string(v).size())
            throw ConfigError(std::string(key) + " is not an integer: " + v);
        return parsed;
    }
    catch (const std::logic_error&)
    {
        throw ConfigError(std::string(key) + " is not an integer: " + v);
    }
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

static std::size_t to_size(long long v, const char* field)
{
    if (v < 0)
        throw ConfigError(std::string(field) + " must not be negative");
    return static_cast<std::size_t>(v);
}

// Integers only: booleans, floats and strings are rejected, and the value
// must fit the field before it is narrowed.
static long long json_int(const Json& j, const char* field, long long lo, long long hi)
{
    const Json& v = j.at(field);
    if (v.is_boolean() || !v.is_number_integer())
        throw ConfigError(std::string(field) + " must be an integer, got " + v.dump());
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<long long>::max()))
        throw ConfigError(std::string(field) + " out of range: " + v.dump());
    long long n = v.get<long long>();
    if (n < lo || n > hi)
        throw ConfigError(std::string(field) + " out of range: " + v.dump());
    return n;
}

static int json_int(const Json& j, const char* field)
{
    return static_cast<int>(json_int(j, field, std::numeric_limits<int>::min(),
                                     std::numeric_limits<int>::max()));
}

static std::size_t json_size(const Json& j, const char* field)
{
    return to_size(json_int(j, field, std::numeric_limits<long long>::min(),
                            std::numeric_limits<long long>::max()),
                   field);
}

Settings Settings::from_env()
{
    Settings s;
    s.transport = lower(getenv_str("WEATHERMCP_TRANSPORT", s.transport));
    s.host = getenv_str("WEATHERMCP_HOST", s.host);
    // PORT is what container platforms inject; the prefixed variable wins.
    long long port = getenv_int("PORT", s.port);
    port = getenv_int("WEATHERMCP_PORT", port);
    s.port = static_cast<int>(std::clamp<long long>(port, -1, 70000));
    s.max_sessions = static_cast<int>(
        std::clamp<long long>(getenv_int("WEATHERMCP_MAX_SESSIONS", s.max_sessions), -1, 1 << 20));
    s.tool_timeout_ms = static_cast<int>(std::clamp<long long>(
        getenv_int("WEATHERMCP_TOOL_TIMEOUT_MS", s.tool_timeout_ms), -1, 1LL << 30));
    s.max_message_bytes = to_size(
        getenv_int("WEATHERMCP_MAX_MESSAGE_BYTES", static_cast<long long>(s.max_message_bytes)),
        "WEATHERMCP_MAX_MESSAGE_BYTES");
    s.max_result_bytes = to_size(
        getenv_int("WEATHERMCP_MAX_RESULT_BYTES", static_cast<long long>(s.max_result_bytes)),
        "WEATHERMCP_MAX_RESULT_BYTES");
    s.worker_threads = static_cast<int>(std::clamp<long long>(
        getenv_int("WEATHERMCP_WORKER_THREADS", s.worker_threads), -1, 1 << 20));
    s.log_level = upper(getenv_str("WEATHERMCP_LOG_LEVEL", s.log_level));
    s.log_file = getenv_str("WEATHERMCP_LOG_FILE", s.log_file);
    s.weather_api_base = getenv_str("WEATHERMCP_WEATHER_API_BASE", s.weather_api_base);
    s.weather_api_key = getenv_str("WEATHERMCP_WEATHER_API_KEY", s.weather_api_key);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    s.merge_json(j);
    return s;
}

void Settings::merge_json(const Json& j)
{
    if (!j.is_object())
        throw ConfigError("configuration must be a JSON object");
    try
    {
        if (j.contains("transport"))
            transport = lower(j.at("transport").get<std::string>());
        if (j.contains("host"))
            host = j.at("host").get<std::string>();
        if (j.contains("port"))
            port = json_int(j, "port");
        if (j.contains("max_sessions"))
            max_sessions = json_int(j, "max_sessions");
        if (j.contains("tool_timeout_ms"))
            tool_timeout_ms = json_int(j, "tool_timeout_ms");
        if (j.contains("max_message_bytes"))
            max_message_bytes = json_size(j, "max_message_bytes");
        if (j.contains("max_result_bytes"))
            max_result_bytes = json_size(j, "max_result_bytes");
        if (j.contains("worker_threads"))
            worker_threads = json_int(j, "worker_threads");
        if (j.contains("log_level"))
            log_level = upper(j.at("log_level").get<std::string>());
        if (j.contains("log_file"))
            log_file = j.at("log_file").get<std::string>();
        if (j.contains("weather_api_base"))
            weather_api_base = j.at("weather_api_base").get<std::string>();
        if (j.contains("weather_api_key"))
            weather_api_key = j.at("weather_api_key").get<std::string>();
    }
    catch (const nlohmann::json::exception& e)
    {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
}

void Settings::validate() const
{
    if (transport != "http" && transport != "stdio")
        throw ConfigError("transport must be 'http' or 'stdio', got '" + transport + "'");
    if (host.empty())
        throw ConfigError("host must not be empty");
    if (port < 1 || port > 65535)
        throw ConfigError("port out of range (1-65535): " + std::to_string(port));
    if (max_sessions < 1 || max_sessions > 4096)
        throw ConfigError("max_sessions out of range (1-4096): " + std::to_string(max_sessions));
    if (tool_timeout_ms < 1 || tool_timeout_ms > 600000)
        throw ConfigError("tool_timeout_ms out of range (1-600000): " +
                          std::to_string(tool_timeout_ms));
    constexpr std::size_t kMinBytes = 64;
    constexpr std::size_t kMaxBytes = 64 * 1024 * 1024;
    if (max_message_bytes < kMinBytes || max_message_bytes > kMaxBytes)
        throw ConfigError("max_message_bytes out of range (64-67108864): " +
                          std::to_string(max_message_bytes));
    if (max_result_bytes < kMinBytes || max_result_bytes > kMaxBytes)
        throw ConfigError("max_result_bytes out of range (64-67108864): " +
                          std::to_string(max_result_bytes));
    if (worker_threads < 1 || worker_threads > 1024)
        throw ConfigError("worker_threads out of range (1-1024): " +
                          std::to_string(worker_threads));
    if (log_level != "DEBUG" && log_level != "INFO" && log_level != "WARN" &&
        log_level != "ERROR")
        throw ConfigError("log_level must be DEBUG, INFO, WARN or ERROR, got '" + log_level + "'");
    if (weather_api_base.rfind("http://", 0) != 0 && weather_api_base.rfind("https://", 0) != 0)
        throw ConfigError("weather_api_base must be an http(s) URL: " + weather_api_base);
}

Json Settings::to_json() const
{
    return Json{{"transport", transport},
                {"host", host},
                {"port", port},
                {"max_sessions", max_sessions},
                {"tool_timeout_ms", tool_timeout_ms},
                {"max_message_bytes", max_message_bytes},
                {"max_result_bytes", max_result_bytes},
                {"worker_threads", worker_threads},
                {"log_level", log_level},
                {"log_file", log_file},
                {"weather_api_base", weather_api_base},
                {"weather_api_key_set", !weather_api_key.empty()}};
}

} // namespace weathermcp
