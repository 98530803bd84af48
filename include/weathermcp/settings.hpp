#pragma once
#include "weathermcp/types.hpp"

#include <cstddef>
#include <string>

namespace weathermcp
{

struct Settings
{
    std::string transport{"http"};
    std::string host{"0.0.0.0"};
    int port{3000};
    int max_sessions{64};
    int tool_timeout_ms{10000};
    std::size_t max_message_bytes{1024 * 1024};
    std::size_t max_result_bytes{1024 * 1024};
    int worker_threads{8};
    std::string log_level{"INFO"};
    std::string log_file;
    std::string weather_api_base{"https://restapi.amap.com"};
    std::string weather_api_key;

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Overlay fields present in `j` onto this instance.
    void merge_json(const Json& j);

    /// Throws ConfigError naming the first out-of-range field.
    void validate() const;

    /// Settings without secrets, for startup logging.
    Json to_json() const;
};

} // namespace weathermcp
