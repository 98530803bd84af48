#include "weathermcp/exceptions.hpp"
#include "weathermcp/logging.hpp"
#include "weathermcp/server/dispatcher.hpp"
#include "weathermcp/server/http_server.hpp"
#include "weathermcp/server/stdio_server.hpp"
#include "weathermcp/settings.hpp"
#include "weathermcp/tools/registry.hpp"
#include "weathermcp/util/json.hpp"
#include "weathermcp/version.hpp"
#include "weathermcp/weather/source.hpp"
#include "weathermcp/weather/tools.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace
{

constexpr int kExitConfig = 2;

std::atomic<bool> g_running{true};

void signal_handler(int)
{
    g_running = false;
}

int usage(int exit_code = 1)
{
    std::cerr << "weathermcp " << weathermcp::VERSION_MAJOR << "." << weathermcp::VERSION_MINOR
              << "." << weathermcp::VERSION_PATCH << "\n";
    std::cerr << "Usage:\n";
    std::cerr << "  weathermcp [options]\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --transport <http|stdio>   Transport to serve (default: http)\n";
    std::cerr << "  --host <addr>              HTTP bind address (default: 0.0.0.0)\n";
    std::cerr << "  --port <n>                 HTTP port (default: 3000, or $PORT)\n";
    std::cerr << "  --log-level <level>        DEBUG, INFO, WARN or ERROR\n";
    std::cerr << "  --config <file.json>       Settings file, applied over the environment\n";
    std::cerr << "  --version                  Print the version and exit\n";
    std::cerr << "  --help                     Show this help\n";
    std::cerr << "\n";
    std::cerr << "Environment: WEATHERMCP_TRANSPORT, WEATHERMCP_PORT, WEATHERMCP_WEATHER_API_KEY, ...\n";
    return exit_code;
}

std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                              const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] != flag)
            continue;
        if (i + 1 >= args.size())
            throw weathermcp::ConfigError("missing value for " + flag);
        std::string value = args[i + 1];
        args.erase(args.begin() + static_cast<long long>(i),
                   args.begin() + static_cast<long long>(i) + 2);
        return value;
    }
    return std::nullopt;
}

bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

int parse_port(const std::string& s)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos != s.size())
            throw weathermcp::ConfigError("invalid --port value: " + s);
        return v;
    }
    catch (const std::logic_error&)
    {
        throw weathermcp::ConfigError("invalid --port value: " + s);
    }
}

weathermcp::Json read_config_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw weathermcp::ConfigError("cannot open config file: " + path);
    std::stringstream buf;
    buf << in.rdbuf();
    try
    {
        return weathermcp::util::json::parse(buf.str());
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw weathermcp::ConfigError("invalid config file " + path + ": " + e.what());
    }
}

/// Environment first, then --config, then individual flags.
weathermcp::Settings load_settings(std::vector<std::string>& args)
{
    auto settings = weathermcp::Settings::from_env();

    if (auto path = consume_flag_value(args, "--config"))
        settings.merge_json(read_config_file(*path));

    weathermcp::Json overrides = weathermcp::Json::object();
    if (auto transport = consume_flag_value(args, "--transport"))
        overrides["transport"] = *transport;
    if (auto host = consume_flag_value(args, "--host"))
        overrides["host"] = *host;
    if (auto port = consume_flag_value(args, "--port"))
        overrides["port"] = parse_port(*port);
    if (auto level = consume_flag_value(args, "--log-level"))
        overrides["log_level"] = *level;
    settings.merge_json(overrides);

    if (!args.empty())
        throw weathermcp::ConfigError("unknown argument: " + args.front());

    settings.validate();
    return settings;
}

int serve(const weathermcp::Settings& settings)
{
    using namespace weathermcp;

    tools::ToolRegistry registry;
    auto source = std::make_shared<weather::AmapWeatherSource>(
        settings.weather_api_base, settings.weather_api_key,
        std::chrono::milliseconds(settings.tool_timeout_ms));
    weather::register_weather_tools(registry, source);
    registry.freeze();
    logging::info("registered " + std::to_string(registry.size()) + " tools");
    if (settings.weather_api_key.empty())
        logging::warn("WEATHERMCP_WEATHER_API_KEY is not set; weather tools will fail");

    server::Dispatcher::Options dopts;
    dopts.worker_threads = static_cast<size_t>(settings.worker_threads);
    dopts.queue_capacity = static_cast<size_t>(settings.max_sessions) * 2;
    dopts.max_result_bytes = settings.max_result_bytes;
    server::Dispatcher dispatcher(dopts);

    server::ServerInfo info;
    info.version = std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." +
                   std::to_string(VERSION_PATCH);
    info.instructions = "A simple weather forecaster";

    server::SessionConfig session_config;
    session_config.tool_timeout = std::chrono::milliseconds(settings.tool_timeout_ms);
    session_config.max_message_bytes = settings.max_message_bytes;

    if (settings.transport == "stdio")
    {
        session_config.label = "stdio";
        server::StdioServer stdio(registry, dispatcher, info, session_config);
        stdio.run();
        logging::info("stdin closed, shutting down");
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server::HttpServer::Options hopts;
    hopts.host = settings.host;
    hopts.port = settings.port;
    hopts.max_sessions = settings.max_sessions;
    server::HttpServer http(registry, dispatcher, info, session_config, hopts);
    if (!http.start())
    {
        logging::error("failed to bind " + settings.host + ":" + std::to_string(settings.port));
        return 1;
    }
    logging::info("listening on http://" + http.host() + ":" + std::to_string(http.port()) +
                  " (POST /mcp, GET /health)");

    while (g_running && http.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    logging::info("shutting down");
    http.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);
    if (consume_flag(args, "--version"))
    {
        std::cout << "weathermcp " << weathermcp::VERSION_MAJOR << "." << weathermcp::VERSION_MINOR
                  << "." << weathermcp::VERSION_PATCH << "\n";
        return 0;
    }

    weathermcp::Settings settings;
    try
    {
        settings = load_settings(args);
        auto& logger = weathermcp::logging::Logger::instance();
        logger.set_level(weathermcp::logging::level_from_string(settings.log_level));
        if (!settings.log_file.empty())
            logger.set_file(settings.log_file);
    }
    catch (const weathermcp::ConfigError& e)
    {
        std::cerr << "weathermcp: " << e.what() << "\n";
        return usage(kExitConfig);
    }

    weathermcp::logging::info("starting with settings " +
                              weathermcp::util::json::dump(settings.to_json()));

    try
    {
        return serve(settings);
    }
    catch (const std::exception& e)
    {
        weathermcp::logging::error(std::string("fatal: ") + e.what());
        return 1;
    }
}
