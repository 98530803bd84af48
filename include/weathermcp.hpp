#pragma once

/// @file weathermcp.hpp
/// @brief Main header for weathermcp - includes commonly used components
///
/// Usage:
/// @code
/// #include <weathermcp.hpp>
///
/// int main() {
///     weathermcp::tools::ToolRegistry registry;
///     weathermcp::weather::register_weather_tools(
///         registry, std::make_shared<weathermcp::weather::AmapWeatherSource>(base, key));
///     registry.freeze();
///
///     weathermcp::server::Dispatcher dispatcher({});
///     weathermcp::server::HttpServer http(registry, dispatcher, {}, {}, {});
///     http.start();
/// }
/// @endcode

// Core types and exceptions
#include "weathermcp/types.hpp"
#include "weathermcp/exceptions.hpp"
#include "weathermcp/logging.hpp"
#include "weathermcp/settings.hpp"
#include "weathermcp/util/json.hpp"
#include "weathermcp/version.hpp"

// Tools
#include "weathermcp/tools/arguments.hpp"
#include "weathermcp/tools/registry.hpp"
#include "weathermcp/tools/tool.hpp"
#include "weathermcp/util/json_schema.hpp"

// Protocol
#include "weathermcp/protocol/encoder.hpp"
#include "weathermcp/protocol/message.hpp"
#include "weathermcp/protocol/outcome.hpp"

// Server
#include "weathermcp/server/dispatcher.hpp"
#include "weathermcp/server/health.hpp"
#include "weathermcp/server/http_server.hpp"
#include "weathermcp/server/session.hpp"
#include "weathermcp/server/stdio_server.hpp"

// Weather backend
#include "weathermcp/weather/source.hpp"
#include "weathermcp/weather/tools.hpp"
