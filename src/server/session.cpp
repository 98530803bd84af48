#include "weathermcp/server/session.hpp"

#include "weathermcp/exceptions.hpp"
#include "weathermcp/logging.hpp"
#include "weathermcp/protocol/encoder.hpp"
#include "weathermcp/util/json_schema.hpp"

#include <algorithm>
#include <array>

namespace weathermcp::server
{

namespace
{
constexpr std::array<const char*, 3> kSupportedProtocolVersions = {"2025-06-18", "2025-03-26",
                                                                   "2024-11-05"};

std::string describe_id(const CorrelationId& id)
{
    if (id.is_string())
        return id.get<std::string>();
    return id.dump();
}

long long elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}
} // namespace

std::string to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Idle:
        return "idle";
    case SessionState::Reading:
        return "reading";
    case SessionState::Decoding:
        return "decoding";
    case SessionState::Validating:
        return "validating";
    case SessionState::Dispatching:
        return "dispatching";
    case SessionState::Encoding:
        return "encoding";
    case SessionState::Writing:
        return "writing";
    case SessionState::Closed:
        return "closed";
    }
    return "closed";
}

Session::Session(const tools::ToolRegistry& registry, Dispatcher& dispatcher, ServerInfo info,
                 SessionConfig config)
    : registry_(registry), dispatcher_(dispatcher), info_(std::move(info)),
      config_(std::move(config)), decoder_(config_.max_message_bytes)
{
}

void Session::transition(SessionState next)
{
    if (state_ == SessionState::Closed)
        return;
    state_ = next;
}

void Session::begin_read()
{
    transition(SessionState::Reading);
}

void Session::close()
{
    if (state_ != SessionState::Closed)
        logging::debug(config_.label + ": closed after " + std::to_string(messages_handled_) +
                       " message(s)");
    state_ = SessionState::Closed;
}

void Session::finish_write(bool delivered)
{
    if (state_ == SessionState::Closed)
        return;
    if (!delivered)
    {
        // Peer went away mid-response; nothing to report to anyone.
        logging::debug(config_.label + ": response dropped, connection closed by peer");
        close();
        return;
    }
    if (config_.one_shot)
        close();
    else
        transition(SessionState::Idle);
}

std::optional<std::string> Session::handle_message(const std::string& raw)
{
    if (closed())
        return std::nullopt;

    auto start = std::chrono::steady_clock::now();
    last_dropped_ = false;
    ++messages_handled_;
    transition(SessionState::Decoding);

    protocol::Request request;
    try
    {
        request = decoder_.decode(raw);
    }
    catch (const DecodeError& e)
    {
        if (e.id.is_null())
        {
            logging::warn(config_.label + ": dropping undecodable message: " + e.what());
            last_dropped_ = true;
            transition(config_.one_shot ? SessionState::Closed : SessionState::Idle);
            return std::nullopt;
        }
        std::string detail = "<invalid request>";
        auto response = respond(protocol::decode_failed(e), e.id, detail);
        logging::info(config_.label + ": " + detail + " (" + std::to_string(elapsed_ms(start)) +
                      "ms)");
        return response;
    }

    if (request.is_notification())
    {
        if (request.method.rfind("notifications/", 0) == 0)
        {
            logging::debug(config_.label + ": notification " + request.method);
        }
        else
        {
            logging::warn(config_.label + ": dropping '" + request.method +
                          "' request without correlation id");
            last_dropped_ = true;
        }
        transition(config_.one_shot ? SessionState::Closed : SessionState::Idle);
        return std::nullopt;
    }

    std::string detail = request.method;
    std::optional<std::string> response;
    try
    {
        response = route(request, detail);
    }
    catch (const std::exception& e)
    {
        logging::error(config_.label + ": internal error handling " + request.method + ": " +
                       e.what());
        response = respond(protocol::internal_error("Internal error"), request.id, detail);
    }

    logging::info(config_.label + ": " + detail + " id=" + describe_id(request.id) + " (" +
                  std::to_string(elapsed_ms(start)) + "ms)");
    return response;
}

std::optional<std::string> Session::route(const protocol::Request& request, std::string& detail)
{
    const auto& method = request.method;

    if (method == "initialize")
    {
        transition(SessionState::Encoding);
        auto out = protocol::encode_result(initialize_result(request.params), request.id);
        transition(SessionState::Writing);
        return out;
    }

    if (method == "ping")
    {
        transition(SessionState::Encoding);
        auto out = protocol::encode_result(Json::object(), request.id);
        transition(SessionState::Writing);
        return out;
    }

    if (method == "tools/list")
    {
        transition(SessionState::Encoding);
        auto out = protocol::encode_result(tools_list_result(), request.id);
        transition(SessionState::Writing);
        return out;
    }

    if (method == "tools/call")
        return respond(call_tool(request, detail), request.id, detail);

    return respond(protocol::method_not_found(method), request.id, detail);
}

protocol::Outcome Session::call_tool(const protocol::Request& request, std::string& detail)
{
    protocol::Invocation invocation;
    try
    {
        invocation = decoder_.to_invocation(request);
    }
    catch (const DecodeError& e)
    {
        return protocol::decode_failed(e);
    }
    detail += " " + invocation.tool;

    transition(SessionState::Validating);
    const tools::Tool* tool = registry_.lookup(invocation.tool);
    if (!tool)
        return protocol::tool_not_found(invocation.tool);

    Json typed;
    try
    {
        typed = util::schema::validate(tool->input_schema(), invocation.arguments);
    }
    catch (const ValidationError& e)
    {
        return protocol::validation_failed(e.violations);
    }

    transition(SessionState::Dispatching);
    return dispatcher_.dispatch(*tool, tools::Arguments(std::move(typed)), config_.tool_timeout);
}

std::string Session::respond(const protocol::Outcome& outcome, const CorrelationId& id,
                             std::string& detail)
{
    transition(SessionState::Encoding);
    std::string out = protocol::encode(outcome, id);
    detail += " -> " + protocol::outcome_name(outcome);
    transition(SessionState::Writing);
    return out;
}

Json Session::initialize_result(const Json& params) const
{
    std::string version = kSupportedProtocolVersions.front();
    auto requested = params.find("protocolVersion");
    if (requested != params.end() && requested->is_string())
    {
        auto v = requested->get<std::string>();
        auto it = std::find(kSupportedProtocolVersions.begin(), kSupportedProtocolVersions.end(), v);
        if (it != kSupportedProtocolVersions.end())
            version = v;
    }

    Json result = {
        {"protocolVersion", version},
        {"capabilities", Json{{"tools", Json{{"listChanged", false}}}}},
        {"serverInfo", Json{{"name", info_.name}, {"version", info_.version}}},
    };
    if (info_.instructions)
        result["instructions"] = *info_.instructions;
    return result;
}

Json Session::tools_list_result() const
{
    Json tools_array = Json::array();
    for (const auto& name : registry_.list_names())
        if (const tools::Tool* tool = registry_.lookup(name))
            tools_array.push_back(tool->to_listing());
    return Json{{"tools", tools_array}};
}

} // namespace weathermcp::server
