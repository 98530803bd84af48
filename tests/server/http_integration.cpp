/// @file http_integration.cpp
/// @brief HTTP transport: MCP endpoint, health probe and admission limits

#include "weathermcp/server/http_server.hpp"
#include "weathermcp/util/json.hpp"

#include <httplib.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace weathermcp;
using weathermcp::tools::Arguments;
using weathermcp::tools::Tool;
using weathermcp::tools::ToolContext;
using weathermcp::util::schema::Schema;
using namespace std::chrono_literals;

static std::string tools_call(const std::string& id, const std::string& tool, const Json& args)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"method", "tools/call"},
                {"params", {{"name", tool}, {"arguments", args}}}}
        .dump();
}

int main()
{
    tools::ToolRegistry reg;
    reg.register_tool(Tool("get_weather", "Current weather",
                           Schema::object().required("location", Schema::string()),
                           [](const Arguments&, const ToolContext&) -> Json
                           { return Json{{"tempC", 18}}; }));
    reg.register_tool(Tool("slow", "Holds a worker until cancelled", Schema::object(),
                           [](const Arguments&, const ToolContext& ctx) -> Json
                           {
                               while (!ctx.cancelled())
                                   std::this_thread::sleep_for(5ms);
                               return nullptr;
                           }));
    reg.freeze();

    server::Dispatcher dispatcher({4, 16, 1024 * 1024});
    server::ServerInfo info;
    server::SessionConfig config;
    config.tool_timeout = 1500ms;
    config.max_message_bytes = 1024;

    server::HttpServer::Options opts;
    opts.host = "127.0.0.1";
    opts.port = 0;
    opts.max_sessions = 2;
    server::HttpServer http(reg, dispatcher, info, config, opts);
    bool ok = http.start();
    assert(ok);
    assert(http.running());
    assert(http.port() > 0);
    const int port = http.port();

    // Basic call
    {
        httplib::Client cli("127.0.0.1", port);
        auto res = cli.Post("/mcp", tools_call("abc123", "get_weather", {{"location", "Paris"}}),
                            "application/json");
        assert(res);
        assert(res->status == 200);
        Json r = util::json::parse(res->body);
        assert(r["id"] == "abc123");
        assert(r["result"]["structuredContent"]["tempC"] == 18);

        // JSON-RPC level errors are still HTTP 200
        res = cli.Post("/mcp", tools_call("abc125", "unknown_tool", Json::object()),
                       "application/json");
        assert(res && res->status == 200);
        r = util::json::parse(res->body);
        assert(r["error"]["data"]["outcome"] == "tool_not_found");
        std::cout << "[PASS] POST /mcp\n";
    }

    // Notifications, undecodable bodies, wrong verb, oversize bodies
    {
        httplib::Client cli("127.0.0.1", port);
        auto res = cli.Post("/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                            "application/json");
        assert(res && res->status == 202);
        assert(res->body.empty());

        res = cli.Post("/mcp", "{not json", "application/json");
        assert(res && res->status == 400);

        res = cli.Get("/mcp");
        assert(res && res->status == 405);

        std::string big = tools_call("big", "get_weather", {{"location", std::string(4096, 'x')}});
        res = cli.Post("/mcp", big, "application/json");
        assert(res && res->status == 413);
        std::cout << "[PASS] transport status codes\n";
    }

    // Health stays fast while tool calls are in flight; beyond the cap -> 503
    {
        std::atomic<int> finished{0};
        std::vector<std::thread> callers;
        for (int i = 0; i < 2; ++i)
            callers.emplace_back(
                [port, i, &finished]()
                {
                    httplib::Client c("127.0.0.1", port);
                    c.set_read_timeout(10, 0);
                    auto res = c.Post("/mcp", tools_call("slow" + std::to_string(i), "slow",
                                                         Json::object()),
                                      "application/json");
                    assert(res && res->status == 200);
                    Json r = util::json::parse(res->body);
                    assert(r["result"]["_meta"]["outcome"] == "timeout");
                    ++finished;
                });

        // Wait until both slow sessions hold their slots
        auto wait_until = std::chrono::steady_clock::now() + 1000ms;
        while (http.active_sessions() < 2 && std::chrono::steady_clock::now() < wait_until)
            std::this_thread::sleep_for(5ms);
        assert(http.active_sessions() == 2);

        httplib::Client probe("127.0.0.1", port);
        auto start = std::chrono::steady_clock::now();
        auto res = probe.Get("/health");
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(res && res->status == 200);
        Json h = util::json::parse(res->body);
        assert(h["alive"] == true);
        assert(h["ready"] == true);
        assert(h["registrySize"] == 2);
        assert(elapsed < 500ms);

        res = probe.Post("/mcp", tools_call("over", "get_weather", {{"location", "Paris"}}),
                         "application/json");
        assert(res && res->status == 503);

        for (auto& t : callers)
            t.join();
        assert(finished == 2);
        assert(http.active_sessions() == 0);

        // Capacity is back
        res = probe.Post("/mcp", tools_call("again", "get_weather", {{"location", "Paris"}}),
                         "application/json");
        assert(res && res->status == 200);
        std::cout << "[PASS] health under load and session cap\n";
    }

    // Idle keep-alive clients beyond the pool size do not pin its threads
    {
        std::vector<std::unique_ptr<httplib::Client>> idle;
        for (int i = 0; i < opts.max_sessions + 4; ++i)
        {
            auto c = std::make_unique<httplib::Client>("127.0.0.1", port);
            c->set_keep_alive(true);
            auto res = c->Post("/mcp", tools_call("ka" + std::to_string(i), "get_weather",
                                                  {{"location", "Paris"}}),
                               "application/json");
            assert(res && res->status == 200);
            idle.push_back(std::move(c));
        }

        httplib::Client probe("127.0.0.1", port);
        auto start = std::chrono::steady_clock::now();
        auto res = probe.Get("/health");
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(res && res->status == 200);
        assert(elapsed < 500ms);
        std::cout << "[PASS] health with idle keep-alive clients\n";
    }

    http.stop();
    assert(!http.running());

    // An empty, unfrozen registry is alive but not ready
    {
        tools::ToolRegistry empty;
        server::HttpServer idle(empty, dispatcher, info, config, opts);
        assert(idle.start());
        httplib::Client cli("127.0.0.1", idle.port());
        auto res = cli.Get("/health");
        assert(res && res->status == 503);
        Json h = util::json::parse(res->body);
        assert(h["alive"] == true);
        assert(h["ready"] == false);
        idle.stop();
        std::cout << "[PASS] health readiness\n";
    }

    return 0;
}
