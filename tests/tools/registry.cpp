#include "weathermcp/exceptions.hpp"
#include "weathermcp/tools/registry.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

using namespace weathermcp;
using weathermcp::tools::Arguments;
using weathermcp::tools::Tool;
using weathermcp::tools::ToolContext;
using weathermcp::tools::ToolRegistry;
using weathermcp::util::schema::Schema;

static Tool make_tool(const std::string& name, int answer)
{
    return Tool(name, "test tool", Schema::object(),
                [answer](const Arguments&, const ToolContext&) -> Json { return answer; });
}

int main()
{
    // Register and look up
    {
        ToolRegistry reg;
        reg.register_tool(make_tool("b", 2));
        reg.register_tool(make_tool("a", 1));
        assert(reg.size() == 2);
        assert(reg.list_names() == (std::vector<std::string>{"b", "a"}));

        const Tool* a = reg.lookup("a");
        assert(a != nullptr);
        assert(a->invoke(Arguments(), ToolContext()) == 1);
        assert(reg.lookup("missing") == nullptr);
        assert(&reg.get("b") == reg.lookup("b"));
        std::cout << "[PASS] register/lookup\n";
    }

    // Duplicate names are refused and the first entry kept
    {
        ToolRegistry reg;
        reg.register_tool(make_tool("dup", 1));
        bool threw = false;
        try
        {
            reg.register_tool(make_tool("dup", 2));
        }
        catch (const DuplicateNameError&)
        {
            threw = true;
        }
        assert(threw);
        assert(reg.size() == 1);
        assert(reg.get("dup").invoke(Arguments(), ToolContext()) == 1);
        std::cout << "[PASS] duplicate rejected\n";
    }

    // Empty names and missing handlers are refused
    {
        ToolRegistry reg;
        bool threw = false;
        try
        {
            reg.register_tool(make_tool("", 1));
        }
        catch (const Error&)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            reg.register_tool(Tool("nohandler", "", Schema::object(), nullptr));
        }
        catch (const Error&)
        {
            threw = true;
        }
        assert(threw);
        assert(reg.size() == 0);
        std::cout << "[PASS] invalid tools rejected\n";
    }

    // get() on an unknown name
    {
        ToolRegistry reg;
        bool threw = false;
        try
        {
            reg.get("nope");
        }
        catch (const ToolNotFoundError& e)
        {
            threw = true;
            assert(e.tool == "nope");
        }
        assert(threw);
        std::cout << "[PASS] get unknown\n";
    }

    // Frozen registry rejects registration, serves concurrent lookups
    {
        ToolRegistry reg;
        for (int i = 0; i < 16; ++i)
            reg.register_tool(make_tool("t" + std::to_string(i), i));
        reg.freeze();
        assert(reg.frozen());

        bool threw = false;
        try
        {
            reg.register_tool(make_tool("late", 0));
        }
        catch (const Error&)
        {
            threw = true;
        }
        assert(threw);
        assert(reg.size() == 16);

        std::vector<std::thread> readers;
        std::vector<int> hits(8, 0);
        for (int r = 0; r < 8; ++r)
            readers.emplace_back(
                [&reg, &hits, r]()
                {
                    for (int n = 0; n < 1000; ++n)
                    {
                        const Tool* t = reg.lookup("t" + std::to_string(n % 16));
                        if (t && t->invoke(Arguments(), ToolContext()) == n % 16)
                            ++hits[r];
                    }
                });
        for (auto& t : readers)
            t.join();
        for (int h : hits)
            assert(h == 1000);
        std::cout << "[PASS] frozen concurrent lookup\n";
    }

    // tools/list entry
    {
        Tool t("get_weather", "Current weather", Schema::object().required("location", Schema::string()),
               [](const Arguments&, const ToolContext&) -> Json { return nullptr; });
        t.set_title("Weather").set_idempotent(true);
        Json entry = t.to_listing();
        assert(entry["name"] == "get_weather");
        assert(entry["title"] == "Weather");
        assert(entry["description"] == "Current weather");
        assert(entry["inputSchema"]["required"] == Json::array({"location"}));
        assert(entry["annotations"]["idempotentHint"] == true);
        std::cout << "[PASS] listing\n";
    }

    return 0;
}
