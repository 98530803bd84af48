#include "weathermcp/exceptions.hpp"
#include "weathermcp/logging.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

int main()
{
    using namespace weathermcp;
    using namespace weathermcp::logging;

    auto& logger = Logger::instance();
    std::vector<std::pair<Level, std::string>> lines;
    logger.set_sink([&](Level level, const std::string& msg) { lines.emplace_back(level, msg); });

    // Level parsing
    {
        assert(level_from_string("debug") == Level::Debug);
        assert(level_from_string("INFO") == Level::Info);
        assert(level_from_string("Warning") == Level::Warn);
        assert(level_from_string("error") == Level::Error);
        assert(to_string(Level::Warn) == "WARN");

        bool threw = false;
        try
        {
            level_from_string("verbose");
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] level parsing\n";
    }

    // Threshold filtering
    {
        logger.set_level(Level::Warn);
        debug("d");
        info("i");
        warn("w");
        error("e");
        assert(lines.size() == 2);
        assert(lines[0].first == Level::Warn && lines[0].second == "w");
        assert(lines[1].first == Level::Error);
        assert(!logger.enabled(Level::Info));
        assert(logger.enabled(Level::Error));

        lines.clear();
        logger.set_level(Level::Debug);
        debug("d");
        assert(lines.size() == 1);
        std::cout << "[PASS] threshold\n";
    }

    // File output
    {
        logger.set_sink(nullptr);
        const std::string path = "weathermcp_logging_test.log";
        std::remove(path.c_str());
        logger.set_level(Level::Info);
        logger.set_file(path);
        info("written to file");
        logger.set_file("");

        std::ifstream in(path);
        std::string line;
        std::getline(in, line);
        assert(line.find("[INFO] [weathermcp] written to file") != std::string::npos);
        std::remove(path.c_str());

        bool threw = false;
        try
        {
            logger.set_file("/nonexistent-dir/weathermcp.log");
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] file output\n";
    }

    // Daily rotation
    {
        const std::string path = "weathermcp_rotation_test.log";
        const std::string archived = path + ".2024-10-04";
        std::remove(path.c_str());
        std::remove(archived.c_str());

        auto when = std::chrono::system_clock::from_time_t(86400LL * 20000 + 3600 * 23);
        logger.set_clock([&when] { return when; });
        logger.set_file(path);
        info("late on the first day");
        when += std::chrono::hours(2);
        info("early on the second day");
        info("still the second day");
        logger.set_file("");
        logger.set_clock(nullptr);

        auto read_lines = [](const std::string& p)
        {
            std::vector<std::string> out;
            std::ifstream in(p);
            for (std::string l; std::getline(in, l);)
                out.push_back(l);
            return out;
        };
        auto old_lines = read_lines(archived);
        assert(old_lines.size() == 1);
        assert(old_lines[0].rfind("2024-10-04T23:00:00Z", 0) == 0);
        assert(old_lines[0].find("late on the first day") != std::string::npos);

        auto new_lines = read_lines(path);
        assert(new_lines.size() == 2);
        assert(new_lines[0].rfind("2024-10-05T01:00:00Z", 0) == 0);
        assert(new_lines[1].find("still the second day") != std::string::npos);

        std::remove(path.c_str());
        std::remove(archived.c_str());
        std::cout << "[PASS] daily rotation\n";
    }

    return 0;
}
