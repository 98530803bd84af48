#include "weathermcp/server/stdio_server.hpp"

#include "weathermcp/logging.hpp"

#include <string>

namespace weathermcp::server
{

namespace
{
enum class LineStatus
{
    Line,
    Eof
};

/// Read up to '\n'. Keeps at most `limit` characters; anything beyond is
/// consumed and discarded so an oversized line still ends where it should.
LineStatus read_line_bounded(std::istream& in, size_t limit, std::string& line)
{
    line.clear();
    char c = 0;
    bool got_any = false;
    while (in.get(c))
    {
        got_any = true;
        if (c == '\n')
            return LineStatus::Line;
        if (line.size() < limit)
            line.push_back(c);
    }
    return got_any ? LineStatus::Line : LineStatus::Eof;
}
} // namespace

StdioServer::StdioServer(const tools::ToolRegistry& registry, Dispatcher& dispatcher,
                         ServerInfo info, SessionConfig config, std::istream& in,
                         std::ostream& out)
    : registry_(registry), dispatcher_(dispatcher), info_(std::move(info)),
      config_(std::move(config)), in_(in), out_(out)
{
    config_.one_shot = false;
}

StdioServer::~StdioServer()
{
    stop();
}

void StdioServer::run_loop()
{
    Session session(registry_, dispatcher_, info_, config_);
    // One byte past the limit is enough for the decoder to reject the line.
    const size_t limit = config_.max_message_bytes + 1;
    std::string line;

    while (running_ && !stop_requested_)
    {
        session.begin_read();
        if (read_line_bounded(in_, limit, line) == LineStatus::Eof)
            break;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        auto response = session.handle_message(line);
        messages_handled_ = session.messages_handled();
        if (!response)
            continue;

        out_ << *response << '\n';
        out_.flush();
        session.finish_write(out_.good());
        if (session.closed())
            break;
    }

    session.close();
    running_ = false;
}

bool StdioServer::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    logging::info("serving MCP over stdio");
    run_loop();

    return true;
}

bool StdioServer::start_async()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;

    thread_ = std::thread([this]() { run_loop(); });

    return true;
}

void StdioServer::stop()
{
    stop_requested_ = true;

    // If running in background thread, join it
    if (thread_.joinable())
        thread_.join();

    running_ = false;
}

} // namespace weathermcp::server
