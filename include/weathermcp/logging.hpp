#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace weathermcp::logging
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error
};

std::string to_string(Level level);

/// Parses DEBUG/INFO/WARN/ERROR (case-insensitive). Throws ConfigError otherwise.
Level level_from_string(const std::string& s);

/// Process-wide line logger. Writes to stderr (never stdout, which carries
/// the stdio transport) and optionally appends to a file.
///
/// The file rotates daily (UTC): the first line written on a new day moves
/// the current file to `<path>.<YYYY-MM-DD>` of the day it covers and starts
/// a fresh one.
class Logger
{
  public:
    using Sink = std::function<void(Level, const std::string&)>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static Logger& instance();

    void set_level(Level level);
    Level level() const;

    /// Also append every line to `path`. Throws ConfigError if it cannot be opened.
    void set_file(const std::string& path);

    /// Replace stderr output with a callback (tests). Pass nullptr to restore.
    void set_sink(Sink sink);

    /// Time source for timestamps and rotation (tests). Pass nullptr to restore.
    void set_clock(Clock clock);

    bool enabled(Level level) const;
    void log(Level level, const std::string& message);

  private:
    Logger() = default;

    std::chrono::system_clock::time_point now() const;
    void rotate(const std::string& day);

    mutable std::mutex mutex_;
    Level level_{Level::Info};
    std::ofstream file_;
    std::string file_path_;
    std::string file_day_;
    Sink sink_;
    Clock clock_;
};

inline void debug(const std::string& msg)
{
    Logger::instance().log(Level::Debug, msg);
}
inline void info(const std::string& msg)
{
    Logger::instance().log(Level::Info, msg);
}
inline void warn(const std::string& msg)
{
    Logger::instance().log(Level::Warn, msg);
}
inline void error(const std::string& msg)
{
    Logger::instance().log(Level::Error, msg);
}

} // namespace weathermcp::logging
