#include "weathermcp/logging.hpp"

#include "weathermcp/exceptions.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace weathermcp::logging
{

namespace
{
std::string format_utc(std::chrono::system_clock::time_point when, const char* fmt)
{
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm;
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

std::string to_iso8601(std::chrono::system_clock::time_point when)
{
    return format_utc(when, "%Y-%m-%dT%H:%M:%SZ");
}

std::string day_of(std::chrono::system_clock::time_point when)
{
    return format_utc(when, "%Y-%m-%d");
}
} // namespace

std::string to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

Level level_from_string(const std::string& s)
{
    std::string up = s;
    std::transform(up.begin(), up.end(), up.begin(), ::toupper);
    if (up == "DEBUG")
        return Level::Debug;
    if (up == "INFO")
        return Level::Info;
    if (up == "WARN" || up == "WARNING")
        return Level::Warn;
    if (up == "ERROR")
        return Level::Error;
    throw ConfigError("unknown log level: " + s);
}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(Level level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

Level Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_file(const std::string& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open())
        file_.close();
    file_path_.clear();
    file_day_.clear();
    if (path.empty())
        return;
    file_.open(path, std::ios::app);
    if (!file_.is_open())
        throw ConfigError("cannot open log file: " + path);
    file_path_ = path;
    file_day_ = day_of(now());
}

void Logger::set_clock(Clock clock)
{
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

std::chrono::system_clock::time_point Logger::now() const
{
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

// Caller holds mutex_. Failures go to stderr: there is no one to throw to.
void Logger::rotate(const std::string& day)
{
    file_.close();
    std::string archived = file_path_ + "." + file_day_;
    if (std::rename(file_path_.c_str(), archived.c_str()) != 0)
        std::cerr << "[weathermcp] log rotation to " << archived << " failed; continuing in "
                  << file_path_ << std::endl;
    file_day_ = day;
    file_.open(file_path_, std::ios::app);
    if (!file_.is_open())
        std::cerr << "[weathermcp] cannot reopen log file " << file_path_ << std::endl;
}

void Logger::set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

bool Logger::enabled(Level level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::log(Level level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_))
        return;

    if (sink_)
    {
        sink_(level, message);
        return;
    }

    auto when = now();
    std::string line = to_iso8601(when) + " [" + to_string(level) + "] [weathermcp] " + message;
    std::cerr << line << std::endl;
    if (file_path_.empty())
        return;
    std::string day = day_of(when);
    if (day != file_day_)
        rotate(day);
    if (file_.is_open())
        file_ << line << std::endl;
}

} // namespace weathermcp::logging
