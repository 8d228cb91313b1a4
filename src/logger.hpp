#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace tsid {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// "debug" | "info" | "warn" | "error"; false on anything else.
bool parse_level(const std::string& s, LogLevel& out);

// Thread-safe file logger. Lines are "<utc> [LEVEL] msg"; nothing goes to
// stdout, and a logger that was never opened drops everything.
class Logger {
public:
    Logger() = default;
    explicit Logger(const std::string& path, LogLevel lvl = LogLevel::INFO);

    bool open(const std::string& path);
    bool is_open() const;
    void set_level(LogLevel lvl);
    bool enabled(LogLevel lvl) const;

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

private:
    void log(LogLevel lvl, const std::string& msg);
    static const char* level_str(LogLevel lvl);

    mutable std::mutex mu_;
    std::ofstream out_;
    LogLevel level_ = LogLevel::INFO;
};

} // namespace tsid
