#include "logger.hpp"

#include "util.hpp"

namespace tsid {

bool parse_level(const std::string& s, LogLevel& out) {
    if (s == "debug") { out = LogLevel::DEBUG; return true; }
    if (s == "info") { out = LogLevel::INFO; return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::WARN; return true; }
    if (s == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

Logger::Logger(const std::string& path, LogLevel lvl) : level_(lvl) {
    open(path);
}

bool Logger::open(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu_);
    out_.open(path, std::ios::out | std::ios::app);
    return out_.is_open();
}

bool Logger::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return out_.is_open();
}

void Logger::set_level(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(mu_);
    level_ = lvl;
}

bool Logger::enabled(LogLevel lvl) const {
    std::lock_guard<std::mutex> lk(mu_);
    return out_.is_open() && static_cast<int>(lvl) >= static_cast<int>(level_);
}

void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg) { log(LogLevel::INFO, msg); }
void Logger::warn(const std::string& msg) { log(LogLevel::WARN, msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }

const char* Logger::level_str(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "?";
    }
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    std::lock_guard<std::mutex> lk(mu_);
    if (static_cast<int>(lvl) < static_cast<int>(level_)) return;
    if (!out_.is_open()) return;
    out_ << format_utc(wall_ms()) << " [" << level_str(lvl) << "] " << msg << "\n";
    out_.flush();
}

} // namespace tsid
