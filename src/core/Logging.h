#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include <ostream>

namespace pattern_harness {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

// Process-wide leveled logger. Writes go to stderr so stdout stays reserved for reports.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel level) const { return static_cast<int>(level) <= static_cast<int>(level_.load()); }

    // Redirect output (tests); the stream must outlive the logger's use of it.
    void set_sink(std::ostream* sink);

    void log(LogLevel level, const std::string& msg);
    void error(const std::string& msg) { log(LogLevel::Error, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* prefix(LogLevel level);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::ostream* sink_ = nullptr;
    std::mutex mutex_;
};

// Parses error|warn|info|debug|trace (case-insensitive). Returns false on unknown names.
bool parse_log_level(const std::string& name, LogLevel& out);

}
