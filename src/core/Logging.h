#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include <initializer_list>
#include <utility>

namespace rack_scan {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

// Key/value context appended to a log line as " key=value".
using LogFields = std::initializer_list<std::pair<const char*, std::string>>;

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) <= static_cast<int>(level_.load()); }

    void log(LogLevel lvl, const std::string& msg);
    void log(LogLevel lvl, const std::string& msg, LogFields fields);

    void error(const std::string& m) { log(LogLevel::Error, m); }
    void warn(const std::string& m) { log(LogLevel::Warn, m); }
    void info(const std::string& m) { log(LogLevel::Info, m); }
    void debug(const std::string& m) { log(LogLevel::Debug, m); }
    void trace(const std::string& m) { log(LogLevel::Trace, m); }

    void error(const std::string& m, LogFields f) { log(LogLevel::Error, m, f); }
    void warn(const std::string& m, LogFields f) { log(LogLevel::Warn, m, f); }
    void info(const std::string& m, LogFields f) { log(LogLevel::Info, m, f); }
    void debug(const std::string& m, LogFields f) { log(LogLevel::Debug, m, f); }
private:
    Logger() = default;
    static const char* prefix(LogLevel lvl);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

// Parses "error|warn|info|debug|trace" (case-insensitive). Returns false on unknown names.
bool parse_log_level(const std::string& name, LogLevel& out);

}
