#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <atomic>

namespace iperf_discovery {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }

    // Console sink writes to stderr. Enabled by default.
    void set_console(bool enabled) { console_.store(enabled); }
    bool console() const { return console_.load(); }

    // Opens (truncating) the file sink. Returns false and keeps the previous sink on failure.
    bool open_file(const std::string& path);
    void close_file();

    void log(LogLevel level, const std::string& message);
    void error(const std::string& message) { log(LogLevel::Error, message); }
    void warn(const std::string& message) { log(LogLevel::Warn, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void trace(const std::string& message) { log(LogLevel::Trace, message); }

private:
    Logger() = default;
    static const char* prefix(LogLevel level);
    static std::string timestamp();

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::atomic<bool> console_{true};
    std::ofstream file_;
    std::mutex mutex_;
};

}
