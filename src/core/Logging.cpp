#include "Logging.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace iperf_discovery {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

bool Logger::open_file(const std::string& path) {
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if(!f) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    file_ = std::move(f);
    return true;
}

void Logger::close_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if(file_.is_open()) file_.close();
}

const char* Logger::prefix(LogLevel level) {
    switch(level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARNING";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "INFO";
}

// 2025-04-17 10:02:03,117
std::string Logger::timestamp() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto t = clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

void Logger::log(LogLevel level, const std::string& message) {
    if(static_cast<int>(level) > static_cast<int>(level_.load())) return;
    std::string line = timestamp() + " [" + prefix(level) + "] " + message;
    std::lock_guard<std::mutex> lock(mutex_);
    if(file_.is_open()) { file_ << line << '\n'; file_.flush(); }
    if(console_.load()) std::cerr << line << '\n';
}

}
