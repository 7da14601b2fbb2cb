#include "mcphost/log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mcphost {

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
        sink_(level, message);
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::cerr << '[' << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
              << std::setw(3) << std::setfill('0') << ms << std::setfill(' ')
              << "] [" << log_level_to_string(level) << "] " << message << '\n';
}

} // namespace mcphost
